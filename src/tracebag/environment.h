#pragma once

// This component provides a registry of the environment variables that
// `finalize_config` consults, and functions for looking them up.

#include <tracebag/optional.h>
#include <tracebag/string_view.h>

#include <nlohmann/json.hpp>

#include <string>

namespace tracebag {
namespace tracing {
namespace environment {

// Keep this sorted.  The values must correspond to offsets within
// `variable_names`.
enum Variable {
  TRACEBAG_BAGGAGE_DYNAMIC,
  TRACEBAG_BAGGAGE_FIELDS,
  TRACEBAG_BAGGAGE_MAX_FIELDS,
  TRACEBAG_BAGGAGE_UPDATE_ATTEMPTS,
  TRACEBAG_STARTUP_LOGS,
};

// Keep this sorted.  Offsets into this array are indicated by `Variable`
// values.
inline const char *const variable_names[] = {
    "TRACEBAG_BAGGAGE_DYNAMIC",
    "TRACEBAG_BAGGAGE_FIELDS",
    "TRACEBAG_BAGGAGE_MAX_FIELDS",
    "TRACEBAG_BAGGAGE_UPDATE_ATTEMPTS",
    "TRACEBAG_STARTUP_LOGS",
};

// Return the name of the specified environment `variable`.
StringView name(Variable variable);

// Return the value of the specified environment `variable`, or return
// `nullopt` if that variable is not set in the environment.
Optional<std::string> lookup(Variable variable);

// Return a JSON object of the variables that are set, by name.
nlohmann::json to_json();

}  // namespace environment
}  // namespace tracing
}  // namespace tracebag
