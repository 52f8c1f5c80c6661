#pragma once

// This component provides a `struct`, `BaggageConfig`, used to configure a
// `BaggageFieldsFactory`, and a function, `finalize_config`, that validates a
// `BaggageConfig`, applies overrides from the environment, and produces a
// `FinalizedBaggageConfig`.
//
// Environment variables, when set, override the corresponding members of
// `BaggageConfig`:
//
// - `TRACEBAG_BAGGAGE_DYNAMIC` overrides `dynamic`. "0", "false" and "no" are
//   false, anything else is true.
// - `TRACEBAG_BAGGAGE_FIELDS` overrides `fields`: field names separated by
//   commas and/or whitespace.
// - `TRACEBAG_BAGGAGE_MAX_FIELDS` overrides `max_fields`.
// - `TRACEBAG_BAGGAGE_UPDATE_ATTEMPTS` overrides `update_attempts`.
// - `TRACEBAG_STARTUP_LOGS` overrides `log_on_startup`.

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "baggage_field.h"
#include "expected.h"
#include "optional.h"

namespace tracebag {
namespace tracing {

class Logger;

struct BaggageConfig {
  // Names of the fields present in every context, in order. Fields have no
  // value until updated.
  std::vector<std::string> fields;
  // Whether fields other than `fields` can be added at run time.
  bool dynamic = false;
  // Maximum number of fields, static and dynamic together, in one context.
  // Must be between 1 and 64.
  std::size_t max_fields = 64;
  // How many times an update is attempted when it keeps losing races with
  // concurrent updates to the same context. Must be at least 1.
  std::size_t update_attempts = 3;
  // If null, a `CerrLogger` is used.
  std::shared_ptr<Logger> logger = nullptr;
  bool log_on_startup = true;
};

class FinalizedBaggageConfig {
  friend Expected<FinalizedBaggageConfig> finalize_config(
      const BaggageConfig& config);
  FinalizedBaggageConfig() = default;

 public:
  std::vector<BaggageField> fields;
  bool dynamic;
  std::size_t max_fields;
  std::size_t update_attempts;
  std::shared_ptr<Logger> logger;
  bool log_on_startup;
};

Expected<FinalizedBaggageConfig> finalize_config(const BaggageConfig& config);

// Return the specified `config` as a JSON object, together with the library
// version and the relevant environment variables. This is what a factory
// logs at startup.
std::string config_json(const FinalizedBaggageConfig& config);

}  // namespace tracing
}  // namespace tracebag
