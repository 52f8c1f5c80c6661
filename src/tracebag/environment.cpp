#include "environment.h"

#include <cstdlib>
#include <utility>

namespace tracebag {
namespace tracing {
namespace environment {
namespace {

Optional<std::string> get_env(const char *name) {
  if (const char *value = std::getenv(name)) {
    return value;
  }
  return nullopt;
}

}  // namespace

StringView name(Variable variable) { return variable_names[variable]; }

Optional<std::string> lookup(Variable variable) {
  return get_env(variable_names[variable]);
}

nlohmann::json to_json() {
  auto result = nlohmann::json::object({});

  for (const char *name : variable_names) {
    if (auto value = get_env(name)) {
      result[name] = std::move(*value);
    }
  }

  return result;
}

}  // namespace environment
}  // namespace tracing
}  // namespace tracebag
