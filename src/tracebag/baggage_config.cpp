#include <tracebag/baggage_config.h>
#include <tracebag/cerr_logger.h>
#include <tracebag/version.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>
#include <utility>

#include "environment.h"
#include "parse_util.h"

namespace tracebag {
namespace tracing {
namespace {

std::string env_prefix(environment::Variable variable) {
  std::string prefix;
  prefix += "Unable to parse ";
  append(prefix, environment::name(variable));
  prefix += " environment variable: ";
  return prefix;
}

// Overwrite the specified `destination` with the integer in the specified
// environment `variable`, if it's set. Return an error if it's set but isn't
// an unsigned integer.
Expected<void> size_from_env(std::size_t& destination,
                             environment::Variable variable) {
  const auto text = environment::lookup(variable);
  if (!text) {
    return {};
  }

  auto parsed = parse_uint64(strip(*text), 10);
  if (auto* error = parsed.if_error()) {
    return error->with_prefix(env_prefix(variable));
  }
  destination = std::size_t(*parsed);
  return {};
}

Expected<std::vector<BaggageField>> finalize_fields(
    const std::vector<std::string>& names, std::size_t max_fields) {
  std::vector<BaggageField> fields;
  for (const std::string& name : names) {
    if (strip(name).empty()) {
      return Error{Error::EMPTY_BAGGAGE_FIELD_NAME,
                   "Baggage field names must not be empty."};
    }

    BaggageField field{name};
    if (std::find(fields.begin(), fields.end(), field) != fields.end()) {
      std::string message;
      message += "The baggage field \"";
      message += name;
      message += "\" is configured more than once. Field names are not case "
                 "sensitive.";
      return Error{Error::DUPLICATE_BAGGAGE_FIELD, std::move(message)};
    }
    fields.push_back(std::move(field));
  }

  if (fields.size() > max_fields) {
    std::string message;
    message += "There are ";
    message += std::to_string(fields.size());
    message += " baggage fields configured, but max_fields is ";
    message += std::to_string(max_fields);
    message += '.';
    return Error{Error::TOO_MANY_BAGGAGE_FIELDS, std::move(message)};
  }

  return fields;
}

}  // namespace

Expected<FinalizedBaggageConfig> finalize_config(const BaggageConfig& config) {
  FinalizedBaggageConfig result;

  result.logger = config.logger;
  if (result.logger == nullptr) {
    result.logger = std::make_shared<CerrLogger>();
  }

  result.dynamic = config.dynamic;
  if (auto dynamic_env =
          environment::lookup(environment::TRACEBAG_BAGGAGE_DYNAMIC)) {
    result.dynamic = !falsy(*dynamic_env);
  }

  result.log_on_startup = config.log_on_startup;
  if (auto startup_env =
          environment::lookup(environment::TRACEBAG_STARTUP_LOGS)) {
    result.log_on_startup = !falsy(*startup_env);
  }

  result.max_fields = config.max_fields;
  auto max_fields_env =
      size_from_env(result.max_fields, environment::TRACEBAG_BAGGAGE_MAX_FIELDS);
  if (auto* error = max_fields_env.if_error()) {
    return std::move(*error);
  }
  if (result.max_fields < 1 || result.max_fields > 64) {
    std::string message;
    message += "max_fields must be between 1 and 64, but it is ";
    message += std::to_string(result.max_fields);
    message += '.';
    return Error{Error::MAX_FIELDS_OUT_OF_RANGE, std::move(message)};
  }

  result.update_attempts = config.update_attempts;
  auto attempts_env = size_from_env(
      result.update_attempts, environment::TRACEBAG_BAGGAGE_UPDATE_ATTEMPTS);
  if (auto* error = attempts_env.if_error()) {
    return std::move(*error);
  }
  if (result.update_attempts < 1) {
    return Error{Error::UPDATE_ATTEMPTS_OUT_OF_RANGE,
                 "update_attempts must be at least 1."};
  }

  std::vector<std::string> names = config.fields;
  if (auto fields_env =
          environment::lookup(environment::TRACEBAG_BAGGAGE_FIELDS)) {
    names.clear();
    for (const StringView item : parse_list(*fields_env)) {
      names.emplace_back(item);
    }
  }

  auto fields = finalize_fields(names, result.max_fields);
  if (auto* error = fields.if_error()) {
    return std::move(*error);
  }
  result.fields = std::move(*fields);

  return result;
}

std::string config_json(const FinalizedBaggageConfig& config) {
  auto fields = nlohmann::json::array();
  for (const BaggageField& field : config.fields) {
    fields.push_back(field.name());
  }

  // clang-format off
  const nlohmann::json result{
    {"version", tracebag_version},
    {"fields", std::move(fields)},
    {"dynamic", config.dynamic},
    {"max_fields", config.max_fields},
    {"update_attempts", config.update_attempts},
    {"environment_variables", environment::to_json()},
  };
  // clang-format on

  return result.dump();
}

}  // namespace tracing
}  // namespace tracebag
