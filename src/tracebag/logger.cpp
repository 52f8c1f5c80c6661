#include <tracebag/error.h>
#include <tracebag/logger.h>

#include <ostream>

namespace tracebag {
namespace tracing {

void Logger::log_error(const Error& error) {
  log_error([&](std::ostream& stream) { stream << error; });
}

void Logger::log_error(StringView message) {
  log_error([&](std::ostream& stream) { stream << message; });
}

}  // namespace tracing
}  // namespace tracebag
