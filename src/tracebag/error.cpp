#include <tracebag/error.h>

#include <ostream>
#include <sstream>

namespace tracebag {
namespace tracing {

std::ostream& operator<<(std::ostream& stream, const Error& error) {
  return stream << "[tracebag error code " << int(error.code) << "] "
                << error.message;
}

std::string Error::to_string() const {
  std::ostringstream stream;
  stream << *this;
  return stream.str();
}

Error Error::with_prefix(StringView prefix) const {
  Error result{code, std::string(prefix)};
  result.message += message;
  return result;
}

}  // namespace tracing
}  // namespace tracebag
