#include <tracebag/trace_id.h>

#include <charconv>
#include <iterator>
#include <limits>
#include <ostream>

namespace tracebag {
namespace tracing {
namespace {

void append_hex_padded(std::string& destination, std::uint64_t value) {
  char buffer[std::numeric_limits<std::uint64_t>::digits / 4];
  const int base = 16;
  const auto result =
      std::to_chars(std::begin(buffer), std::end(buffer), value, base);
  // `buffer` is exactly large enough for any 64-bit value, so `to_chars`
  // cannot fail here.
  const auto length = std::size_t(result.ptr - buffer);
  destination.append(sizeof buffer - length, '0');
  destination.append(buffer, length);
}

}  // namespace

TraceID::TraceID() : TraceID(0) {}

TraceID::TraceID(std::uint64_t low) : TraceID(low, 0) {}

TraceID::TraceID(std::uint64_t low, std::uint64_t high)
    : low(low), high(high) {}

std::string TraceID::hex_padded() const {
  std::string result;
  result.reserve(32);
  append_hex_padded(result, high);
  append_hex_padded(result, low);
  return result;
}

bool operator==(TraceID left, TraceID right) {
  return left.low == right.low && left.high == right.high;
}

bool operator!=(TraceID left, TraceID right) { return !(left == right); }

std::ostream& operator<<(std::ostream& stream, TraceID trace_id) {
  return stream << trace_id.hex_padded();
}

}  // namespace tracing
}  // namespace tracebag
