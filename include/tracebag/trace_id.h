#pragma once

// This component provides a `struct`, `TraceID`, that identifies a trace. A
// trace ID is 128 bits: the lower 64 bits are `low`, and the upper 64 bits are
// `high`. 64-bit trace IDs have `high == 0`.

#include <cstdint>
#include <iosfwd>
#include <string>

namespace tracebag {
namespace tracing {

struct TraceID {
  std::uint64_t low;
  std::uint64_t high;

  TraceID();
  explicit TraceID(std::uint64_t low);
  TraceID(std::uint64_t low, std::uint64_t high);

  // Return the ID as 32 zero-padded lower-case hexadecimal digits.
  std::string hex_padded() const;
};

bool operator==(TraceID, TraceID);
bool operator!=(TraceID, TraceID);

std::ostream& operator<<(std::ostream&, TraceID);

}  // namespace tracing
}  // namespace tracebag
