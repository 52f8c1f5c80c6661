#pragma once

// This component provides a `struct`, `Error`, that contains an error code and
// a description of the error. The error codes are stable: they are never
// renumbered, and new codes are added at the end.
//
// `Error` is the error type of `Expected<T>`, defined in `expected.h`.

#include <iosfwd>
#include <string>

#include "string_view.h"

namespace tracebag {
namespace tracing {

struct Error {
  enum Code {
    OTHER = 1,
    INVALID_INTEGER = 2,
    OUT_OF_RANGE_INTEGER = 3,
    TOO_MANY_FILTERED_KEYS = 4,
    MAX_FIELDS_OUT_OF_RANGE = 5,
    UPDATE_ATTEMPTS_OUT_OF_RANGE = 6,
    DUPLICATE_BAGGAGE_FIELD = 7,
    TOO_MANY_BAGGAGE_FIELDS = 8,
    EMPTY_BAGGAGE_FIELD_NAME = 9,
    MALFORMED_BAGGAGE_HEADER = 10,
  };

  Code code;
  std::string message;

  std::string to_string() const;
  Error with_prefix(StringView) const;
};

std::ostream& operator<<(std::ostream&, const Error&);

}  // namespace tracing
}  // namespace tracebag
