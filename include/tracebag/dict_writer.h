#pragma once

// This component provides an interface, `DictWriter`, that represents a
// write-only key/value mapping of strings. It's used when injecting baggage
// into externalized formats: HTTP headers, gRPC metadata, etc.

#include "string_view.h"

namespace tracebag {
namespace tracing {

class DictWriter {
 public:
  virtual ~DictWriter() {}

  // Associate the specified `value` with the specified `key`. An
  // implementation may, but need not, overwrite any previous value at `key`.
  virtual void set(StringView key, StringView value) = 0;
};

}  // namespace tracing
}  // namespace tracebag
