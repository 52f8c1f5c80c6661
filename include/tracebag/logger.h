#pragma once

// This component provides an interface, `Logger`, that allows for the
// customization of how the library logs diagnostic and startup messages.
//
// Logging is used only on degraded paths, for example when a baggage update
// gives up after losing too many races, or when a field would exceed the
// configured maximum. It never affects control flow.
//
// `log_error` and `log_startup` accept a function that writes the message to
// a `std::ostream`, so that no formatting happens unless the message is
// actually written. `log_error(const Error&)` and `log_error(StringView)`
// have default implementations in terms of `log_error(const LogFunc&)`.
//
// The default `Logger` is `CerrLogger`, defined in `cerr_logger.h`.

#include <functional>
#include <iosfwd>

#include "string_view.h"

namespace tracebag {
namespace tracing {

struct Error;

class Logger {
 public:
  using LogFunc = std::function<void(std::ostream&)>;

  virtual ~Logger() {}

  virtual void log_error(const LogFunc&) = 0;
  virtual void log_startup(const LogFunc&) = 0;

  virtual void log_error(const Error&);
  virtual void log_error(StringView);
};

}  // namespace tracing
}  // namespace tracebag
