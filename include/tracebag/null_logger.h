#pragma once

// This component provides a class, `NullLogger`, that implements the `Logger`
// interface by discarding everything.

#include "logger.h"

namespace tracebag {
namespace tracing {

class NullLogger : public Logger {
 public:
  void log_error(const LogFunc&) override {}
  void log_startup(const LogFunc&) override {}

  void log_error(const Error&) override {}
  void log_error(StringView) override {}
};

}  // namespace tracing
}  // namespace tracebag
