#include <tracebag/cerr_logger.h>

#include <iostream>

namespace tracebag {
namespace tracing {

void CerrLogger::log_error(const LogFunc& write) { log(write); }

void CerrLogger::log_startup(const LogFunc& write) { log(write); }

void CerrLogger::log(const LogFunc& write) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_.clear();
  stream_.str("");
  write(stream_);
  stream_ << '\n';
  std::cerr << stream_.str();
}

}  // namespace tracing
}  // namespace tracebag
