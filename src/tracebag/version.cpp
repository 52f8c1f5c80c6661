#include <tracebag/version.h>

namespace tracebag {
namespace tracing {

#define TRACEBAG_VERSION "v0.3.0"

const char* const tracebag_version = TRACEBAG_VERSION;

}  // namespace tracing
}  // namespace tracebag
