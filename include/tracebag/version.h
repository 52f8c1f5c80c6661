#pragma once

// This component provides the release version of this library.
// `tracebag_version` is included in the configuration that
// `BaggageFieldsFactory` logs at startup.

namespace tracebag {
namespace tracing {

extern const char* const tracebag_version;

}  // namespace tracing
}  // namespace tracebag
