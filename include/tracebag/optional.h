#pragma once

// This component provides an alias, `Optional`, for `std::optional`, and the
// corresponding `nullopt` constant. Library code and tests spell optional
// values through these names.

#include <optional>

namespace tracebag {
namespace tracing {

template <typename Value>
using Optional = std::optional<Value>;

inline constexpr auto nullopt = std::nullopt;

}  // namespace tracing
}  // namespace tracebag
