#pragma once

// This component provides an alias, `StringView`, for `std::string_view`, and
// a few helpers for appending views to strings.

#include <string>
#include <string_view>

namespace tracebag {
namespace tracing {

using StringView = std::string_view;

// Append the specified `text` to the specified `destination`.
inline void append(std::string& destination, StringView text) {
  destination.append(text.data(), text.size());
}

// Assign the specified `text` to the specified `destination`.
inline void assign(std::string& destination, StringView text) {
  destination.assign(text.data(), text.size());
}

}  // namespace tracing
}  // namespace tracebag
