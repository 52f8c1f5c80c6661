#pragma once

// This component provides parsing-related miscellanea used by configuration
// and by `BaggageField`.

#include <tracebag/expected.h>
#include <tracebag/string_view.h>

#include <cstdint>
#include <string>
#include <vector>

namespace tracebag {
namespace tracing {

// Remove leading and trailing whitespace (as determined by `std::isspace`) from
// the specified `input`.
StringView strip(StringView input);

// Return a non-negative integer parsed from the specified `input` with respect
// to the specified `base`, or return an `Error` if no such integer can be
// parsed. It is an error unless all of `input` is consumed by the parse.
// Leading and trailing whitespace are not ignored.
Expected<std::uint64_t> parse_uint64(StringView input, int base);

// Convert the specified `text` to lower case in-place.
void to_lower(std::string& text);

// Return whether the specified `text` is one of "0", "false" or "no", ignoring
// case and surrounding whitespace.
bool falsy(StringView text);

// List items are separated by an optional comma (",") and any amount of
// whitespace.
// Leading and trailing whitespace are ignored.
std::vector<StringView> parse_list(StringView input);

}  // namespace tracing
}  // namespace tracebag
