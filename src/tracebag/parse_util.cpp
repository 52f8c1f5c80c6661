#include "parse_util.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>

namespace tracebag {
namespace tracing {

StringView strip(StringView input) {
  const auto not_whitespace = [](unsigned char ch) {
    return !std::isspace(ch);
  };
  const auto begin = std::find_if(input.begin(), input.end(), not_whitespace);
  const auto end =
      std::find_if(input.rbegin(), std::make_reverse_iterator(begin),
                   not_whitespace)
          .base();

  return input.substr(std::size_t(begin - input.begin()),
                      std::size_t(end - begin));
}

Expected<std::uint64_t> parse_uint64(StringView input, int base) {
  std::uint64_t value;
  const char* const end = input.data() + input.size();
  const auto status = std::from_chars(input.data(), end, value, base);
  if (status.ec == std::errc::invalid_argument) {
    std::string message;
    message += "Is not a valid integer: \"";
    append(message, input);
    message += '\"';
    return Error{Error::INVALID_INTEGER, std::move(message)};
  } else if (status.ptr != end) {
    std::string message;
    message += "Integer has trailing characters in: \"";
    append(message, input);
    message += '\"';
    return Error{Error::INVALID_INTEGER, std::move(message)};
  } else if (status.ec == std::errc::result_out_of_range) {
    std::string message;
    message += "Integer is not within the range of 64-bit unsigned: ";
    append(message, input);
    return Error{Error::OUT_OF_RANGE_INTEGER, std::move(message)};
  }
  return value;
}

void to_lower(std::string& text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
}

bool falsy(StringView text) {
  std::string lower;
  assign(lower, strip(text));
  to_lower(lower);
  return lower == "0" || lower == "false" || lower == "no";
}

std::vector<StringView> parse_list(StringView input) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };

  input = strip(input);
  std::vector<StringView> items;
  if (input.empty()) {
    return items;
  }

  std::size_t current = 0;
  std::size_t begin_delim;
  do {
    std::size_t begin_item = current;
    while (begin_item < input.size() && is_space(input[begin_item])) {
      ++begin_item;
    }
    begin_delim = begin_item;
    while (begin_delim < input.size() && !is_space(input[begin_delim]) &&
           input[begin_delim] != ',') {
      ++begin_delim;
    }

    items.push_back(input.substr(begin_item, begin_delim - begin_item));

    std::size_t end_delim = begin_delim;
    while (end_delim < input.size() && is_space(input[end_delim])) {
      ++end_delim;
    }
    if (end_delim < input.size() && input[end_delim] == ',') {
      ++end_delim;
    }

    current = end_delim;
  } while (begin_delim != input.size());

  return items;
}

}  // namespace tracing
}  // namespace tracebag
