#include <tracebag/baggage_codec.h>
#include <tracebag/dict_reader.h>
#include <tracebag/dict_writer.h>

namespace tracebag {
namespace tracing {
namespace {

/// Whitespace in RFC 7230 section 3.2.3 definition
/// BDNF:
///  - OWS  = *(SP / HTAB)
///  - SP   = SPACE (0x20)
///  - HTAB = Horizontal tab (0x09)
constexpr bool is_whitespace(char c) { return c == 0x20 || c == 0x09; }

constexpr bool is_allowed_key_char(char c) {
  // clang-format off
  return (c >= 0x30 && c <= 0x39)   ///< [0-9]
      || (c >= 0x41 && c <= 0x5A)   ///< [A-Z]
      || (c >= 0x61 && c <= 0x7A)   ///< [a-z]
      || (c == 0x21)                ///< "!"
      || (c >= 0x23 && c <= 0x27)   ///< "#" / "$" / "%" / "&" / "'"
      || (c == 0x2A)                ///< "*"
      || (c == 0x2B)                ///< "+"
      || (c == 0x2D)                ///< "-"
      || (c == 0x2E)                ///< "."
      || (c == 0x5E)                ///< "^"
      || (c == 0x5F)                ///< "_"
      || (c == 0x60)                ///< "`"
      || (c == 0x7C)                ///< "|"
      || (c == 0x7E);               ///< "~"
  // clang-format on
}

constexpr bool is_allowed_value_char(char c) {
  // clang-format off
  return (c == 0x21)                ///< "!"
      || (c >= 0x23 && c <= 0x2B)   ///< "#" through "+"
      || (c >= 0x2D && c <= 0x3A)   ///< "-" / "." / "/" / [0-9] / ":"
      || (c >= 0x3C && c <= 0x5B)   ///< "<" through "[", including [A-Z]
      || (c >= 0x5D && c <= 0x7E);  ///< "]" through "~", including [a-z]
  // clang-format on
}

Error malformed(std::size_t position) {
  std::string message;
  message += "Malformed baggage header at position ";
  message += std::to_string(position);
  message += '.';
  return Error{Error::MALFORMED_BAGGAGE_HEADER, std::move(message)};
}

}  // namespace

W3CBaggageCodec::W3CBaggageCodec() : key_names_{"baggage"} {}

const std::vector<std::string>& W3CBaggageCodec::extract_key_names() const {
  return key_names_;
}

const std::vector<std::string>& W3CBaggageCodec::inject_key_names() const {
  return key_names_;
}

Expected<W3CBaggageCodec::Items> W3CBaggageCodec::parse(StringView input) {
  Items result;
  if (input.empty()) return result;

  enum class state : char {
    leading_spaces_key,
    key,
    trailing_spaces_key,
    leading_spaces_value,
    value,
    trailing_spaces_value,
    properties,
  } internal_state = state::leading_spaces_key;

  std::size_t beg = 0;
  std::size_t tmp_end = 0;
  StringView key;

  const auto consume_value = [&](std::size_t value_end) {
    result.emplace_back(std::string(key),
                        std::string(input.substr(beg, value_end - beg)));
  };

  const std::size_t end = input.size();
  for (std::size_t i = 0; i < end; ++i) {
    const char c = input[i];

    switch (internal_state) {
      case state::leading_spaces_key:
        if (is_whitespace(c)) break;
        if (!is_allowed_key_char(c)) return malformed(i);
        beg = i;
        internal_state = state::key;
        break;

      case state::key:
        if (c == '=') {
          key = input.substr(beg, i - beg);
          internal_state = state::leading_spaces_value;
        } else if (is_whitespace(c)) {
          tmp_end = i;
          internal_state = state::trailing_spaces_key;
        } else if (!is_allowed_key_char(c)) {
          return malformed(i);
        }
        break;

      case state::trailing_spaces_key:
        if (c == '=') {
          key = input.substr(beg, tmp_end - beg);
          internal_state = state::leading_spaces_value;
        } else if (!is_whitespace(c)) {
          return malformed(i);
        }
        break;

      case state::leading_spaces_value:
        if (is_whitespace(c)) break;
        if (!is_allowed_value_char(c)) return malformed(i);
        beg = i;
        internal_state = state::value;
        break;

      case state::value:
        if (c == ',') {
          consume_value(i);
          internal_state = state::leading_spaces_key;
        } else if (c == ';') {
          consume_value(i);
          internal_state = state::properties;
        } else if (is_whitespace(c)) {
          tmp_end = i;
          internal_state = state::trailing_spaces_value;
        } else if (!is_allowed_value_char(c)) {
          return malformed(i);
        }
        break;

      case state::trailing_spaces_value:
        if (c == ',' || c == ';') {
          consume_value(tmp_end);
          internal_state = c == ',' ? state::leading_spaces_key
                                    : state::properties;
        } else if (!is_whitespace(c)) {
          return malformed(i);
        }
        break;

      case state::properties:
        if (c == ',') {
          internal_state = state::leading_spaces_key;
        }
        break;
    }
  }

  switch (internal_state) {
    case state::value:
      consume_value(end);
      break;
    case state::trailing_spaces_value:
      consume_value(tmp_end);
      break;
    case state::properties:
      break;
    default:
      // Includes a trailing ",": a list member must follow it.
      return malformed(end);
  }

  return result;
}

bool W3CBaggageCodec::decode(BaggageState& state, StringView value) const {
  auto items = parse(value);
  if (!items) {
    return false;
  }

  bool decoded = false;
  for (auto& [key, item_value] : *items) {
    if (state.update_value(BaggageField{key}, std::move(item_value))) {
      decoded = true;
    }
  }
  return decoded;
}

Optional<std::string> W3CBaggageCodec::encode(
    const BaggageState::Map& values) const {
  std::string result;
  for (const auto& entry : values.entries()) {
    if (!entry.value()) continue;
    if (!result.empty()) result += ',';
    result += entry.key().name();
    result += '=';
    result += *entry.value();
  }
  if (result.empty()) {
    return nullopt;
  }
  return result;
}

bool extract(BaggageState& state, const BaggageCodec& codec,
             const DictReader& reader) {
  bool changed = false;
  for (const std::string& key : codec.extract_key_names()) {
    if (auto value = reader.lookup(key)) {
      if (codec.decode(state, *value)) {
        changed = true;
      }
    }
  }
  return changed;
}

Expected<void> inject(const BaggageState& state, const BaggageCodec& codec,
                      DictWriter& writer,
                      const std::vector<BaggageField>& filtered) {
  auto values = state.to_map_filtering_fields(filtered);
  if (auto* error = values.if_error()) {
    return *error;
  }

  const auto encoded = codec.encode(*values);
  if (!encoded) {
    return {};
  }
  for (const std::string& key : codec.inject_key_names()) {
    writer.set(key, *encoded);
  }
  return {};
}

}  // namespace tracing
}  // namespace tracebag
