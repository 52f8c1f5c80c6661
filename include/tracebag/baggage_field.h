#pragma once

// This component provides a class, `BaggageField`, that names one baggage
// field.
//
// Field names are case-insensitive: two fields are equal when their names are
// equal after conversion to lower case. `name()` returns the name as given,
// and is what codecs write on the wire and what the logger prints.

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>

#include "string_view.h"

namespace tracebag {
namespace tracing {

class BaggageField {
  std::string name_;
  std::string lower_name_;

 public:
  explicit BaggageField(std::string name);

  const std::string& name() const { return name_; }
  const std::string& lower_name() const { return lower_name_; }

  friend bool operator==(const BaggageField& left, const BaggageField& right) {
    return left.lower_name_ == right.lower_name_;
  }
  friend bool operator!=(const BaggageField& left, const BaggageField& right) {
    return !(left == right);
  }
};

std::ostream& operator<<(std::ostream&, const BaggageField&);

}  // namespace tracing
}  // namespace tracebag

namespace std {

template <>
struct hash<tracebag::tracing::BaggageField> {
  std::size_t operator()(
      const tracebag::tracing::BaggageField& field) const noexcept {
    return std::hash<std::string>()(field.lower_name());
  }
};

}  // namespace std
