#include <tracebag/baggage_field.h>

#include <ostream>
#include <utility>

#include "parse_util.h"

namespace tracebag {
namespace tracing {

BaggageField::BaggageField(std::string name)
    : name_(std::move(name)), lower_name_(name_) {
  to_lower(lower_name_);
}

std::ostream& operator<<(std::ostream& stream, const BaggageField& field) {
  return stream << field.name();
}

}  // namespace tracing
}  // namespace tracebag
