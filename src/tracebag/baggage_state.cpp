#include <tracebag/baggage_fields_factory.h>
#include <tracebag/baggage_state.h>
#include <tracebag/bit_set.h>
#include <tracebag/logger.h>

#include <atomic>
#include <cstdint>
#include <ostream>
#include <sstream>
#include <utility>

namespace tracebag {
namespace tracing {

BaggageState::BaggageState(const BaggageFieldsFactory& factory)
    : Extra(factory),
      baggage_factory_(factory),
      array_(factory.initial_array_) {}

bool BaggageState::is_dynamic() const { return baggage_factory_.dynamic_; }

std::vector<BaggageField> BaggageState::get_all_fields() const {
  if (!is_dynamic()) {
    return baggage_factory_.initial_fields_;
  }

  const auto state = array();
  std::vector<BaggageField> result;
  result.reserve(state->size());
  for (const auto& slot : *state) {
    if (!slot.key) break;  // end of keys
    result.push_back(*slot.key);
  }
  return result;
}

Optional<std::string> BaggageState::get_value(const BaggageField& field) const {
  const auto state = array();
  const std::size_t slot = index_of_field(*state, field);
  if (slot == npos) {
    return nullopt;
  }
  return (*state)[slot].value;
}

std::size_t BaggageState::index_of_field(const Array& array,
                                         const BaggageField& field) const {
  const auto& indices = baggage_factory_.initial_field_indices_;
  const auto found = indices.find(field);
  if (found != indices.end()) {
    return found->second;
  }

  for (std::size_t i = baggage_factory_.initial_fields_.size();
       i < array.size(); ++i) {
    if (!array[i].key) break;  // end of keys
    if (*array[i].key == field) {
      return i;
    }
  }
  return npos;
}

bool BaggageState::update_value(const BaggageField& field,
                                Optional<std::string> value) {
  // Retries are bounded so that a pathological race can't spin forever.
  std::size_t attempts = baggage_factory_.update_attempts_;
  while (attempts > 0) {
    const auto state = array();
    const std::size_t slot = index_of_field(*state, field);
    if (slot != npos) {
      if ((*state)[slot].value == value) {
        return false;
      }
      // Same field, different value.
      if (try_update_value(state, slot, value)) {
        return true;
      }
      --attempts;
      continue;
    }

    // There's a new field, but the policy might not allow new fields, or we
    // might have reached the maximum number of fields.
    if (!is_dynamic()) {
      return false;
    }
    if (state->size() >= baggage_factory_.max_fields_) {
      baggage_factory_.logger_->log_error([&](std::ostream& log) {
        log << "Ignoring request to add baggage field \"" << field
            << "\": there are already " << baggage_factory_.max_fields_
            << " fields, which is the maximum.";
      });
      return false;
    }
    if (try_add_new_field(state, field, value)) {
      return true;
    }
    --attempts;
  }

  baggage_factory_.logger_->log_error([&](std::ostream& log) {
    log << "Failed to update baggage field \"" << field << "\" after "
        << baggage_factory_.update_attempts_
        << " attempts due to concurrent updates.";
  });
  return false;
}

// Fields are never removed, so the slot of a field is the same in every array
// that has it. A lost race is retried by looking the slot up again in the new
// array.
bool BaggageState::try_update_value(const std::shared_ptr<const Array>& array,
                                    std::size_t slot,
                                    const Optional<std::string>& value) {
  auto copy = std::make_shared<Array>(*array);
  (*copy)[slot].value = value;
  return compare_and_set(array, std::move(copy));
}

bool BaggageState::try_add_new_field(const std::shared_ptr<const Array>& array,
                                     const BaggageField& field,
                                     const Optional<std::string>& value) {
  auto copy = std::make_shared<Array>();
  copy->reserve(array->size() + 1);
  copy->insert(copy->end(), array->begin(), array->end());
  copy->push_back(Array::value_type{field, value});
  return compare_and_set(array, std::move(copy));
}

bool BaggageState::compare_and_set(std::shared_ptr<const Array> expected,
                                   std::shared_ptr<const Array> desired) {
  return std::atomic_compare_exchange_strong(&array_, &expected,
                                             std::move(desired));
}

Expected<BaggageState::Map> BaggageState::to_map_filtering_fields(
    const std::vector<BaggageField>& filtered) const {
  return Map::create(array()).filter_keys(filtered);
}

std::shared_ptr<const BaggageState::Array> BaggageState::array() const {
  return std::atomic_load(&array_);
}

std::shared_ptr<const BaggageState::Array>
BaggageState::merge_state_keeping_ours_on_conflict(
    const BaggageState& theirs) const {
  const auto our_array = array();
  const auto their_array = theirs.array();
  const Array& ours = *our_array;
  const Array& their = *their_array;

  // Scan first to see whether we need to change our values, grow our array,
  // or neither. Bit `i` refers to their slot `i`. The factory never lets an
  // array hold more than 64 fields.
  std::uint64_t change_in_ours = 0;
  std::uint64_t new_to_ours = 0;
  for (std::size_t i = 0; i < their.size() && i < bit_set::max_size; ++i) {
    const auto& slot = their[i];
    if (!slot.key) break;  // end of keys
    const std::size_t our_index = index_of_field(ours, *slot.key);
    if (our_index == npos) {
      new_to_ours = bit_set::set_bit(new_to_ours, i);
    } else if (!ours[our_index].value && slot.value) {
      // Our value wins unless we don't have one.
      change_in_ours = bit_set::set_bit(change_in_ours, i);
    }
  }

  if (change_in_ours == 0 && new_to_ours == 0) {
    return our_array;
  }

  std::size_t our_end = 0;
  while (our_end < ours.size() && ours[our_end].key) {
    ++our_end;
  }

  const std::size_t max_fields = baggage_factory_.max_fields_;
  const std::size_t room = max_fields > our_end ? max_fields - our_end : 0;
  const std::size_t num_new = bit_set::size(new_to_ours);
  if (num_new > room) {
    baggage_factory_.logger_->log_error([&](std::ostream& log) {
      log << "Ignoring " << (num_new - room)
          << " baggage field(s) while merging: the maximum is " << max_fields
          << " fields.";
    });
    // Keep the first `room` new fields, in their order.
    std::size_t kept = 0;
    for (std::size_t i = 0; i < bit_set::max_size; ++i) {
      if (!bit_set::is_set(new_to_ours, i)) continue;
      if (kept < room) {
        ++kept;
      } else {
        new_to_ours = bit_set::unset_bit(new_to_ours, i);
      }
    }
    if (change_in_ours == 0 && new_to_ours == 0) {
      return our_array;
    }
  }

  // Copy-on-write: provision one array large enough for all the changes, then
  // apply them in one pass.
  auto merged = std::make_shared<Array>();
  merged->reserve(our_end + bit_set::size(new_to_ours));
  merged->insert(merged->end(), ours.begin(), ours.begin() + our_end);
  for (std::size_t i = 0; i < their.size(); ++i) {
    if (change_in_ours == 0 && new_to_ours == 0) break;
    if (bit_set::is_set(change_in_ours, i)) {
      change_in_ours = bit_set::unset_bit(change_in_ours, i);
      const std::size_t our_index = index_of_field(*merged, *their[i].key);
      (*merged)[our_index].value = their[i].value;
    } else if (bit_set::is_set(new_to_ours, i)) {
      new_to_ours = bit_set::unset_bit(new_to_ours, i);
      merged->push_back(their[i]);
    }
  }
  return merged;
}

bool BaggageState::state_is_initial() const {
  return array() == baggage_factory_.initial_array_;
}

void BaggageState::adopt_state_of(const Extra& other) {
  // `ExtraFactory::decorate` passes only objects of the same factory.
  const auto& theirs = static_cast<const BaggageState&>(other);
  std::atomic_store(&array_, theirs.array());
}

void BaggageState::merge_state_from(const Extra& other) {
  const auto& theirs = static_cast<const BaggageState&>(other);
  std::atomic_store(&array_, merge_state_keeping_ours_on_conflict(theirs));
}

std::string BaggageState::to_string() const {
  std::ostringstream stream;
  stream << *this;
  return stream.str();
}

bool operator==(const BaggageState& left, const BaggageState& right) {
  return *left.array() == *right.array();
}

bool operator!=(const BaggageState& left, const BaggageState& right) {
  return !(left == right);
}

std::ostream& operator<<(std::ostream& stream, const BaggageState& state) {
  const auto array = state.array();
  stream << "BaggageState{";
  const char* separator = "";
  for (const auto& slot : *array) {
    if (!slot.key) break;
    stream << separator << *slot.key << '=';
    if (slot.value) {
      stream << *slot.value;
    } else {
      stream << "null";
    }
    separator = ",";
  }
  return stream << '}';
}

}  // namespace tracing
}  // namespace tracebag
