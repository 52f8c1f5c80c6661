#pragma once

// This component provides a class, `BaggageState`, that holds the baggage
// field values of one span context.
//
// The values live in a `PackedArray` of (field, value) slots. The array is
// copy-on-write: it is never modified once published, and every change
// publishes a new array by atomically swapping a `std::shared_ptr`. Readers
// therefore always see a complete snapshot, and may keep reading an old
// snapshot for as long as they like.
//
// The first slots of every array are the factory's configured fields, in
// order. When the factory is dynamic, fields updated for the first time are
// appended after those. Slots are never removed, so a slot's position is
// stable across updates; this is what makes a lost race cheap to retry.
//
// Objects of this type are created by `BaggageFieldsFactory`, and are found in
// `TraceContext::extra()`.

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "baggage_field.h"
#include "expected.h"
#include "extra.h"
#include "optional.h"
#include "unsafe_array_map.h"

namespace tracebag {
namespace tracing {

class BaggageFieldsFactory;

class BaggageState : public Extra {
  friend class BaggageFieldsFactory;

 public:
  using Array = PackedArray<BaggageField, std::string>;
  using Map = UnsafeArrayMap<BaggageField, std::string>;

  // Return whether fields other than the factory's configured fields can be
  // added. When `false`, `get_all_fields()` is always the configured fields.
  bool is_dynamic() const;

  // Return the fields present, with or without a value, in slot order.
  std::vector<BaggageField> get_all_fields() const;

  // Return the value of the specified `field`, or `nullopt` if the field is
  // absent or has no value.
  Optional<std::string> get_value(const BaggageField& field) const;

  // Set the specified `field` to the specified `value`. A `value` of
  // `nullopt` clears the value but keeps the field. Return whether the state
  // changed. Return `false` without changing anything if `field` already has
  // `value`, if `field` is unknown and this state is not dynamic, or if
  // adding `field` would exceed the factory's maximum number of fields. If
  // concurrent updates win the race every time, give up after the factory's
  // number of update attempts, log, and return `false`.
  bool update_value(const BaggageField& field, Optional<std::string> value);

  // Return a read-only view of the current fields and values, hiding the
  // specified `filtered` fields. Return an error if more than 64 fields are
  // filtered.
  Expected<Map> to_map_filtering_fields(
      const std::vector<BaggageField>& filtered = {}) const;

  // Return the current array. It is never null and never modified.
  std::shared_ptr<const Array> array() const;

  // Return the array that results from merging the state of the specified
  // `theirs` into this state, without changing either. For each field of
  // `theirs`: a field missing here is appended; a field here without a value
  // takes their value; a field here with a value keeps it. Fields that would
  // exceed the maximum number of fields are dropped and logged. Return this
  // state's array itself if nothing would change.
  std::shared_ptr<const Array> merge_state_keeping_ours_on_conflict(
      const BaggageState& theirs) const;

  // Return the fields and values in the form "BaggageState{a=1,b=null}".
  std::string to_string() const;

 protected:
  bool state_is_initial() const override;
  void adopt_state_of(const Extra& other) override;
  void merge_state_from(const Extra& other) override;

 private:
  static constexpr std::size_t npos = std::size_t(-1);

  explicit BaggageState(const BaggageFieldsFactory& factory);

  // Return the slot of the specified `field` in the specified `array`, or
  // `npos` if there is none.
  std::size_t index_of_field(const Array& array,
                             const BaggageField& field) const;

  bool try_update_value(const std::shared_ptr<const Array>& array,
                        std::size_t slot, const Optional<std::string>& value);
  bool try_add_new_field(const std::shared_ptr<const Array>& array,
                         const BaggageField& field,
                         const Optional<std::string>& value);
  bool compare_and_set(std::shared_ptr<const Array> expected,
                       std::shared_ptr<const Array> desired);

  const BaggageFieldsFactory& baggage_factory_;
  // Accessed only through `std::atomic_*`.
  std::shared_ptr<const Array> array_;
};

bool operator==(const BaggageState& left, const BaggageState& right);
bool operator!=(const BaggageState& left, const BaggageState& right);

std::ostream& operator<<(std::ostream&, const BaggageState&);

}  // namespace tracing
}  // namespace tracebag
