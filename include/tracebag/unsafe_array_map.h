#pragma once

// This component provides a class template, `UnsafeArrayMap`, that is a
// read-only map view over a shared array of key/value slots.
//
// The array is shared with whoever created the view, hence "unsafe": the view
// does not copy it. This is what makes views cheap enough to build on every
// read of copy-on-write state such as `BaggageState`. Correctness relies on
// the owner never modifying an array after handing it out.
//
// A slot whose key is `nullopt` marks the end of the data. Slots at or after
// the first such slot are ignored. Keys before it must be unique; the view
// does not check this. A slot's value may be `nullopt`, meaning that the key
// is present without a value.
//
// Individual slots can be hidden from every operation using `filter_keys`.
// Filtering records slot positions in a 64-bit word, so at most
// `bit_set::max_size` keys can be filtered, and only keys in the first
// `bit_set::max_size` slots.
//
// There are no mutating operations. `keys()`, `values()` and `entries()`
// return read-only collections whose iterators yield `const` references or
// values, and whose state is a copy of the view. Iterators keep the array
// alive, and so remain valid after the owner publishes a new array.

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "bit_set.h"
#include "error.h"
#include "expected.h"
#include "optional.h"

namespace tracebag {
namespace tracing {

template <typename Key, typename Value>
struct PackedSlot {
  Optional<Key> key;
  Optional<Value> value;
};

template <typename Key, typename Value>
bool operator==(const PackedSlot<Key, Value>& left,
                const PackedSlot<Key, Value>& right) {
  return left.key == right.key && left.value == right.value;
}

template <typename Key, typename Value>
bool operator!=(const PackedSlot<Key, Value>& left,
                const PackedSlot<Key, Value>& right) {
  return !(left == right);
}

template <typename Key, typename Value>
using PackedArray = std::vector<PackedSlot<Key, Value>>;

template <typename Key, typename Value>
class UnsafeArrayMap {
 public:
  using Slot = PackedSlot<Key, Value>;
  using Array = PackedArray<Key, Value>;

  class Entry;

 private:
  struct KeyAccess;
  struct ValueAccess;
  struct EntryAccess;

  template <typename Access>
  class Collection;

 public:
  using KeyCollection = Collection<KeyAccess>;
  using ValueCollection = Collection<ValueAccess>;
  using EntryCollection = Collection<EntryAccess>;

  // Create an empty map.
  UnsafeArrayMap() = default;

  // Return a view over the specified `array`, bounded by the first slot
  // without a key. Return an empty map if the first slot has no key. The
  // behavior is undefined if `array` is modified afterward. Throw
  // `std::invalid_argument` if `array` is null.
  static UnsafeArrayMap create(std::shared_ptr<const Array> array);

  // Return a view that additionally hides the slots whose keys are equal to
  // any of the specified `keys`. Return this view if no visible slot matches,
  // and an empty map if no slot remains visible. Return an error if there are
  // more than `bit_set::max_size` keys, or if a key to hide is at or past slot
  // `bit_set::max_size`.
  template <typename Keys>
  Expected<UnsafeArrayMap> filter_keys(const Keys& keys) const;
  Expected<UnsafeArrayMap> filter_keys(std::initializer_list<Key> keys) const;

  std::size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }

  // Return the value at the specified `key`, or `nullopt` if `key` is absent
  // or has no value. Use `contains_key` to tell the two apart.
  template <typename K>
  Optional<Value> get(const K& key) const;
  Optional<Value> get(std::nullopt_t) const { return nullopt; }

  template <typename K>
  bool contains_key(const K& key) const {
    return index_of_key(key) != npos;
  }
  bool contains_key(std::nullopt_t) const { return false; }

  // Return whether a visible slot has a value equal to the specified `value`.
  // `nullopt` matches slots without a value.
  template <typename V>
  bool contains_value(const V& value) const;

  // Return whether the specified `entry` is one of this map's entries.
  bool contains(const Entry& entry) const;

  KeyCollection keys() const { return KeyCollection(*this); }
  ValueCollection values() const { return ValueCollection(*this); }
  EntryCollection entries() const { return EntryCollection(*this); }

  // Return whether this object and the specified `other` are the same view:
  // same array, same bound, same filtered slots. All empty maps are the same
  // view.
  bool same_view(const UnsafeArrayMap& other) const;

  // Return the array being viewed, or null for an empty map.
  const std::shared_ptr<const Array>& array() const { return array_; }

  // Return the entries in the form "UnsafeArrayMap{k1=v1,k2=v2}". Values
  // without a value are written as "null".
  std::string to_string() const;

 private:
  static constexpr std::size_t npos = std::size_t(-1);

  UnsafeArrayMap(std::shared_ptr<const Array> array, std::size_t end,
                 std::uint64_t filtered)
      : array_(std::move(array)),
        end_(end),
        filtered_(filtered),
        size_(end - bit_set::size(filtered)) {}

  // Slots at or past `bit_set::max_size` can never be filtered.
  bool is_filtered(std::size_t slot) const {
    return slot < bit_set::max_size && bit_set::is_set(filtered_, slot);
  }

  std::size_t advance_past_filtered(std::size_t slot) const {
    while (slot < end_ && is_filtered(slot)) ++slot;
    return slot;
  }

  template <typename K>
  std::size_t index_of_key(const K& key) const;

  std::shared_ptr<const Array> array_;
  std::size_t end_ = 0;
  std::uint64_t filtered_ = 0;
  std::size_t size_ = 0;
};

template <typename Key, typename Value>
class UnsafeArrayMap<Key, Value>::Entry {
  Key key_;
  Optional<Value> value_;

 public:
  struct Hash {
    std::size_t operator()(const Entry& entry) const { return entry.hash(); }
  };

  Entry(Key key, Optional<Value> value)
      : key_(std::move(key)), value_(std::move(value)) {}

  const Key& key() const { return key_; }
  const Optional<Value>& value() const { return value_; }

  std::size_t hash() const {
    std::size_t result = 1000003;
    result ^= std::hash<Key>()(key_);
    result *= 1000003;
    result ^= value_ ? std::hash<Value>()(*value_) : 0;
    return result;
  }

  // Return the entry in the form "Entry{key=value}".
  std::string to_string() const {
    std::ostringstream stream;
    stream << *this;
    return stream.str();
  }

  friend bool operator==(const Entry& left, const Entry& right) {
    return left.key_ == right.key_ && left.value_ == right.value_;
  }
  friend bool operator!=(const Entry& left, const Entry& right) {
    return !(left == right);
  }

  friend std::ostream& operator<<(std::ostream& stream, const Entry& entry) {
    stream << "Entry{" << entry.key_ << '=';
    if (entry.value_) {
      stream << *entry.value_;
    } else {
      stream << "null";
    }
    return stream << '}';
  }
};

template <typename Key, typename Value>
struct UnsafeArrayMap<Key, Value>::KeyAccess {
  using element_type = Key;
  using reference = const Key&;

  static reference at(const Slot& slot) { return *slot.key; }
  static bool contains(const UnsafeArrayMap& map, const Key& key) {
    return map.contains_key(key);
  }
};

template <typename Key, typename Value>
struct UnsafeArrayMap<Key, Value>::ValueAccess {
  using element_type = Optional<Value>;
  using reference = const Optional<Value>&;

  static reference at(const Slot& slot) { return slot.value; }
  static bool contains(const UnsafeArrayMap& map,
                       const Optional<Value>& value) {
    return map.contains_value(value);
  }
};

template <typename Key, typename Value>
struct UnsafeArrayMap<Key, Value>::EntryAccess {
  using element_type = Entry;
  // Entries are built on demand, so the iterator yields them by value.
  using reference = Entry;

  static reference at(const Slot& slot) { return Entry(*slot.key, slot.value); }
  static bool contains(const UnsafeArrayMap& map, const Entry& entry) {
    return map.contains(entry);
  }
};

// `Collection` is the read-only collection returned by `keys()`, `values()`
// and `entries()`. `Access` determines which part of each slot is the
// element.
template <typename Key, typename Value>
template <typename Access>
class UnsafeArrayMap<Key, Value>::Collection {
  UnsafeArrayMap map_;

 public:
  using element_type = typename Access::element_type;

  class const_iterator {
    friend class Collection;

    UnsafeArrayMap map_;
    std::size_t slot_;

    const_iterator(const UnsafeArrayMap& map, std::size_t slot)
        : map_(map), slot_(map.advance_past_filtered(slot)) {}

   public:
    using iterator_category =
        std::conditional_t<std::is_reference<typename Access::reference>::value,
                           std::forward_iterator_tag, std::input_iterator_tag>;
    using value_type = element_type;
    using difference_type = std::ptrdiff_t;
    using pointer = const element_type*;
    using reference = typename Access::reference;

    const_iterator() : slot_(0) {}

    reference operator*() const { return Access::at((*map_.array_)[slot_]); }

    const_iterator& operator++() {
      slot_ = map_.advance_past_filtered(slot_ + 1);
      return *this;
    }
    const_iterator operator++(int) {
      const_iterator previous = *this;
      ++*this;
      return previous;
    }

    friend bool operator==(const const_iterator& left,
                           const const_iterator& right) {
      return left.slot_ == right.slot_;
    }
    friend bool operator!=(const const_iterator& left,
                           const const_iterator& right) {
      return !(left == right);
    }
  };
  using iterator = const_iterator;

  explicit Collection(const UnsafeArrayMap& map) : map_(map) {}

  std::size_t size() const { return map_.size(); }
  bool empty() const { return map_.empty(); }

  const_iterator begin() const { return const_iterator(map_, 0); }
  const_iterator end() const { return const_iterator(map_, map_.end_); }

  bool contains(const element_type& element) const {
    return Access::contains(map_, element);
  }

  // Return whether every element of the specified `elements` is contained in
  // this collection. An empty `elements` is always contained.
  template <typename Elements>
  bool contains_all(const Elements& elements) const {
    return std::all_of(
        std::begin(elements), std::end(elements),
        [&](const auto& element) { return Access::contains(map_, element); });
  }

  // Return a new buffer holding exactly the elements of this collection.
  std::vector<element_type> to_array() const {
    std::vector<element_type> result;
    result.reserve(size());
    for (auto it = begin(); it != end(); ++it) {
      result.push_back(*it);
    }
    return result;
  }

  // Copy the elements into the specified `destination` and return it, if it
  // has room for all of them. Elements of `destination` past `size()` are
  // left as they were. If `destination` is too small, return a new buffer
  // instead.
  std::vector<element_type> to_array(
      std::vector<element_type> destination) const {
    if (destination.size() < size()) {
      return to_array();
    }
    std::size_t d = 0;
    for (auto it = begin(); it != end(); ++it) {
      destination[d++] = *it;
    }
    return destination;
  }
};

template <typename Key, typename Value>
UnsafeArrayMap<Key, Value> UnsafeArrayMap<Key, Value>::create(
    std::shared_ptr<const Array> array) {
  if (array == nullptr) {
    throw std::invalid_argument("UnsafeArrayMap::create: array is null");
  }

  std::size_t end = 0;
  while (end < array->size() && (*array)[end].key) {
    ++end;
  }
  if (end == 0) {
    return UnsafeArrayMap();
  }
  return UnsafeArrayMap(std::move(array), end, 0);
}

template <typename Key, typename Value>
template <typename Keys>
Expected<UnsafeArrayMap<Key, Value>> UnsafeArrayMap<Key, Value>::filter_keys(
    const Keys& keys) const {
  const auto num_keys =
      std::size_t(std::distance(std::begin(keys), std::end(keys)));
  if (num_keys > bit_set::max_size) {
    std::string message;
    message += "Cannot filter more than ";
    message += std::to_string(bit_set::max_size);
    message += " keys, but ";
    message += std::to_string(num_keys);
    message += " were requested.";
    return Error{Error::TOO_MANY_FILTERED_KEYS, std::move(message)};
  }

  std::uint64_t filtered = filtered_;
  for (std::size_t slot = 0; slot < end_; ++slot) {
    if (is_filtered(slot)) continue;
    const Key& key = *(*array_)[slot].key;
    const bool match =
        std::any_of(std::begin(keys), std::end(keys),
                    [&](const auto& filtered_key) { return key == filtered_key; });
    if (!match) continue;
    if (slot >= bit_set::max_size) {
      std::ostringstream message;
      message << "Cannot filter key \"" << key << "\" at position " << slot
              << ": only the first " << bit_set::max_size
              << " positions of a map can be filtered.";
      return Error{Error::TOO_MANY_FILTERED_KEYS, message.str()};
    }
    filtered = bit_set::set_bit(filtered, slot);
  }

  if (filtered == filtered_) {
    return *this;
  }
  if (bit_set::size(filtered) == end_) {
    return UnsafeArrayMap();
  }
  return UnsafeArrayMap(array_, end_, filtered);
}

template <typename Key, typename Value>
Expected<UnsafeArrayMap<Key, Value>> UnsafeArrayMap<Key, Value>::filter_keys(
    std::initializer_list<Key> keys) const {
  return filter_keys<std::initializer_list<Key>>(keys);
}

template <typename Key, typename Value>
template <typename K>
Optional<Value> UnsafeArrayMap<Key, Value>::get(const K& key) const {
  const std::size_t slot = index_of_key(key);
  if (slot == npos) {
    return nullopt;
  }
  return (*array_)[slot].value;
}

template <typename Key, typename Value>
template <typename V>
bool UnsafeArrayMap<Key, Value>::contains_value(const V& value) const {
  for (std::size_t slot = 0; slot < end_; ++slot) {
    if (!is_filtered(slot) && (*array_)[slot].value == value) {
      return true;
    }
  }
  return false;
}

template <typename Key, typename Value>
bool UnsafeArrayMap<Key, Value>::contains(const Entry& entry) const {
  const std::size_t slot = index_of_key(entry.key());
  if (slot == npos) {
    return false;
  }
  return (*array_)[slot].value == entry.value();
}

template <typename Key, typename Value>
bool UnsafeArrayMap<Key, Value>::same_view(const UnsafeArrayMap& other) const {
  return array_ == other.array_ && end_ == other.end_ &&
         filtered_ == other.filtered_;
}

template <typename Key, typename Value>
template <typename K>
std::size_t UnsafeArrayMap<Key, Value>::index_of_key(const K& key) const {
  for (std::size_t slot = 0; slot < end_; ++slot) {
    if (!is_filtered(slot) && *(*array_)[slot].key == key) {
      return slot;
    }
  }
  return npos;
}

template <typename Key, typename Value>
std::string UnsafeArrayMap<Key, Value>::to_string() const {
  std::ostringstream stream;
  stream << "UnsafeArrayMap{";
  const char* separator = "";
  for (std::size_t slot = 0; slot < end_; ++slot) {
    if (is_filtered(slot)) continue;
    const Slot& item = (*array_)[slot];
    stream << separator << *item.key << '=';
    if (item.value) {
      stream << *item.value;
    } else {
      stream << "null";
    }
    separator = ",";
  }
  stream << '}';
  return stream.str();
}

template <typename Key, typename Value>
std::ostream& operator<<(std::ostream& stream,
                         const UnsafeArrayMap<Key, Value>& map) {
  return stream << map.to_string();
}

}  // namespace tracing
}  // namespace tracebag
