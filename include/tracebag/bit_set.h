#pragma once

// This component provides functions for treating a `std::uint64_t` as a set
// of up to 64 small integers. `UnsafeArrayMap` uses it to mark filtered slots,
// and `BaggageState` to mark fields while merging, without allocating.
//
// All indices must be less than `bit_set::max_size`. The functions do not
// check this; callers reject larger inputs before they get here.

#include <bitset>
#include <cstddef>
#include <cstdint>

namespace tracebag {
namespace tracing {
namespace bit_set {

constexpr std::size_t max_size = 64;

constexpr bool is_set(std::uint64_t bits, std::size_t index) {
  return (bits & (std::uint64_t(1) << index)) != 0;
}

constexpr std::uint64_t set_bit(std::uint64_t bits, std::size_t index) {
  return bits | (std::uint64_t(1) << index);
}

constexpr std::uint64_t unset_bit(std::uint64_t bits, std::size_t index) {
  return bits & ~(std::uint64_t(1) << index);
}

// Return the number of set bits.
inline std::size_t size(std::uint64_t bits) {
  return std::bitset<max_size>(bits).count();
}

}  // namespace bit_set
}  // namespace tracing
}  // namespace tracebag
