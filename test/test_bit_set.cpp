#include <tracebag/bit_set.h>

#include <cstddef>
#include <cstdint>

#include "test.h"

#define BIT_SET_TEST(x) TEST_CASE(x, "[bit_set]")

using namespace tracebag::tracing;

static_assert(bit_set::is_set(bit_set::set_bit(0, 63), 63), "");
static_assert(!bit_set::is_set(bit_set::unset_bit(~std::uint64_t(0), 0), 0),
              "");

BIT_SET_TEST("an empty set contains nothing") {
  CHECK(bit_set::size(0) == 0);
  for (std::size_t i = 0; i < bit_set::max_size; ++i) {
    CHECK(!bit_set::is_set(0, i));
  }
}

BIT_SET_TEST("set and unset one bit") {
  const std::size_t index = GENERATE(0, 1, 31, 32, 62, 63);
  CAPTURE(index);

  const std::uint64_t bits = bit_set::set_bit(0, index);
  CHECK(bit_set::is_set(bits, index));
  CHECK(bit_set::size(bits) == 1);
  // Setting twice changes nothing.
  CHECK(bit_set::set_bit(bits, index) == bits);

  for (std::size_t i = 0; i < bit_set::max_size; ++i) {
    if (i != index) {
      CHECK(!bit_set::is_set(bits, i));
    }
  }

  CHECK(bit_set::unset_bit(bits, index) == 0);
  // Unsetting a bit that isn't set changes nothing.
  CHECK(bit_set::unset_bit(0, index) == 0);
}

BIT_SET_TEST("size counts every set bit") {
  std::uint64_t bits = 0;
  for (std::size_t i = 0; i < bit_set::max_size; i += 2) {
    bits = bit_set::set_bit(bits, i);
  }
  CHECK(bit_set::size(bits) == 32);
  CHECK(bit_set::size(~std::uint64_t(0)) == 64);
}
