#include <bitvec/utility/bits.hpp>
#include <catch.hpp>

using namespace bitvec;

static_assert(BitStore<std::uint8_t>);
static_assert(BitStore<std::uint16_t>);
static_assert(BitStore<std::uint32_t>);
static_assert(BitStore<std::uint64_t>);
static_assert(BitStore<unsigned long long>);
static_assert(!BitStore<bool>);
static_assert(!BitStore<char16_t>);
static_assert(!BitStore<int>);
static_assert(!BitStore<float>);

TEMPLATE_TEST_CASE("Bits - Single-element bit operations", "[Bits]",
                   std::uint8_t, std::uint16_t, std::uint32_t,
                   std::uint64_t) {
  using B = Bits<TestType>;

  SECTION("width") {
    REQUIRE(B::width == sizeof(TestType) * 8);
    REQUIRE(B::count_ones(B::ones) == B::width);
    REQUIRE(B::count_ones(B::zero) == 0);
  }

  SECTION("set then test touches one position only") {
    for (std::size_t pos = 0; pos < B::width; pos++) {
      auto elem = B::zero;
      B::set(elem, pos, true);
      REQUIRE(B::test(elem, pos));
      REQUIRE(B::count_ones(elem) == 1);
      REQUIRE(elem == static_cast<TestType>(TestType{1} << pos));

      auto full = B::ones;
      B::set(full, pos, false);
      REQUIRE(!B::test(full, pos));
      REQUIRE(B::count_ones(full) == B::width - 1);
    }
  }

  SECTION("setting twice is idempotent") {
    auto elem = B::zero;
    B::set(elem, 3, true);
    B::set(elem, 3, true);
    REQUIRE(B::count_ones(elem) == 1);
    B::set(elem, 3, false);
    B::set(elem, 3, false);
    REQUIRE(elem == B::zero);
  }

  SECTION("top bit") {
    auto elem = B::zero;
    B::set(elem, B::width - 1, true);
    REQUIRE(elem == static_cast<TestType>(B::ones ^ (B::ones >> 1)));
  }
}
