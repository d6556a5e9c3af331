#include <bitvec/container/bit_vector.hpp>
#include <bitvec/utility/make.hpp>
#include <catch.hpp>
#include <iterator>
#include <limits>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <vector>

using namespace bitvec;

static_assert(std::random_access_iterator<BitVector<>::iterator>);
static_assert(std::random_access_iterator<BitVector<>::const_iterator>);
static_assert(std::random_access_iterator<
              BitVector<LittleEndian, std::uint64_t>::iterator>);
static_assert(std::random_access_iterator<
              BitVector<LittleEndian, std::uint64_t>::const_iterator>);

TEMPLATE_TEST_CASE("BitVector::Construction - Sizes and layout",
                   "[BitVector]", std::uint8_t, std::uint16_t,
                   std::uint32_t, std::uint64_t) {
  constexpr auto w = Bits<TestType>::width;

  SECTION("default") {
    auto v = BitVector<BigEndian, TestType>{};
    REQUIRE(v.empty());
    REQUIRE(v.size() == 0);
    REQUIRE(v.num_elements() == 0);
    REQUIRE(v.capacity() == 0);
  }

  SECTION("count") {
    auto v = BitVector<LittleEndian, TestType>(w + 1);
    REQUIRE(v.size() == w + 1);
    REQUIRE(v.num_elements() == 2);
    REQUIRE(v.none());

    auto u = BitVector<LittleEndian, TestType>(w + 1, true);
    REQUIRE(u.all());
    REQUIRE(u.count_ones() == w + 1);
    REQUIRE(u.data()[0] == Bits<TestType>::ones);
  }

  SECTION("iterator range") {
    const auto src = std::vector<bool>{true, false, false, true, true};
    auto v = BitVector<BigEndian, TestType>(src.begin(), src.end());
    REQUIRE(v.size() == 5);
    REQUIRE(std::equal(v.cbegin(), v.cend(), src.begin()));
  }

  SECTION("first bit goes to the policy's first position") {
    auto b = make<BigEndian, TestType>(1);
    auto l = make<LittleEndian, TestType>(1);
    REQUIRE(b.data()[0] == Bits<TestType>::mask(w - 1));
    REQUIRE(l.data()[0] == Bits<TestType>::mask(0));
  }

  SECTION("from a slice") {
    auto v = make<BigEndian, TestType>(1, 0, 1, 1, 0);
    auto u = BitVector<BigEndian, TestType>(v.slice(1, 3));
    REQUIRE(u == make<BigEndian, TestType>(0, 1, 1));
    u.set(0, true);
    REQUIRE(!v.get(1));
  }
}

TEST_CASE("BitVector::Access - Checked access", "[BitVector]") {
  auto v = make(1, 0, 1);

  REQUIRE(v.get(0));
  REQUIRE(!v.get(1));
  REQUIRE(v.front());
  REQUIRE(v.back());

  v.set(1, true);
  REQUIRE(v.all());
  v.at(2) = false;
  REQUIRE(v == make(1, 1, 0));

  SECTION("out of range leaves the vector unchanged") {
    REQUIRE_THROWS_AS(v.get(3), std::out_of_range);
    REQUIRE_THROWS_AS(v.set(3, true), std::out_of_range);
    REQUIRE_THROWS_AS(v.at(100), std::out_of_range);
    REQUIRE_THROWS_AS(v.slice(2, 2), std::out_of_range);
    REQUIRE(v == make(1, 1, 0));
    REQUIRE(v.data()[0] == 0b1100'0000);
  }

  SECTION("empty") {
    auto e = BitVector<>{};
    REQUIRE_THROWS_AS(e.get(0), std::out_of_range);
    REQUIRE(e.slice(0, 0).empty());
  }
}

TEST_CASE("BitVector::Modifiers - Growing and shrinking", "[BitVector]") {
  SECTION("push and pop") {
    auto v = BitVector<LittleEndian, std::uint16_t>{};
    for (auto i = 0; i < 40; i++) v.push_back(i % 3 == 0);
    REQUIRE(v.size() == 40);
    REQUIRE(v.count_ones() == 14);
    v.pop_back();
    REQUIRE(v.size() == 39);
    REQUIRE(!v.back());
  }

  SECTION("insert") {
    auto v = make(1, 1, 1, 1);
    auto it = v.insert(v.cbegin() + 1, false);
    REQUIRE(it == v.begin() + 1);
    REQUIRE(v == make(1, 0, 1, 1, 1));
    v.insert(v.cend(), 2, false);
    REQUIRE(v == make(1, 0, 1, 1, 1, 0, 0));
    const auto more = std::vector<bool>{false, true};
    v.insert(v.cbegin(), more.begin(), more.end());
    REQUIRE(v == make(0, 1, 1, 0, 1, 1, 1, 0, 0));
    v.insert(v.cbegin() + 2, {true, false});
    REQUIRE(v == make(0, 1, 1, 0, 1, 0, 1, 1, 1, 0, 0));
  }

  SECTION("erase") {
    auto v = make(1, 0, 1, 1, 0);
    v.erase(v.cbegin() + 1);
    REQUIRE(v == make(1, 1, 1, 0));
    v.erase(v.cbegin(), v.cbegin() + 2);
    REQUIRE(v == make(1, 0));
  }

  SECTION("resize") {
    auto v = make(1, 1, 1);
    v.resize(10);
    REQUIRE(v.size() == 10);
    REQUIRE(v.count_ones() == 3);
    v.resize(2);
    REQUIRE(v == make(1, 1));
    v.resize(5, true);
    REQUIRE(v.all());
  }

  SECTION("stale bits past the end are never observed") {
    auto a = repeat(1, 8);
    a.resize(3);
    REQUIRE(a == repeat(1, 3));
    REQUIRE(a.count_ones() == 3);
    REQUIRE(a.all());
    a.resize(8);
    REQUIRE(a == make(1, 1, 1, 0, 0, 0, 0, 0));
  }

  SECTION("shrink_to_fit") {
    auto v = BitVector<>(100);
    v.resize(10);
    REQUIRE(v.capacity() >= 100);
    v.shrink_to_fit();
    REQUIRE(v.capacity() == 16);
    REQUIRE(v.size() == 10);
  }

  SECTION("append") {
    auto v = make(1, 0, 0, 1, 1);
    v.append(make(0, 1).as_slice());
    REQUIRE(v == make(1, 0, 0, 1, 1, 0, 1));
  }

  SECTION("append from itself within capacity") {
    auto v = make(1, 0, 1);
    v.reserve(64);
    const auto cap = v.capacity();
    v.append(v.as_slice());
    REQUIRE(v.capacity() == cap);
    REQUIRE(v == make(1, 0, 1, 1, 0, 1));
  }

  SECTION("append from itself with reallocation") {
    auto v = make(1, 0, 0, 1, 1);
    v.shrink_to_fit();
    REQUIRE(v.capacity() == 8);
    v.append(v.as_slice());
    REQUIRE(v == make(1, 0, 0, 1, 1, 1, 0, 0, 1, 1));
    v.append(v.slice(8, 2));
    REQUIRE(v == make(1, 0, 0, 1, 1, 1, 0, 0, 1, 1, 1, 1));
  }

  SECTION("clear and swap") {
    auto a = make(1, 0);
    auto b = make(0, 0, 1);
    a.swap(b);
    REQUIRE(a == make(0, 0, 1));
    REQUIRE(b == make(1, 0));
    a.clear();
    REQUIRE(a.empty());
  }
}

TEST_CASE("BitVector::Capacity - Size stays within capacity", "[BitVector]") {
  auto v = BitVector<BigEndian, std::uint32_t>{};
  auto check = [&v] {
    REQUIRE(v.size() <= v.capacity());
    REQUIRE(v.num_elements() * 32 <= v.capacity());
    REQUIRE((v.capacity() == 0) == (v.data() == nullptr));
  };

  check();
  for (auto i = 0; i < 100; i++) v.push_back(i % 2 == 0);
  check();
  v.erase(v.cbegin() + 10, v.cend());
  check();
  v.insert(v.cbegin() + 5, 200, true);
  check();
  REQUIRE(v.size() == 210);
  v.resize(3);
  check();
  v.append(v.as_slice());
  check();
  REQUIRE(v == make<BigEndian, std::uint32_t>(1, 0, 1, 1, 0, 1));
  v.shrink_to_fit();
  check();
  REQUIRE(v.capacity() == 32);
  v.clear();
  check();
  v.shrink_to_fit();
  check();
}

TEST_CASE("BitVector::Value - Copies, moves and ordering", "[BitVector]") {
  SECTION("copy is independent") {
    const auto a = make(1, 0, 1);
    auto b = a;
    b.flip();
    REQUIRE(a == make(1, 0, 1));
    REQUIRE(b == make(0, 1, 0));
    b = a;
    REQUIRE(b == a);
  }

  SECTION("move leaves the source empty") {
    auto a = repeat(1, 20);
    auto b = std::move(a);
    REQUIRE(b.size() == 20);
    REQUIRE(a.empty());
    a = std::move(b);
    REQUIRE(a.count_ones() == 20);
  }

  SECTION("lexicographic order") {
    REQUIRE(make(0, 1) < make(1, 0));
    REQUIRE(make(1) < make(1, 0));
    REQUIRE(make(1, 0) <= make(1, 0));
    REQUIRE(make(1, 0) != make(1, 0, 0));
  }
}

TEST_CASE("BitVector::Shift - Logical shifts", "[BitVector]") {
  const auto v = make(1, 0, 1, 1, 0, 0, 0, 0);

  SECTION("non-mutating") {
    REQUIRE((v << 2u) == make(1, 1, 0, 0, 0, 0, 0, 0));
    REQUIRE((v >> 3u) == make(0, 0, 0, 1, 0, 1, 1, 0));
    REQUIRE((v << std::uint8_t{0}) == v);
    REQUIRE(v == make(1, 0, 1, 1, 0, 0, 0, 0));
  }

  SECTION("in place") {
    auto u = v;
    (u <<= 2u) >>= 1u;
    REQUIRE(u == make(0, 1, 1, 0, 0, 0, 0, 0));
    u.shift_right(4);
    REQUIRE(u == make(0, 0, 0, 0, 0, 1, 1, 0));
  }

  SECTION("amounts of the length or more clear the vector") {
    REQUIRE((v << 8u).none());
    REQUIRE((v >> (std::uint64_t{1} << 40)).none());
    REQUIRE((v << std::numeric_limits<std::uint64_t>::max()).none());
    REQUIRE((v >> std::numeric_limits<std::size_t>::max()).size() == 8);
  }

  SECTION("length is preserved") {
    auto u = BitVector<LittleEndian, std::uint64_t>(130, true);
    u <<= 65u;
    REQUIRE(u.size() == 130);
    REQUIRE(u.count_ones() == 65);
    REQUIRE(u.slice(0, 65).all());
    u >>= 100u;
    REQUIRE(u.count_ones() == 30);
    REQUIRE(u.slice(100, 30).all());
  }

  SECTION("shifting a slice gives an owning vector") {
    auto s = v.slice(2, 4);
    auto u = s << 1u;
    STATIC_REQUIRE(std::is_same_v<decltype(u), BitVector<>>);
    REQUIRE(u == make(1, 0, 0, 0));
    REQUIRE((s >> 2u) == make(0, 0, 1, 1));
    REQUIRE(v == make(1, 0, 1, 1, 0, 0, 0, 0));
  }
}

TEST_CASE("BitVector::Bitwise - Whole-vector operators", "[BitVector]") {
  const auto a = make(1, 1, 0, 0);
  const auto b = make(1, 0, 1, 0);

  REQUIRE((a & b) == make(1, 0, 0, 0));
  REQUIRE((a | b) == make(1, 1, 1, 0));
  REQUIRE((a ^ b) == make(0, 1, 1, 0));
  REQUIRE(~a == make(0, 0, 1, 1));
  REQUIRE(a == make(1, 1, 0, 0));

  SECTION("compound forms") {
    auto c = a;
    c ^= b;
    c |= b.slice(0, 4);
    REQUIRE(c == make(1, 1, 1, 0));
    c &= make(0, 1, 1, 1);
    REQUIRE(c == make(0, 1, 1, 0));
  }

  SECTION("length mismatch") {
    auto c = a;
    REQUIRE_THROWS_AS(c &= make(1, 0), std::length_error);
    REQUIRE_THROWS_AS(a | make(1, 0, 1, 0, 1), std::length_error);
    REQUIRE(c == a);
  }
}

TEST_CASE("BitVector::Logging - Reallocation is reported", "[BitVector]") {
  auto previous = spdlog::default_logger();
  auto oss = std::ostringstream{};
  auto ostream_sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
  auto logger = std::make_shared<spdlog::logger>("bitvec_test", ostream_sink);
  logger->set_level(spdlog::level::debug);
  spdlog::set_default_logger(logger);

  auto v = BitVector<LittleEndian, std::uint32_t>{};
  v.reserve(100);
  v.reserve(50);

  spdlog::set_default_logger(previous);

  const auto log = oss.str();
  REQUIRE(log.find("BitVector<LittleEndian, u32>: reallocating 0 -> 4 elements")
          != std::string::npos);
  REQUIRE(log.find("reallocating") == log.rfind("reallocating"));
}
