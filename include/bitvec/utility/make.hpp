#pragma once

#include <bitvec/container/bit_vector.hpp>
#include <initializer_list>
#include <stdexcept>
#include <string_view>
#include <type_traits>

namespace bitvec {

namespace detail {

/**
 * Values that can stand for one bit in a literal list: booleans,
 * integers and floating-point numbers.
 */
template<typename M>
concept BitMarker = std::is_arithmetic_v<M>;

/**
 * A marker is 1 when it is non-zero, so `-1` and `0.5` count as 1 and
 * only zero (of either sign) counts as 0.
 */
template<BitMarker M>
constexpr bool
truth(M marker) noexcept {
  return marker != M{};
}

}  // namespace detail

/**
 * @ingroup utility
 * @brief Builds a vector holding one bit per marker, in order.
 *
 * ```cpp
 * auto a = bitvec::make(0, 1, 1);                         // BigEndian, u8
 * auto b = bitvec::make<bitvec::LittleEndian>(1, 0);      // LittleEndian, u8
 * auto c = bitvec::make<bitvec::BigEndian, std::uint32_t>(1, 0.5, true);
 * ```
 *
 * @tparam Order Bit-ordering policy.
 * @tparam T Storage element type.
 * @param markers Bit values; see `detail::truth`.
 */
template<BitOrder Order = DefaultOrder, BitStore T = DefaultElement,
         detail::BitMarker... Ms>
constexpr auto
make(Ms... markers) {
  auto v = BitVector<Order, T>{};
  v.reserve(sizeof...(Ms));
  (v.push_back(detail::truth(markers)), ...);
  return v;
}

/**
 * @brief Builds a vector from a braced list of same-typed markers.
 *
 * Accepts a trailing comma: `bitvec::make({0, 1, 1,})`.
 */
template<BitOrder Order = DefaultOrder, BitStore T = DefaultElement,
         detail::BitMarker M>
constexpr auto
make(std::initializer_list<M> markers) {
  auto v = BitVector<Order, T>{};
  v.reserve(markers.size());
  for (auto m : markers) v.push_back(detail::truth(m));
  return v;
}

/**
 * @ingroup utility
 * @brief Builds a vector of `count` bits, all equal to `marker`.
 *
 * ```cpp
 * auto ones = bitvec::repeat(1, 70);
 * auto zeros = bitvec::repeat<bitvec::LittleEndian, std::uint64_t>(0, 70);
 * ```
 */
template<BitOrder Order = DefaultOrder, BitStore T = DefaultElement,
         detail::BitMarker M>
constexpr auto
repeat(M marker, std::size_t count) {
  return BitVector<Order, T>(count, detail::truth(marker));
}

namespace detail {

inline auto
parse_bits(std::string_view s) {
  auto v = BitVector<>{};
  v.reserve(s.size());
  for (const auto c : s) {
    if (c == '0' || c == '1')
      v.push_back(c == '1');
    else if (c != '_' && c != '\'' && c != ' ')
      throw std::invalid_argument("bitvec: bad character in bit literal");
  }
  return v;
}

}  // namespace detail

// for 0110_bits
inline auto operator""_bits(const char* s)
{
  return detail::parse_bits(s);
}

// for "0110_1010"_bits
inline auto operator""_bits(const char* s, std::size_t n)
{
  return detail::parse_bits({s, n});
}

}  // namespace bitvec
