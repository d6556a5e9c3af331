#pragma once

#include <bit>
#include <cassert>
#include <climits>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace bitvec {

/**
 * @ingroup utility
 * @brief Unsigned integer types that may serve as the packing unit of a
 * bit container.
 *
 * Accepts the 8, 16, 32 and 64 bit unsigned integers. `bool` and the
 * character types are rejected even though they satisfy
 * `std::unsigned_integral`.
 */
template<typename T>
concept BitStore = std::unsigned_integral<T>
                && !std::same_as<T, bool>
                && !std::same_as<T, char8_t>
                && !std::same_as<T, char16_t>
                && !std::same_as<T, char32_t>
                && (sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4
                    || sizeof(T) == 8);

/**
 * @ingroup utility
 * @brief Single-element bit operations for a storage type.
 *
 * Positions are physical: position 0 is the least significant bit of
 * the element. Mapping logical indices onto positions is the job of an
 * ordering policy (see order.hpp).
 *
 * @tparam T Storage element type.
 */
template<BitStore T>
struct Bits {
  /**
   * Number of bits in one element.
   */
  constexpr static std::size_t width = sizeof(T) * CHAR_BIT;

  constexpr static T zero = 0;
  constexpr static T ones = std::numeric_limits<T>::max();

  /**
   * Single-bit mask for a physical position.
   *
   * @param pos Physical position, must be less than `width`.
   */
  constexpr static T
  mask(std::size_t pos) noexcept {
    assert(pos < width && "bit position out of element");
    return static_cast<T>(T{1} << pos);
  }

  constexpr static bool
  test(T elem, std::size_t pos) noexcept {
    return (elem & mask(pos)) != zero;
  }

  constexpr static void
  set(T& elem, std::size_t pos, bool value) noexcept {
    if (value)
      elem |= mask(pos);
    else
      elem &= static_cast<T>(~mask(pos));
  }

  constexpr static std::size_t
  count_ones(T elem) noexcept {
    return static_cast<std::size_t>(std::popcount(elem));
  }
};

}  // namespace bitvec
