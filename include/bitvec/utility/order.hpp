#pragma once

#include <bitvec/utility/bits.hpp>
#include <string_view>

namespace bitvec {

/**
 * @ingroup utility
 * @brief Bit-ordering policy.
 *
 * A policy is a stateless type whose static `at<T>(i)` maps the logical
 * index `i` of a bit inside one element of type `T` to the physical
 * position holding it. The mapping must be a bijection over
 * `[0, Bits<T>::width)` for every `BitStore` type. Any type meeting
 * these requirements can be plugged into `BitSlice` and `BitVector`.
 *
 * ```cpp
 * struct SwappedNibbles {
 *   constexpr static std::string_view name = "SwappedNibbles";
 *   template<bitvec::BitStore T>
 *   constexpr static std::size_t
 *   at(std::size_t i) noexcept { return i ^ 4; }
 * };
 * ```
 */
template<typename O>
concept BitOrder = requires(std::size_t i) {
  { O::name } -> std::convertible_to<std::string_view>;
  { O::template at<std::uint8_t>(i) } -> std::same_as<std::size_t>;
  { O::template at<std::uint16_t>(i) } -> std::same_as<std::size_t>;
  { O::template at<std::uint32_t>(i) } -> std::same_as<std::size_t>;
  { O::template at<std::uint64_t>(i) } -> std::same_as<std::size_t>;
};

/**
 * @ingroup utility
 * Logical bit 0 is the most significant bit of each element, the
 * layout a big-endian bit stream is written in.
 */
struct BigEndian {
  constexpr static std::string_view name = "BigEndian";

  template<BitStore T>
  constexpr static std::size_t
  at(std::size_t i) noexcept {
    assert(i < Bits<T>::width);
    return Bits<T>::width - 1 - i;
  }
};

/**
 * @ingroup utility
 * Logical bit 0 is the least significant bit of each element.
 */
struct LittleEndian {
  constexpr static std::string_view name = "LittleEndian";

  template<BitStore T>
  constexpr static std::size_t
  at(std::size_t i) noexcept {
    assert(i < Bits<T>::width);
    return i;
  }
};

}  // namespace bitvec
