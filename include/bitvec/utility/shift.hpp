#pragma once

#include <concepts>
#include <cstddef>
#include <limits>
#include <type_traits>
#include <spdlog/spdlog.h>

namespace bitvec {

/**
 * @ingroup utility
 * @brief Integer types accepted as the right-hand operand of the shift
 * operators of `BitSlice` and `BitVector`.
 */
template<typename N>
concept ShiftAmount = std::unsigned_integral<N> && !std::same_as<N, bool>;

/**
 * @ingroup utility
 * @brief Converts a shift amount of any accepted width to `std::size_t`,
 * the width the shift algorithm is written against.
 *
 * Amounts wider than `std::size_t` that do not fit saturate to the
 * largest `std::size_t`. No container holds that many bits, so the
 * saturated amount clears the target exactly like the original one
 * would have.
 *
 * @param amount Number of bit positions to shift by.
 * @return The same amount as `std::size_t`.
 */
template<ShiftAmount N>
constexpr std::size_t
normalize_shift(N amount) {
  constexpr auto max = std::numeric_limits<std::size_t>::max();
  if constexpr (std::numeric_limits<N>::digits
                > std::numeric_limits<std::size_t>::digits) {
    if (amount > static_cast<N>(max)) {
      if (!std::is_constant_evaluated())
        spdlog::warn("shift amount does not fit in {} bits, saturating",
                     std::numeric_limits<std::size_t>::digits);
      return max;
    }
  }
  return static_cast<std::size_t>(amount);
}

}  // namespace bitvec
