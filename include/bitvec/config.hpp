#pragma once

#include <bitvec/utility/order.hpp>

#define BITVEC_VERSION_MAJOR 0
#define BITVEC_VERSION_MINOR 1
#define BITVEC_VERSION_PATCH 0
#define BITVEC_VERSION                                                       \
  (BITVEC_VERSION_MAJOR * 10000 + BITVEC_VERSION_MINOR * 100                 \
   + BITVEC_VERSION_PATCH)

namespace bitvec {

/**
 * Ordering policy used when none is named.
 */
using DefaultOrder = BigEndian;

/**
 * Storage element used when none is named.
 */
using DefaultElement = std::uint8_t;

}  // namespace bitvec
