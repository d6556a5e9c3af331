#pragma once

#include <bitvec/config.hpp>
#include <bitvec/container/bit_slice.hpp>
#include <bitvec/container/bit_vector.hpp>
#include <bitvec/utility/bits.hpp>
#include <bitvec/utility/make.hpp>
#include <bitvec/utility/order.hpp>
#include <bitvec/utility/shift.hpp>
