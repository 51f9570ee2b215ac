#pragma once
#include <cstdint>

#include "../digits.hpp"

namespace freeformat {
namespace detail {

// Shortest digits of value == significand * 2^exponent, where significand
// is the stored significand (hidden bit included for normal numbers) and
// exponent is at least Double::kDenormalExponent. value is only used to
// estimate the decimal exponent.
digit_sequence generate_shortest(
    double value, uint64_t significand, int exponent);

} // namespace detail
} // namespace freeformat
