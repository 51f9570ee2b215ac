#pragma once
#include <cstdint>

#include "../digits.hpp"

namespace freeformat {
namespace detail {

// Whether dropping digits should increment the least significant kept
// digit. 'least' is that digit, 'tie' the first dropped one and
// 'rest_is_zero' tells whether all further dropped digits are zero.
constexpr bool tiebreak_increments(bool negative, unsigned least, unsigned tie,
    bool rest_is_zero, rounding_mode mode) noexcept {
    const bool inexact = tie != 0 || !rest_is_zero;
    const bool exact_half = tie == 5 && rest_is_zero;
    switch(mode) {
    case rounding_mode::down:
        return false;
    case rounding_mode::up:
        return inexact;
    case rounding_mode::ceiling:
        return !negative && inexact;
    case rounding_mode::floor:
        return negative && inexact;
    case rounding_mode::half_up:
        return tie >= 5;
    case rounding_mode::half_down:
        return tie >= 5 && !exact_half;
    case rounding_mode::half_even:
        return tie >= 5 && !(exact_half && least % 2 == 0);
    }
    return false;
}

} // namespace detail
} // namespace freeformat
