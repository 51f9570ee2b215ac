#pragma once
#include <cassert>
#include <cstdint>
#include <string>
#include <string_view>

#include "errors.hpp"

namespace freeformat {

// Rounding disciplines. The directed ones are relative to zero (down, up)
// or to the number line (ceiling, floor); the half_* ones round to nearest
// and differ only on exact ties.
enum class rounding_mode : char {
    down,
    up,
    ceiling,
    floor,
    half_up,
    half_down,
    half_even
};

// value == fraction * 2^exponent with |fraction| in [1/2, 1), or both zero.
struct decomposed {
    double fraction;
    int exponent;
};

// Decimal digits d1 d2 ... dn of the value 0.d1d2...dn * 10^place, most
// significant first. Sequences produced by this library carry no trailing
// zeros; zero itself is the single digit 0 at place 1.
struct digit_sequence {
    constexpr const static unsigned max_digits = 32;

    static digit_sequence zero() {
        digit_sequence result;
        result.place = 1;
        result.add_digit(0);
        return result;
    }
    // Builds a sequence from '0'..'9' characters; throws invalid_request on
    // anything else.
    static digit_sequence from_string(int place, std::string_view digits);

    int place = 0;
    unsigned digit_count = 0;
    uint8_t digits[max_digits] = {};

    unsigned size() const noexcept {
        return digit_count;
    }
    bool empty() const noexcept {
        return digit_count == 0;
    }
    uint8_t operator[](unsigned pos) const noexcept {
        assert(pos < digit_count);
        return digits[pos];
    }
    uint8_t last_digit() const noexcept {
        return (*this)[digit_count - 1];
    }
    bool is_zero() const noexcept {
        return digit_count == 1 && digits[0] == 0;
    }
    void add_digit(unsigned digit);
    void truncate(unsigned count) noexcept {
        assert(count <= digit_count);
        digit_count = count;
    }
    void strip_trailing_zeros() noexcept {
        while(digit_count > 1 && digits[digit_count - 1] == 0)
            --digit_count;
    }
    // Adds one unit in the last place and propagates the carry. Returns
    // true in case of 999 -> 1000, where the sequence becomes 1000 with the
    // same place; the caller moves the decimal point.
    bool round_up() noexcept;

    // The digits as '0'..'9' characters, without the place.
    std::string str() const;

    friend bool operator==(const digit_sequence& a, const digit_sequence& b);
    friend bool operator!=(const digit_sequence& a, const digit_sequence& b) {
        return !(a == b);
    }
};

// What the rounding engine should do with a digit sequence.
struct round_request {
    enum class kind : char { none, fractional, significant };

    kind type = kind::none;
    int precision = 0;
    rounding_mode rounding = rounding_mode::half_even;

    static constexpr round_request none() noexcept {
        return {};
    }
    // Keep 'places' digits after the decimal point.
    static constexpr round_request fractional(
        int places, rounding_mode mode) noexcept {
        return {kind::fractional, places, mode};
    }
    // Keep 'count' significant digits.
    static constexpr round_request significant(
        int count, rounding_mode mode) noexcept {
        return {kind::significant, count, mode};
    }
};

// Splits a double into a binary fraction and exponent (like std::frexp).
// Throws unsupported_value for infinities and NaNs.
decomposed decompose(double value);

// Shortest digit sequence that reads back as exactly 'value'. The sign is
// ignored. Throws unsupported_value for infinities and NaNs.
digit_sequence digits_of(double value);

// Re-quantizes 'digits' as requested. 'negative' is the sign of the printed
// value; ceiling and floor depend on it. Throws invalid_request for a
// negative fractional precision.
digit_sequence round(
    const digit_sequence& digits, bool negative, const round_request& request);

} // namespace freeformat
