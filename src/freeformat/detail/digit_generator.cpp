#include "digit_generator.hpp"

#include <cmath>

#include "ieee.hpp"
#include "power_of_ten.hpp"

namespace freeformat {
namespace detail {

namespace {

// value == r / s. The rounding range of value is (value - m_minus / s,
// value + m_plus / s); its ends belong to it when low_ok / high_ok is set.
struct scaled_state {
    big_integer r;
    big_integer s;
    big_integer m_plus;
    big_integer m_minus;
    bool low_ok = false;
    bool high_ok = false;

    bool low_reached() const {
        return low_ok ? r <= m_minus : r < m_minus;
    }
    bool high_reached() const {
        big_integer high = r + m_plus;
        return high_ok ? high >= s : high > s;
    }
    void times_10() {
        r *= 10;
        m_plus *= 10;
        m_minus *= 10;
    }
};

// Sets up r, s, m_plus and m_minus so that r / s == significand * 2^exponent
// and both boundaries are integers, then scales them by 10^estimate.
void init_scaled_state(
    scaled_state& state, uint64_t significand, int exponent, int estimate) {
    // Below a power of two the gap to the next lower double is half as
    // wide, except at the smallest exponent where subnormals keep the gap.
    bool asymmetric = significand == Double::kHiddenBit
        && exponent != Double::kDenormalExponent;
    int r_shift, s_shift, plus_shift, minus_shift;
    if(exponent >= 0) {
        r_shift = exponent + (asymmetric ? 2 : 1);
        s_shift = asymmetric ? 2 : 1;
        plus_shift = exponent + (asymmetric ? 1 : 0);
        minus_shift = exponent;
    } else {
        r_shift = asymmetric ? 2 : 1;
        s_shift = (asymmetric ? 2 : 1) - exponent;
        plus_shift = asymmetric ? 1 : 0;
        minus_shift = 0;
    }

    const big_integer one = 1;
    if(estimate >= 0) {
        state.r = big_integer(significand) << r_shift;
        state.s = power_of_ten(estimate) << s_shift;
        state.m_plus = one << plus_shift;
        state.m_minus = one << minus_shift;
    } else {
        const big_integer& scale = power_of_ten(-estimate);
        state.r = (scale * significand) << r_shift;
        state.s = one << s_shift;
        state.m_plus = scale << plus_shift;
        state.m_minus = scale << minus_shift;
    }
    state.low_ok = state.high_ok = (significand & 1) == 0;
}

// First guess of the decimal exponent: either the place of the leading digit
// or one less.
int estimate_power(double value) {
    return int(std::ceil(std::log10(std::fabs(value)) - 1e-10));
}

} // namespace

digit_sequence generate_shortest(
    double value, uint64_t significand, int exponent) {
    assert(significand != 0);
    assert(exponent >= Double::kDenormalExponent);

    scaled_state state;
    int estimate = estimate_power(value);
    init_scaled_state(state, significand, exponent, estimate);

    digit_sequence result;
    if(state.high_reached()) {
        result.place = estimate + 1;
    } else {
        result.place = estimate;
        state.times_10();
    }

    big_integer quotient, remainder;
    for(;;) {
        // r < 10 * s here, so the quotient is a single digit.
        boost::multiprecision::divide_qr(state.r, state.s, quotient, remainder);
        state.r.swap(remainder);
        auto digit = quotient.convert_to<unsigned>();
        assert(digit <= 9);
        bool low = state.low_reached();
        bool high = state.high_reached();
        if(!low && !high) {
            result.add_digit(digit);
            state.times_10();
            continue;
        }
        if(low && high) {
            // Both neighbours read back as value; take the nearer one, the
            // upper one on a tie.
            if(2 * state.r >= state.s)
                ++digit;
        } else if(high) {
            ++digit;
        }
        assert(digit <= 9);
        result.add_digit(digit);
        return result;
    }
}

} // namespace detail

digit_sequence digits_of(double value) {
    using namespace detail;
    decomposed parts = decompose(value);
    if(parts.fraction == 0)
        return digit_sequence::zero();

    // |fraction| * 2^53 is an integer for every double.
    auto significand = uint64_t(std::ldexp(std::fabs(parts.fraction),
        Double::kSignificandSize));
    int exponent = parts.exponent - Double::kSignificandSize;
    if(exponent < Double::kDenormalExponent) {
        // Subnormal: the decomposer normalized the significand; shift it
        // back so that it counts units of the smallest subnormal.
        significand >>= Double::kDenormalExponent - exponent;
        exponent = Double::kDenormalExponent;
    }
    return generate_shortest(value, significand, exponent);
}

} // namespace freeformat
