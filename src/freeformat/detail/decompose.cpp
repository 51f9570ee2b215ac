#include "../digits.hpp"
#include "ieee.hpp"

namespace freeformat {

decomposed decompose(double value) {
    using namespace detail;
    auto u = bit_cast<uint64_t>(value);
    uint64_t sign = u & Double::kSignMask;
    uint64_t significand = u & Double::kSignificandMask;
    int biased_exponent
        = int((u & Double::kExponentMask) >> Double::kPhysicalSignificandSize);
    if(biased_exponent == Double::kMaxBiasedExponent)
        throw unsupported_value(
            significand != 0 ? "cannot decompose NaN"
                             : "cannot decompose infinity");
    if(biased_exponent == 0 && significand == 0)
        return {0.0, 0};

    int exponent;
    if(biased_exponent == 0) {
        // Subnormal: move the leading one into the hidden bit position.
        int length = bit_length(significand);
        significand <<= Double::kSignificandSize - length;
        significand &= Double::kSignificandMask;
        exponent = length + Double::kDenormalExponent;
    } else {
        exponent = biased_exponent - Double::kFractionBiasedExponent;
    }
    uint64_t fraction_bits = sign
        | (uint64_t(Double::kFractionBiasedExponent)
           << Double::kPhysicalSignificandSize)
        | significand;
    return {bit_cast<double>(fraction_bits), exponent};
}

} // namespace freeformat
