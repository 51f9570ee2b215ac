#pragma once
#include <cstdint>
#include <cstring>

namespace freeformat {
namespace detail {

template<typename Dest, typename Source>
inline Dest bit_cast(const Source& source) {
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");
    Dest dest;
    std::memcpy(&dest, &source, sizeof(dest));
    return dest;
}

namespace Double {
constexpr const uint64_t kSignMask = 0x8000000000000000ull;
constexpr const uint64_t kSignificandMask = 0x000fffffffffffffull;
constexpr const uint64_t kExponentMask = 0x7ff0000000000000ull;
constexpr const uint64_t kHiddenBit = 0x0010000000000000ull;
constexpr const int kSignificandSize = 53;
// Excludes the hidden bit.
constexpr const int kPhysicalSignificandSize = 52;
constexpr const int kExponentBias = 0x3FF + kPhysicalSignificandSize;
constexpr const int kDenormalExponent = -kExponentBias + 1;
// Stored exponent of infinities and NaNs.
constexpr const int kMaxBiasedExponent = 0x7FF;
// Stored exponent of a double in [1/2, 1).
constexpr const int kFractionBiasedExponent = 0x3FE;
} // namespace Double

inline int bit_length(uint64_t value) noexcept {
    int length = 0;
    while(value != 0) {
        value >>= 1;
        ++length;
    }
    return length;
}

} // namespace detail
} // namespace freeformat
