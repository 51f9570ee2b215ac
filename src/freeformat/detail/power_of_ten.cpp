#include "power_of_ten.hpp"

#include <stdexcept>
#include <string>

namespace freeformat {
namespace detail {

namespace {

class power_of_ten_table {
public:
    power_of_ten_table() {
        powers_[0] = 1;
        for(int i = 1; i <= kMaxPowerOfTen; ++i)
            powers_[i] = powers_[i - 1] * 10;
    }
    const big_integer& operator[](int exponent) const noexcept {
        return powers_[exponent];
    }

private:
    big_integer powers_[kMaxPowerOfTen + 1];
};

} // namespace

const big_integer& power_of_ten(int exponent) {
    if(exponent < 0 || exponent > kMaxPowerOfTen)
        throw std::out_of_range(
            "power of ten out of table range: " + std::to_string(exponent));
    static const power_of_ten_table table;
    return table[exponent];
}

} // namespace detail
} // namespace freeformat
