#pragma once
#include <boost/multiprecision/cpp_int.hpp>

namespace freeformat {
namespace detail {

using big_integer = boost::multiprecision::cpp_int;

// Largest exponent the digit generator ever scales by: 10^-323 is the
// magnitude of the smallest subnormal, 10^308 of the largest normal.
constexpr const int kMaxPowerOfTen = 326;

// Exact 10^exponent for exponent in [0, kMaxPowerOfTen]. The table is built
// on first use and is read-only afterwards. Throws std::out_of_range for any
// other exponent.
const big_integer& power_of_ten(int exponent);

} // namespace detail
} // namespace freeformat
