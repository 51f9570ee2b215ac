#include <gtest/gtest.h>

#include <cmath>
#include <cstdlib>
#include <limits>
#include <random>
#include <string>

#include <freeformat/detail/ieee.hpp>
#include <freeformat/detail/power_of_ten.hpp>
#include <freeformat/digits.hpp>

namespace ff = freeformat;
using ff::detail::big_integer;

namespace {

double from_bits(uint64_t bits) {
    return ff::detail::bit_cast<double>(bits);
}

std::string describe(const ff::digit_sequence& digits) {
    return digits.str() + "@" + std::to_string(digits.place);
}

// Reads "0.<digits>e<place>" back with strtod.
double parse_back(const ff::digit_sequence& digits) {
    std::string text = "0." + digits.str() + "e" + std::to_string(digits.place);
    return std::strtod(text.c_str(), nullptr);
}

} // namespace

TEST(DecomposeTest, Golden) {
    auto check = [](double value, double fraction, int exponent) {
        auto parts = ff::decompose(value);
        EXPECT_EQ(fraction, parts.fraction) << value;
        EXPECT_EQ(exponent, parts.exponent) << value;
    };
    check(1.0, 0.5, 1);
    check(-1.0, -0.5, 1);
    check(0.1, 0.8, -3);
    check(from_bits(1), 0.5, -1073);
    check(from_bits(0x000fffffffffffffull), 1 - std::ldexp(1.0, -52), -1022);
    check(std::numeric_limits<double>::min(), 0.5, -1021);
    check(std::numeric_limits<double>::max(), 1 - std::ldexp(1.0, -53), 1024);
    check(0.0, 0.0, 0);
    check(-0.0, 0.0, 0);
}

TEST(DecomposeTest, NonFinite) {
    EXPECT_THROW(
        ff::decompose(std::numeric_limits<double>::infinity()),
        ff::unsupported_value);
    EXPECT_THROW(
        ff::decompose(-std::numeric_limits<double>::infinity()),
        ff::unsupported_value);
    EXPECT_THROW(
        ff::decompose(std::numeric_limits<double>::quiet_NaN()),
        ff::unsupported_value);
}

TEST(DecomposeTest, MatchesFrexp) {
    std::mt19937_64 rng(20240611);
    for(int i = 0; i < 10000; ++i) {
        double value = from_bits(rng());
        if(!std::isfinite(value))
            continue;
        int exponent;
        double fraction = std::frexp(value, &exponent);
        auto parts = ff::decompose(value);
        ASSERT_EQ(fraction, parts.fraction) << value;
        ASSERT_EQ(exponent, parts.exponent) << value;
        ASSERT_EQ(value, std::ldexp(parts.fraction, parts.exponent));
    }
}

TEST(PowerOfTenTest, Table) {
    using ff::detail::power_of_ten;
    EXPECT_EQ(big_integer(1), power_of_ten(0));
    EXPECT_EQ(big_integer(10000000000000000000ull), power_of_ten(19));
    EXPECT_EQ("1" + std::string(100, '0'), power_of_ten(100).str());
    EXPECT_EQ(big_integer(power_of_ten(325) * 10), power_of_ten(326));
    EXPECT_EQ(big_integer(10), big_integer(power_of_ten(326) / power_of_ten(325)));
    EXPECT_EQ(big_integer(0), big_integer(power_of_ten(326) % power_of_ten(325)));
    EXPECT_EQ(
        big_integer(power_of_ten(300) * power_of_ten(19)), power_of_ten(319));

    // 2^100 lies between 10^30 and 10^31.
    big_integer two_100 = big_integer(1) << 100;
    EXPECT_GT(two_100, power_of_ten(30));
    EXPECT_LT(two_100, power_of_ten(31));

    EXPECT_THROW(power_of_ten(327), std::out_of_range);
    EXPECT_THROW(power_of_ten(-1), std::out_of_range);
}

TEST(PowerOfTenTest, SameTableEveryCall) {
    EXPECT_EQ(
        &ff::detail::power_of_ten(42), &ff::detail::power_of_ten(42));
}

TEST(DigitsTest, Golden) {
    EXPECT_EQ(ff::digit_sequence::zero(), ff::digits_of(0.0));
    EXPECT_EQ(ff::digit_sequence::zero(), ff::digits_of(-0.0));
    EXPECT_EQ("0@1", describe(ff::digits_of(0.0)));
    EXPECT_EQ("1@1", describe(ff::digits_of(1.0)));
    EXPECT_EQ("1@1", describe(ff::digits_of(-1.0)));
    EXPECT_EQ("1@0", describe(ff::digits_of(0.1)));
    EXPECT_EQ("3@0", describe(ff::digits_of(0.3)));
    EXPECT_EQ("12@1", describe(ff::digits_of(1.2)));
    EXPECT_EQ("123456@3", describe(ff::digits_of(123.456)));
    EXPECT_EQ("1@24", describe(ff::digits_of(1e23)));
    EXPECT_EQ("9007199254740992@16", describe(ff::digits_of(9007199254740992.0)));
}

TEST(DigitsTest, Extremes) {
    EXPECT_EQ("5@-323", describe(ff::digits_of(from_bits(1))));
    EXPECT_EQ("15@-322", describe(ff::digits_of(1.5e-323)));
    EXPECT_EQ(
        "2225073858507201@-307",
        describe(ff::digits_of(from_bits(0x000fffffffffffffull))));
    EXPECT_EQ(
        "22250738585072014@-307",
        describe(ff::digits_of(std::numeric_limits<double>::min())));
    EXPECT_EQ(
        "11125369292536007@-307",
        describe(ff::digits_of(std::numeric_limits<double>::min() / 2)));
    EXPECT_EQ(
        "17976931348623157@309",
        describe(ff::digits_of(std::numeric_limits<double>::max())));
}

TEST(DigitsTest, PowersOfTwo) {
    EXPECT_EQ("898846567431158@308", describe(ff::digits_of(std::ldexp(1.0, 1023))));
    EXPECT_EQ("9223372036854776@19", describe(ff::digits_of(std::ldexp(1.0, 63))));
    EXPECT_EQ("5@0", describe(ff::digits_of(0.5)));
    EXPECT_EQ("1024@4", describe(ff::digits_of(1024.0)));
}

TEST(DigitsTest, NonFinite) {
    EXPECT_THROW(
        ff::digits_of(std::numeric_limits<double>::infinity()),
        ff::unsupported_value);
    EXPECT_THROW(
        ff::digits_of(std::numeric_limits<double>::quiet_NaN()),
        ff::unsupported_value);
}

TEST(DigitsTest, RoundTripAndShortest) {
    std::mt19937_64 rng(1234567);
    for(int i = 0; i < 20000; ++i) {
        double value = std::fabs(from_bits(rng()));
        if(!std::isfinite(value) || value == 0)
            continue;
        auto digits = ff::digits_of(value);
        ASSERT_GE(digits.size(), 1u);
        ASSERT_LE(digits.size(), 17u);
        ASSERT_NE(0, digits[0]) << value;
        ASSERT_NE(0, digits.last_digit()) << value;
        ASSERT_EQ(value, parse_back(digits)) << describe(digits);

        if(digits.size() == 1)
            continue;
        // Neither neighbour with one digit less reads back as the value.
        auto shorter = int(digits.size()) - 1;
        auto below = ff::round(
            digits, false,
            ff::round_request::significant(shorter, ff::rounding_mode::down));
        auto above = ff::round(
            digits, false,
            ff::round_request::significant(shorter, ff::rounding_mode::up));
        ASSERT_NE(value, parse_back(below)) << describe(digits);
        ASSERT_NE(value, parse_back(above)) << describe(digits);
    }
}

TEST(DigitSequenceTest, FromString) {
    auto digits = ff::digit_sequence::from_string(3, "1205");
    EXPECT_EQ(4u, digits.size());
    EXPECT_EQ(3, digits.place);
    EXPECT_EQ("1205", digits.str());
    EXPECT_EQ(5, digits.last_digit());
    EXPECT_THROW(ff::digit_sequence::from_string(1, ""), ff::invalid_request);
    EXPECT_THROW(ff::digit_sequence::from_string(1, "12a"), ff::invalid_request);
    EXPECT_THROW(
        ff::digit_sequence::from_string(1, std::string(33, '1')),
        std::length_error);
}

TEST(DigitSequenceTest, RoundUp) {
    auto digits = ff::digit_sequence::from_string(1, "199");
    EXPECT_FALSE(digits.round_up());
    EXPECT_EQ("200", digits.str());
    digits.strip_trailing_zeros();
    EXPECT_EQ("2", digits.str());

    auto nines = ff::digit_sequence::from_string(1, "999");
    EXPECT_TRUE(nines.round_up());
    EXPECT_EQ("100", nines.str());
}
