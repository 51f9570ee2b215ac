#include <algorithm>
#include <cmath>
#include <cstdlib>

#include "../freeformat.hpp"

namespace freeformat {
namespace {

struct double_print_options {
    bool write_exponent_plus;
    // 0 => "42", 1 = "42.", 2 = "42.0"
    unsigned zero_decimal_fraction;
    unsigned min_exponent_width;
};

constexpr double_print_options print_format{
    true, // write_exponent_plus
    2,    // zero_decimal_fraction
    2     // min_exponent_width
};

// Rounded digits of the value and the layout chosen for them.
struct printed_double {
    digit_sequence digits;
    char sign = 0;
    bool uppercase = false;
    bool as_exponent = false;
    // Decimal: digits after the point. Scientific: digits after the first.
    unsigned fraction_digits = 0;

    int exponent() const noexcept {
        return digits.is_zero() ? 0 : digits.place - 1;
    }
};

unsigned exponent_digit_count(int exponent) {
    unsigned result = 0;
    for(unsigned e = unsigned(std::abs(exponent)); e > 0; e /= 10)
        ++result;
    return (std::max)(result, print_format.min_exponent_width);
}

unsigned exponent_print_size(const printed_double& dbl) {
    unsigned result = 1;
    if(dbl.fraction_digits != 0)
        result += 1 + dbl.fraction_digits;
    else
        result += print_format.zero_decimal_fraction;
    int exponent = dbl.exponent();
    result += 1; // 'e'
    if(exponent < 0 || print_format.write_exponent_plus)
        ++result;
    return result + exponent_digit_count(exponent);
}

void print_exponent(print_context& out, const printed_double& dbl) {
    const auto& digits = dbl.digits;
    assert(!digits.empty());
    out.put_digit(digits[0]);
    if(dbl.fraction_digits != 0) {
        out.put('.');
        for(unsigned i = 1; i < digits.size(); ++i)
            out.put_digit(digits[i]);
        assert(digits.size() - 1 <= dbl.fraction_digits);
        out.put_zeros(dbl.fraction_digits - (digits.size() - 1));
    } else if(print_format.zero_decimal_fraction != 0) {
        out.put('.');
        if(print_format.zero_decimal_fraction > 1)
            out.put('0');
    }
    out.put(dbl.uppercase ? 'E' : 'e');
    int exponent = dbl.exponent();
    if(exponent < 0)
        out.put('-');
    else if(print_format.write_exponent_plus)
        out.put('+');
    out.put_number(
        unsigned(std::abs(exponent)), print_format.min_exponent_width);
}

unsigned decimal_print_size(const printed_double& dbl) {
    int place = dbl.digits.place;
    unsigned result = place <= 0 ? 1 : unsigned(place);
    if(dbl.fraction_digits != 0)
        result += 1 + dbl.fraction_digits;
    else
        result += print_format.zero_decimal_fraction;
    return result;
}

void print_decimal(print_context& out, const printed_double& dbl) {
    const auto& digits = dbl.digits;
    const int place = digits.place;
    const unsigned count = digits.size();
    unsigned next = 0;
    if(place <= 0) {
        out.put('0');
    } else {
        // "digits0000" before the point.
        for(; next < count && int(next) < place; ++next)
            out.put_digit(digits[next]);
        out.put_zeros(unsigned(place) - next);
    }
    if(dbl.fraction_digits == 0) {
        if(print_format.zero_decimal_fraction != 0) {
            out.put('.');
            if(print_format.zero_decimal_fraction > 1)
                out.put('0');
        }
        return;
    }
    // ".0000digits000" after it.
    out.put('.');
    unsigned written = 0;
    if(place < 0) {
        out.put_zeros(unsigned(-place));
        written = unsigned(-place);
    }
    for(; next < count; ++next, ++written)
        out.put_digit(digits[next]);
    assert(written <= dbl.fraction_digits);
    out.put_zeros(dbl.fraction_digits - written);
}

void layout_decimal(printed_double& dbl, const print_options& options) {
    int place = dbl.digits.place;
    int count = int(dbl.digits.size());
    unsigned fraction = unsigned((std::max)(count - place, 0));
    if(!options.compact && options.decimals)
        fraction = (std::max)(fraction, unsigned(*options.decimals));
    dbl.fraction_digits = fraction;
}

void layout_exponent(printed_double& dbl, const print_options& options) {
    unsigned significant = dbl.digits.size();
    if(!options.compact && options.scientific && *options.scientific > 0)
        significant = (std::max)(significant, unsigned(*options.scientific));
    dbl.fraction_digits = significant - 1;
    dbl.as_exponent = true;
}

} // namespace

void print(print_context& out, double value, const print_options& options) {
    auto request = make_round_request(options);
    bool negative = std::signbit(value);

    printed_double dbl;
    dbl.digits = round(digits_of(value), negative, request);
    dbl.sign = negative ? '-' : (options.sign == '-' ? 0 : options.sign);
    dbl.uppercase = options.uppercase;
    if(options.style == notation::scientific || options.scientific)
        layout_exponent(dbl, options);
    else
        layout_decimal(dbl, options);

    auto size = dbl.as_exponent ? exponent_print_size(dbl)
                                : decimal_print_size(dbl);
    if(dbl.sign)
        ++size;
    out.ensure(size);
    if(dbl.sign)
        out.put(dbl.sign);
    if(dbl.as_exponent)
        print_exponent(out, dbl);
    else
        print_decimal(out, dbl);
}

std::string to_string(double value, const print_options& options) {
    std::string str;
    string_print_context out(str);
    print(out, value, options);
    out.finalize();
    return str;
}

std::string to_string(double value, std::string_view option_string) {
    return to_string(value, parse_options(option_string));
}

} // namespace freeformat
