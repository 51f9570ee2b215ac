#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "digits.hpp"
#include "errors.hpp"
#include "print_context.hpp"

namespace freeformat {

enum class notation : char { decimal, scientific };

struct print_options {
    notation style = notation::decimal;
    // Digits after the decimal point. Decimal notation only.
    std::optional<int> decimals;
    // Significant digits. Implies scientific notation.
    std::optional<int> scientific;
    // When false the requested number of digits is always written, padded
    // with zeros.
    bool compact = true;
    rounding_mode rounding = rounding_mode::half_even;
    // '-': only negative values are signed, '+': all values, ' ': a space
    // in place of '+'.
    char sign = '-';
    bool uppercase = false;
};

// "down", "up", "ceiling", "floor", "half_up", "half_down", "half_even".
std::string_view rounding_name(rounding_mode mode) noexcept;
// Inverse of rounding_name. Throws invalid_request for unknown names.
rounding_mode parse_rounding(std::string_view name);

// option_string ::= [sign]["#"]["." precision][type]["~" rounding]
//   sign      ::= "-" | "+" | " "
//   "#"       pads the output to the requested number of digits
//   type      ::= "f" | "e" | "E"
// A precision counts digits after the point for "f" (also the default with
// a precision) and significant digits for "e". Throws invalid_request.
print_options parse_options(std::string_view option_string);

// Checks the options and returns the rounding they ask for. Throws
// invalid_request.
round_request make_round_request(const print_options& options);

// Appends value to out. Throws invalid_request for bad options and
// unsupported_value for infinities and NaNs.
void print(print_context& out, double value, const print_options& options);

inline void print(print_context& out, double value) {
    print(out, value, print_options());
}

std::string to_string(double value, const print_options& options);
std::string to_string(double value, std::string_view option_string);

inline std::string to_string(double value) {
    return to_string(value, print_options());
}

// Writes into a fixed array, no terminating zero. Throws std::length_error
// when the text does not fit.
template<size_t Size>
size_t print_to(
    char (&arr)[Size], double value,
    const print_options& options = print_options()) {
    print_context out(arr, Size);
    print(out, value, options);
    return out.size();
}

} // namespace freeformat
