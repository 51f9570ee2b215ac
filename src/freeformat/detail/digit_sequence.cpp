#include <algorithm>
#include <stdexcept>

#include "../digits.hpp"

namespace freeformat {

digit_sequence digit_sequence::from_string(int place, std::string_view digits) {
    if(digits.empty())
        throw invalid_request("digit string is empty");
    digit_sequence result;
    result.place = place;
    for(char c : digits) {
        if(c < '0' || c > '9')
            throw invalid_request("digit string contains a non-digit");
        result.add_digit(unsigned(c - '0'));
    }
    return result;
}

void digit_sequence::add_digit(unsigned digit) {
    assert(digit <= 9);
    if(digit_count == max_digits)
        throw std::length_error("digit_sequence capacity exceeded");
    digits[digit_count++] = uint8_t(digit);
}

bool digit_sequence::round_up() noexcept {
    assert(digit_count > 0);
    for(unsigned i = digit_count; i-- > 0;) {
        if(digits[i] != 9) {
            ++digits[i];
            return false;
        }
        digits[i] = 0;
    }
    // All nines: 99..9 + 1 == 100..0.
    digits[0] = 1;
    return true;
}

std::string digit_sequence::str() const {
    std::string result(digit_count, '0');
    for(unsigned i = 0; i < digit_count; ++i)
        result[i] = char('0' + digits[i]);
    return result;
}

bool operator==(const digit_sequence& a, const digit_sequence& b) {
    return a.place == b.place && a.digit_count == b.digit_count
        && std::equal(a.digits, a.digits + a.digit_count, b.digits);
}

} // namespace freeformat
