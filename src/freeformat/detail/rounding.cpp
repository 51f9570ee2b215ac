#include "rounding.hpp"

namespace freeformat {

namespace {

bool all_zero(const digit_sequence& digits, unsigned from) noexcept {
    for(unsigned i = from; i < digits.size(); ++i) {
        if(digits[i] != 0)
            return false;
    }
    return true;
}

} // namespace

digit_sequence round(
    const digit_sequence& digits, bool negative, const round_request& request) {
    using kind = round_request::kind;
    if(request.type == kind::none)
        return digits;
    if(request.type == kind::significant && request.precision <= 0)
        return digit_sequence::zero();
    if(request.type == kind::fractional && request.precision < 0)
        throw invalid_request("negative number of fractional digits");

    // Number of digits to keep; zero or less when the kept part is 0.
    long long keep = request.precision;
    if(request.type == kind::fractional)
        keep += digits.place;
    if(keep >= static_cast<long long>(digits.size()))
        return digits;

    // Digits at negative positions are implicit leading zeros.
    unsigned least = keep > 0 ? digits[unsigned(keep - 1)] : 0;
    unsigned tie = keep >= 0 ? digits[unsigned(keep)] : 0;
    unsigned rest = keep >= 0 ? unsigned(keep + 1) : 0;
    bool increment = detail::tiebreak_increments(
        negative, least, tie, all_zero(digits, rest), request.rounding);

    if(keep <= 0) {
        if(!increment)
            return digit_sequence::zero();
        // One unit at the position of the least significant kept digit.
        digit_sequence result;
        result.place = int(digits.place - keep + 1);
        result.add_digit(1);
        return result;
    }

    digit_sequence result = digits;
    result.truncate(unsigned(keep));
    if(increment && result.round_up()) {
        result.truncate(1);
        ++result.place;
    }
    result.strip_trailing_zeros();
    return result;
}

} // namespace freeformat
