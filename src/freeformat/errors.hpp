#pragma once
#include <stdexcept>

namespace freeformat {

// Thrown for infinities and NaNs, which have no decimal digits.
class unsupported_value : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

// Thrown for option combinations and precisions that cannot be honored.
class invalid_request : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace freeformat
