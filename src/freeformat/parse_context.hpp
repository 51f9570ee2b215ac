#pragma once
#include <cassert>
#include <string_view>

namespace freeformat {

// Cursor over an option string. The first error is recorded, not thrown,
// and ends the input; the caller decides how to report it.
class parse_context {
public:
    explicit parse_context(std::string_view text) noexcept : rest_(text) {
    }

    bool eof() const noexcept {
        return rest_.empty();
    }
    bool fail() const noexcept {
        return error_ != nullptr;
    }
    const char* error() const noexcept {
        return error_;
    }
    void on_error(const char* error) noexcept {
        if(!error_)
            error_ = error;
        rest_ = {};
    }

    bool is_char(char c) const noexcept {
        return !rest_.empty() && rest_.front() == c;
    }
    bool is_decimal_digit() const noexcept {
        return !rest_.empty() && rest_.front() >= '0' && rest_.front() <= '9';
    }
    bool consume(char c) noexcept {
        if(!is_char(c))
            return false;
        rest_.remove_prefix(1);
        return true;
    }
    char consume_char() noexcept {
        assert(!rest_.empty());
        char c = rest_.front();
        rest_.remove_prefix(1);
        return c;
    }
    // Consumes the longest prefix whose characters all satisfy pred.
    template<class Pred>
    std::string_view consume_while(Pred pred) {
        size_t length = 0;
        while(length < rest_.size() && pred(rest_[length]))
            ++length;
        auto result = rest_.substr(0, length);
        rest_.remove_prefix(length);
        return result;
    }

private:
    std::string_view rest_;
    const char* error_ = nullptr;
};

} // namespace freeformat
