#pragma once
#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>

namespace freeformat {

// Destination of printed numbers. The caller reserves room with ensure()
// and then emits characters with the put_* calls, which do not check the
// capacity. The base class writes into a fixed array and throws
// std::length_error once it is full.
class print_context {
public:
    print_context(char* data, size_t capacity, size_t size = 0) noexcept
        : data_(data), capacity_(capacity), size_(size) {
        assert(size <= capacity);
    }
    print_context(const print_context&) = delete;
    print_context& operator=(const print_context&) = delete;
    virtual ~print_context() = default;

    void ensure(size_t count) {
        if(capacity_ - size_ < count)
            grow(size_ + count);
    }
    void put(char c) noexcept {
        assert(size_ < capacity_);
        data_[size_++] = c;
    }
    void put_digit(unsigned digit) noexcept {
        assert(digit <= 9);
        put(char('0' + digit));
    }
    void put_zeros(size_t count) noexcept {
        assert(count <= capacity_ - size_);
        std::memset(data_ + size_, '0', count);
        size_ += count;
    }
    // Decimal value, left padded with zeros to min_width digits.
    void put_number(unsigned value, unsigned min_width) noexcept {
        char buffer[10];
        unsigned pos = sizeof(buffer);
        do {
            buffer[--pos] = char('0' + value % 10);
            value /= 10;
        } while(value != 0);
        unsigned length = sizeof(buffer) - pos;
        if(length < min_width)
            put_zeros(min_width - length);
        assert(length <= capacity_ - size_);
        std::memcpy(data_ + size_, buffer + pos, length);
        size_ += length;
    }
    // Checked append of arbitrary text between printed numbers.
    void write(std::string_view text) {
        ensure(text.size());
        std::memcpy(data_ + size_, text.data(), text.size());
        size_ += text.size();
    }

    size_t size() const noexcept {
        return size_;
    }
    std::string_view str() const noexcept {
        return {data_, size_};
    }

protected:
    // Must provide room for at least 'required' characters or throw.
    virtual void grow(size_t required) {
        (void)required;
        throw std::length_error("print_context capacity exceeded");
    }
    void rebind(char* data, size_t capacity) noexcept {
        assert(size_ <= capacity);
        data_ = data;
        capacity_ = capacity;
    }

private:
    char* data_;
    size_t capacity_;
    size_t size_;
};

// Appends to a std::string. The string is resized ahead of the writes and
// trimmed back to the text on finalize() or destruction.
class string_print_context final : public print_context {
public:
    explicit string_print_context(std::string& str)
        : print_context(str.data(), str.size(), str.size()), str_(str) {
    }
    ~string_print_context() override {
        finalize();
    }
    void finalize() {
        str_.resize(size());
    }

protected:
    void grow(size_t required) override {
        str_.resize((std::max)(required, 2 * str_.size()));
        rebind(str_.data(), str_.size());
    }

private:
    std::string& str_;
};

} // namespace freeformat
