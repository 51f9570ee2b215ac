#include <iterator>
#include <limits>

#include "../freeformat.hpp"
#include "../parse_context.hpp"

namespace freeformat {

namespace {

constexpr std::string_view rounding_names[] = {
    "down", "up", "ceiling", "floor", "half_up", "half_down", "half_even"};

bool lookup_rounding(std::string_view name, rounding_mode& mode) noexcept {
    for(size_t i = 0; i < std::size(rounding_names); ++i) {
        if(rounding_names[i] == name) {
            mode = rounding_mode(i);
            return true;
        }
    }
    return false;
}

int parse_precision(parse_context& parser) {
    if(!parser.is_decimal_digit()) {
        parser.on_error("missing precision after '.'");
        return 0;
    }
    constexpr int max_value = std::numeric_limits<int>::max();
    int result = 0;
    while(parser.is_decimal_digit()) {
        int digit = parser.consume_char() - '0';
        if(result > (max_value - digit) / 10) {
            parser.on_error("precision is too large");
            return 0;
        }
        result = result * 10 + digit;
    }
    return result;
}

bool parse_print_options(parse_context& parser, print_options& options) {
    if(parser.is_char('+') || parser.is_char('-') || parser.is_char(' '))
        options.sign = parser.consume_char();
    if(parser.consume('#'))
        options.compact = false;
    std::optional<int> precision;
    if(parser.consume('.')) {
        precision = parse_precision(parser);
        if(parser.fail())
            return false;
    }
    if(parser.is_char('e') || parser.is_char('E')) {
        options.uppercase = parser.consume_char() == 'E';
        options.style = notation::scientific;
        options.scientific = precision;
    } else {
        parser.consume('f');
        options.decimals = precision;
    }
    if(parser.consume('~')) {
        auto name = parser.consume_while(
            [](char c) { return (c >= 'a' && c <= 'z') || c == '_'; });
        if(!lookup_rounding(name, options.rounding)) {
            parser.on_error("unknown rounding mode");
            return false;
        }
    }
    if(!parser.eof()) {
        parser.on_error("invalid option string");
        return false;
    }
    return true;
}

} // namespace

std::string_view rounding_name(rounding_mode mode) noexcept {
    auto index = size_t(mode);
    return index < std::size(rounding_names) ? rounding_names[index]
                                             : std::string_view();
}

rounding_mode parse_rounding(std::string_view name) {
    rounding_mode mode;
    if(!lookup_rounding(name, mode))
        throw invalid_request("unknown rounding mode");
    return mode;
}

print_options parse_options(std::string_view option_string) {
    print_options options;
    parse_context parser(option_string);
    if(!parse_print_options(parser, options))
        throw invalid_request(parser.error());
    return options;
}

round_request make_round_request(const print_options& options) {
    if(options.sign != '-' && options.sign != '+' && options.sign != ' ')
        throw invalid_request("sign must be '-', '+' or ' '");
    if(options.decimals) {
        if(options.scientific)
            throw invalid_request(
                "decimals and scientific digits are mutually exclusive");
        if(options.style == notation::scientific)
            throw invalid_request("decimals require decimal notation");
        if(*options.decimals < 0)
            throw invalid_request("negative number of decimals");
        return round_request::fractional(*options.decimals, options.rounding);
    }
    if(options.scientific)
        return round_request::significant(
            *options.scientific, options.rounding);
    return round_request::none();
}

} // namespace freeformat
