//! # Numeric Text Implementation
//!
//! Grammar validation is done by hand before any conversion so that the
//! standard library parsers never see input they would interpret more
//! leniently (leading `+`, whitespace, `inf`, hex floats).

#include "tnet/number.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <system_error>

namespace tnet {

namespace {

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto type_error(std::string msg, size_t offset) -> Error {
    return Error::make(ErrorKind::Type, std::move(msg), offset);
}

/// Consumes a run of digits starting at `pos`; returns the count consumed.
auto skip_digits(std::string_view text, size_t& pos) -> size_t {
    size_t start = pos;
    while (pos < text.size() && is_digit(text[pos])) {
        ++pos;
    }
    return pos - start;
}

} // namespace

auto parse_integer(std::string_view text, size_t offset) -> Result<Integer, Error> {
    if (text.empty()) {
        return type_error("empty integer payload", offset);
    }

    bool negative = text[0] == '-';
    std::string_view digits = negative ? text.substr(1) : text;

    if (digits.empty()) {
        return type_error("integer payload has no digits", offset);
    }
    for (size_t i = 0; i < digits.size(); ++i) {
        if (!is_digit(digits[i])) {
            return type_error("invalid character in integer payload",
                              offset + (negative ? 1 : 0) + i);
        }
    }
    if (digits[0] == '0') {
        if (digits.size() > 1) {
            return type_error("leading zero in integer payload", offset);
        }
        if (negative) {
            return type_error("negative zero in integer payload", offset);
        }
    }

    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (negative) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc::result_out_of_range) {
            return type_error("integer overflow", offset);
        }
        if (ec != std::errc{} || ptr != last) {
            return type_error("malformed integer payload", offset);
        }
        return Integer(value);
    }

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc::result_out_of_range) {
        return type_error("integer overflow", offset);
    }
    if (ec != std::errc{} || ptr != last) {
        return type_error("malformed integer payload", offset);
    }
    return Integer(value);
}

auto parse_float(std::string_view text, size_t offset) -> Result<double, Error> {
    size_t pos = 0;

    if (pos < text.size() && text[pos] == '-') {
        ++pos;
    }
    if (skip_digits(text, pos) == 0) {
        return type_error("float payload must start with a digit", offset + pos);
    }

    // Fractional part
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        if (skip_digits(text, pos) == 0) {
            return type_error("expected digit after decimal point", offset + pos);
        }
    }

    // Exponent part
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            ++pos;
        }
        if (skip_digits(text, pos) == 0) {
            return type_error("expected digit in exponent", offset + pos);
        }
    }

    if (pos != text.size()) {
        return type_error("invalid character in float payload", offset + pos);
    }

    const char* first = text.data();
    const char* last = text.data() + text.size();
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc::result_out_of_range) {
        // from_chars reports underflow and overflow alike; strtod tells them apart
        value = std::strtod(std::string(text).c_str(), nullptr);
        if (std::isinf(value)) {
            return type_error("float out of range", offset);
        }
        return value;
    }
    if (ec != std::errc{} || ptr != last) {
        return type_error("malformed float payload", offset);
    }
    return value;
}

auto format_integer(const Integer& value) -> std::string {
    std::array<char, 24> buf{};
    auto [ptr, ec] = value.kind == Integer::Kind::Signed
                         ? std::to_chars(buf.data(), buf.data() + buf.size(), value.i64)
                         : std::to_chars(buf.data(), buf.data() + buf.size(), value.u64);
    (void)ec; // 24 bytes always fit a 64-bit integer
    return std::string(buf.data(), ptr);
}

auto format_float(double value) -> Result<std::string, Error> {
    if (std::isnan(value)) {
        return type_error("cannot encode NaN as a float payload", 0);
    }
    if (std::isinf(value)) {
        return type_error("cannot encode infinity as a float payload", 0);
    }
    return format_float_text(value);
}

auto format_float_text(double value) -> std::string {
    std::array<char, 32> buf{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), value);
    (void)ec; // shortest round-trip form of a double is at most 24 bytes
    return std::string(buf.data(), ptr);
}

} // namespace tnet
