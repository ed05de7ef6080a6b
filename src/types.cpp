// =============================================================================
// types.cpp - Address and 128-bit integer text conversions
// =============================================================================

#include "liquid/types.hpp"
#include "liquid/errors.hpp"

#include <algorithm>

namespace liquid {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

namespace addresses {

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

Address from_hex(const std::string& text) {
    std::string body = text;
    if (body.size() >= 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'X')) {
        body = body.substr(2);
    }
    if (body.size() != 40) {
        throw ConfigError("address must have 40 hex digits: " + text);
    }

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(body[2 * i]);
        int lo = hex_value(body[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw ConfigError("invalid hex digit in address: " + text);
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

std::string to_string(I128 value) {
    if (value == 0) return "0";

    bool neg = value < 0;
    U128 mag = neg ? static_cast<U128>(-(value + 1)) + 1 : static_cast<U128>(value);

    std::string out;
    while (mag != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    }
    if (neg) out.push_back('-');
    std::reverse(out.begin(), out.end());
    return out;
}

I128 parse_i128(const std::string& text) {
    if (text.empty()) {
        throw ConfigError("empty integer literal");
    }

    size_t pos = 0;
    bool neg = false;
    if (text[0] == '-') {
        neg = true;
        pos = 1;
    }
    if (pos == text.size()) {
        throw ConfigError("invalid integer literal: " + text);
    }

    // 2^127 - 1
    const I128 max = static_cast<I128>(~U128(0) >> 1);
    I128 value = 0;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c < '0' || c > '9') {
            throw ConfigError("invalid integer literal: " + text);
        }
        int digit = c - '0';
        if (value > (max - digit) / 10) {
            throw ConfigError("integer literal out of range: " + text);
        }
        value = value * 10 + digit;
    }
    return neg ? -value : value;
}

} // namespace liquid
