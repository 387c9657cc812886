// =============================================================================
// types.cpp - Address and amount formatting
// =============================================================================

#include "cpamm/types.hpp"

#include <algorithm>
#include <stdexcept>

namespace cpamm {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

namespace addresses {

std::string to_hex(const Address& addr) {
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

std::optional<Address> from_hex(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.empty() || text.size() > 40) return std::nullopt;

    Address addr{};
    // Walk from the least significant nibble
    size_t nibble = 0;
    for (auto it = text.rbegin(); it != text.rend(); ++it, ++nibble) {
        int v = hex_value(*it);
        if (v < 0) return std::nullopt;
        size_t byte = addr.size() - 1 - nibble / 2;
        if (nibble % 2 == 0) {
            addr[byte] = static_cast<uint8_t>(v);
        } else {
            addr[byte] = static_cast<uint8_t>(addr[byte] | (v << 4));
        }
    }
    return addr;
}

} // namespace addresses

std::string pool_id_to_hex(PoolId id) {
    std::string out = "0x";
    for (int shift = 60; shift >= 0; shift -= 4) {
        out.push_back(HEX_DIGITS[(id >> shift) & 0xF]);
    }
    return out;
}

std::optional<PoolId> pool_id_from_hex(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.empty() || text.size() > 16) return std::nullopt;
    PoolId id = 0;
    for (char c : text) {
        int v = hex_value(c);
        if (v < 0) return std::nullopt;
        id = (id << 4) | static_cast<PoolId>(v);
    }
    return id;
}

std::string to_string(U128 value) {
    if (value == 0) return "0";
    std::string out;
    while (value != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

U128 parse_u128(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("empty amount");
    }
    U128 value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid amount: " + std::string(text));
        }
        U128 digit = static_cast<U128>(c - '0');
        if (value > (U128_MAX - digit) / 10) {
            throw std::out_of_range("amount exceeds 128 bits: " + std::string(text));
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace cpamm
