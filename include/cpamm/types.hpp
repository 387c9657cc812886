#ifndef CPAMM_TYPES_HPP
#define CPAMM_TYPES_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cpamm {

// =============================================================================
// Account / Asset Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

// Default custody account holding pooled assets
constexpr Address AMM_CUSTODY = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0x90,0x10};

// Helper to create a short address (right-aligned id)
constexpr Address from_id(uint16_t id) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((id >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(id & 0xFF);
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts 1-40 hex digits with optional 0x prefix, right-aligned
std::optional<Address> from_hex(std::string_view text);

} // namespace addresses

struct AddressHash {
    size_t operator()(const Address& a) const noexcept {
        uint64_t h = 0;
        for (auto b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Fixed-Point Amounts
// =============================================================================

// Amounts, reserves and shares, in the asset's smallest unit
using U128 = unsigned __int128;

constexpr U128 U128_MAX = ~U128(0);

// Fee rates are expressed in basis points
constexpr uint32_t BPS_DENOMINATOR = 10000;

// Decimal rendering (U128 has no stream operator)
std::string to_string(U128 value);

// Parses a non-negative decimal integer; throws std::invalid_argument
// on malformed input and std::out_of_range if it exceeds U128
U128 parse_u128(std::string_view text);

// =============================================================================
// Asset Type (Token Address)
// =============================================================================

struct Asset {
    Address addr;

    Asset() : addr{} {}
    explicit Asset(const Address& a) : addr(a) {}

    bool operator==(const Asset& other) const { return addr == other.addr; }
    bool operator!=(const Asset& other) const { return addr != other.addr; }
    bool operator<(const Asset& other) const { return addr < other.addr; }
};

// =============================================================================
// Pool Identity
// =============================================================================

using PoolId = uint64_t;

// "0x" + 16 hex digits
std::string pool_id_to_hex(PoolId id);
std::optional<PoolId> pool_id_from_hex(std::string_view text);

// Canonically ordered pair: asset0 < asset1
struct AssetPair {
    Asset asset0;
    Asset asset1;

    bool operator==(const AssetPair& other) const {
        return asset0 == other.asset0 && asset1 == other.asset1;
    }
    bool operator<(const AssetPair& other) const {
        return asset0 < other.asset0 || (asset0 == other.asset0 && asset1 < other.asset1);
    }
};

// Token amounts in pool order
struct Amounts {
    U128 amount0;
    U128 amount1;
};

} // namespace cpamm

#endif // CPAMM_TYPES_HPP
