#ifndef CPAMM_POOL_STORE_HPP
#define CPAMM_POOL_STORE_HPP

#include <map>
#include <optional>
#include <unordered_map>

#include "types.hpp"

namespace cpamm {

// =============================================================================
// Pool State (single pool)
// =============================================================================

struct Pool {
    PoolId id;
    Asset asset0;                // Sorted: asset0 < asset1
    Asset asset1;
    U128 reserve0;
    U128 reserve1;
    uint32_t fee_bps;
    U128 total_shares;
    std::unordered_map<Address, U128, AddressHash> share_balances;  // holder -> shares

    [[nodiscard]] U128 share_balance(const Address& holder) const {
        auto it = share_balances.find(holder);
        return it != share_balances.end() ? it->second : 0;
    }

    [[nodiscard]] bool holds(const Asset& asset) const {
        return asset == asset0 || asset == asset1;
    }
};

// Read-only snapshot returned by getPool
struct PoolInfo {
    Asset asset0;
    Asset asset1;
    U128 reserve0;
    U128 reserve1;
    uint32_t fee_bps;
    U128 total_shares;
};

// =============================================================================
// PoolStore - Pool registry keyed by derived identifier
// =============================================================================

// Owns every pool; pools are never removed. Not thread-safe: the host
// serializes mutating calls.
class PoolStore {
public:
    PoolStore() = default;

    // Non-copyable
    PoolStore(const PoolStore&) = delete;
    PoolStore& operator=(const PoolStore&) = delete;

    // Orders two assets; throws AmmError(InvalidToken) if they are equal
    static AssetPair canonical_pair(const Asset& a, const Asset& b);

    // Pure function of the ordered pair
    static PoolId derive_id(const AssetPair& pair);

    // Same id for (a, b) and (b, a)
    static PoolId pool_id_for(const Asset& a, const Asset& b) {
        return derive_id(canonical_pair(a, b));
    }

    // Registers a fully initialised pool. Throws AmmError(PoolExists) if
    // its pair already has a pool.
    Pool& insert(Pool pool);

    [[nodiscard]] bool contains(PoolId id) const;
    [[nodiscard]] std::optional<PoolId> find(const AssetPair& pair) const;

    // Throws AmmError(PoolNotFound)
    Pool& at(PoolId id);
    const Pool& at(PoolId id) const;

    [[nodiscard]] PoolInfo info(PoolId id) const;
    [[nodiscard]] U128 share_balance(PoolId id, const Address& holder) const;

    [[nodiscard]] size_t size() const noexcept { return pools_.size(); }

private:
    std::unordered_map<PoolId, Pool> pools_;
    std::map<AssetPair, PoolId> pair_index_;
};

} // namespace cpamm

#endif // CPAMM_POOL_STORE_HPP
