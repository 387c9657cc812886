// =============================================================================
// pool_store.cpp - Pool registry and canonical pair identity
// =============================================================================

#include "cpamm/pool_store.hpp"
#include "cpamm/errors.hpp"

#include <stdexcept>
#include <utility>

namespace cpamm {

AssetPair PoolStore::canonical_pair(const Asset& a, const Asset& b) {
    if (a == b) {
        throw AmmError(ErrorCode::InvalidToken, "identical assets");
    }
    return a < b ? AssetPair{a, b} : AssetPair{b, a};
}

PoolId PoolStore::derive_id(const AssetPair& pair) {
    // FNV-1a over asset0 || asset1
    uint64_t h = 0xcbf29ce484222325ULL;
    for (uint8_t b : pair.asset0.addr) {
        h ^= b;
        h *= 0x100000001b3ULL;
    }
    for (uint8_t b : pair.asset1.addr) {
        h ^= b;
        h *= 0x100000001b3ULL;
    }
    return h;
}

Pool& PoolStore::insert(Pool pool) {
    AssetPair pair{pool.asset0, pool.asset1};
    if (!(pair.asset0 < pair.asset1)) {
        throw AmmError(ErrorCode::InvalidToken, "assets not sorted");
    }
    if (pair_index_.find(pair) != pair_index_.end()) {
        throw AmmError(ErrorCode::PoolExists);
    }
    if (pool.id != derive_id(pair)) {
        throw std::logic_error("PoolStore: id does not match pair");
    }
    if (pools_.find(pool.id) != pools_.end()) {
        // Two distinct pairs hashed to the same id
        throw std::logic_error("PoolStore: pool id collision for " + pool_id_to_hex(pool.id));
    }

    PoolId id = pool.id;
    auto it = pools_.emplace(id, std::move(pool)).first;
    pair_index_.emplace(pair, id);
    return it->second;
}

bool PoolStore::contains(PoolId id) const {
    return pools_.find(id) != pools_.end();
}

std::optional<PoolId> PoolStore::find(const AssetPair& pair) const {
    auto it = pair_index_.find(pair);
    return it != pair_index_.end() ? std::optional{it->second} : std::nullopt;
}

Pool& PoolStore::at(PoolId id) {
    auto it = pools_.find(id);
    if (it == pools_.end()) {
        throw AmmError(ErrorCode::PoolNotFound, pool_id_to_hex(id));
    }
    return it->second;
}

const Pool& PoolStore::at(PoolId id) const {
    auto it = pools_.find(id);
    if (it == pools_.end()) {
        throw AmmError(ErrorCode::PoolNotFound, pool_id_to_hex(id));
    }
    return it->second;
}

PoolInfo PoolStore::info(PoolId id) const {
    const Pool& pool = at(id);
    return PoolInfo{
        pool.asset0,
        pool.asset1,
        pool.reserve0,
        pool.reserve1,
        pool.fee_bps,
        pool.total_shares
    };
}

U128 PoolStore::share_balance(PoolId id, const Address& holder) const {
    return at(id).share_balance(holder);
}

} // namespace cpamm
