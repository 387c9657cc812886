// =============================================================================
// amm.cpp - Pool lifecycle, liquidity and swap orchestration
// =============================================================================

#include "cpamm/amm.hpp"
#include "cpamm/errors.hpp"
#include "cpamm/math.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace cpamm {

// =============================================================================
// Constructor
// =============================================================================

Amm::Amm(uint32_t fee_bps, PoolStore& store, IAssetTransfer& transfer,
         INotificationSink& sink, Logger logger)
    : fee_bps_(fee_bps)
    , store_(store)
    , transfer_(transfer)
    , sink_(sink)
    , logger_(logger)
{
    if (fee_bps > BPS_DENOMINATOR) {
        throw std::invalid_argument("Amm: fee_bps must be within 0..10000, got " +
                                    std::to_string(fee_bps));
    }
}

// =============================================================================
// Internal Helpers
// =============================================================================

template <typename Fn>
auto Amm::logged(const char* op, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const AmmError& e) {
        if (logger_.enabled(LogLevel::Info)) {
            logger_.info(std::string(op) + " rejected [" + to_string(e.code()) + "]: " + e.what());
        }
        throw;
    } catch (const InvariantViolation& e) {
        logger_.error(std::string(op) + " INVARIANT VIOLATION: " + e.what());
        throw;
    }
}

void Amm::pull_pair(const Asset& asset0, U128 amount0, const Asset& asset1, U128 amount1,
                    const Address& owner) {
    transfer_.pull(asset0, owner, amount0);
    try {
        transfer_.pull(asset1, owner, amount1);
    } catch (...) {
        transfer_.revert_pull(asset0, owner, amount0);
        throw;
    }
}

void Amm::require_custody(const Asset& asset, U128 amount) const {
    U128 held = transfer_.custody_balance(asset);
    if (held < amount) {
        throw AmmError(ErrorCode::InsufficientBalance,
                       "custody holds " + to_string(held) + " of " +
                       addresses::to_hex(asset.addr) + ", needs " + to_string(amount));
    }
}

void Amm::emit(const Event& event) {
    try {
        sink_.notify(event);
    } catch (const std::exception& e) {
        // Delivery is best effort; the operation is already committed
        logger_.warn(std::string("notification sink failed on ") + event_name(event) + ": " + e.what());
    }
}

// =============================================================================
// Create Pool
// =============================================================================

PoolId Amm::create_pool(const Address& caller, const Asset& asset_a, const Asset& asset_b,
                        U128 amount_a, U128 amount_b) {
    return logged("create_pool", [&] {
        AssetPair pair = PoolStore::canonical_pair(asset_a, asset_b);
        bool flipped = pair.asset0 != asset_a;
        U128 amount0 = flipped ? amount_b : amount_a;
        U128 amount1 = flipped ? amount_a : amount_b;

        if (store_.find(pair)) {
            throw AmmError(ErrorCode::PoolExists);
        }
        if (amount0 == 0 || amount1 == 0) {
            throw AmmError(ErrorCode::InsufficientAmounts);
        }

        PoolId pool_id = PoolStore::derive_id(pair);
        if (store_.contains(pool_id)) {
            throw std::logic_error("Amm: pool id collision for " + pool_id_to_hex(pool_id));
        }

        U128 shares = LiquidityEngine::initial_shares(amount0, amount1);

        Pool pool{};
        pool.id = pool_id;
        pool.asset0 = pair.asset0;
        pool.asset1 = pair.asset1;
        pool.reserve0 = amount0;
        pool.reserve1 = amount1;
        pool.fee_bps = fee_bps_;
        pool.total_shares = shares;
        pool.share_balances[caller] = shares;

        pull_pair(pair.asset0, amount0, pair.asset1, amount1, caller);
        store_.insert(std::move(pool));

        if (logger_.enabled(LogLevel::Debug)) {
            logger_.debug("create_pool " + pool_id_to_hex(pool_id) + " reserves " +
                          to_string(amount0) + "/" + to_string(amount1) +
                          " shares " + to_string(shares));
        }
        emit(PoolCreated{pool_id, pair.asset0, pair.asset1});
        return pool_id;
    });
}

// =============================================================================
// Add / Remove Liquidity
// =============================================================================

U128 Amm::add_liquidity(const Address& caller, PoolId pool_id,
                        U128 amount0_desired, U128 amount1_desired) {
    return logged("add_liquidity", [&] {
        Pool& pool = store_.at(pool_id);
        AddLiquidityPlan plan = LiquidityEngine::plan_add(pool, amount0_desired, amount1_desired);

        pull_pair(pool.asset0, plan.amount0, pool.asset1, plan.amount1, caller);
        LiquidityEngine::apply_add(pool, caller, plan);
        ++total_liquidity_ops_;

        if (logger_.enabled(LogLevel::Debug)) {
            logger_.debug("add_liquidity " + pool_id_to_hex(pool_id) + " used " +
                          to_string(plan.amount0) + "/" + to_string(plan.amount1) +
                          " minted " + to_string(plan.shares));
        }
        emit(LiquidityAdded{pool_id, caller, plan.amount0, plan.amount1, plan.shares});
        return plan.shares;
    });
}

Amounts Amm::remove_liquidity(const Address& caller, PoolId pool_id, U128 shares) {
    return logged("remove_liquidity", [&] {
        Pool& pool = store_.at(pool_id);
        RemoveLiquidityPlan plan = LiquidityEngine::plan_remove(pool, caller, shares);

        // Custody must cover both legs before the first push
        require_custody(pool.asset0, plan.amount0);
        require_custody(pool.asset1, plan.amount1);
        transfer_.push(pool.asset0, caller, plan.amount0);
        try {
            transfer_.push(pool.asset1, caller, plan.amount1);
        } catch (...) {
            transfer_.revert_push(pool.asset0, caller, plan.amount0);
            throw;
        }

        LiquidityEngine::apply_remove(pool, caller, plan);
        ++total_liquidity_ops_;

        if (logger_.enabled(LogLevel::Debug)) {
            logger_.debug("remove_liquidity " + pool_id_to_hex(pool_id) + " burned " +
                          to_string(plan.shares) + " released " +
                          to_string(plan.amount0) + "/" + to_string(plan.amount1));
        }
        emit(LiquidityRemoved{pool_id, caller, plan.amount0, plan.amount1, plan.shares});
        return Amounts{plan.amount0, plan.amount1};
    });
}

// =============================================================================
// Swap
// =============================================================================

U128 Amm::swap(const Address& caller, PoolId pool_id, const Asset& asset_in,
               U128 amount_in, U128 min_amount_out, const Address& recipient) {
    return logged("swap", [&] {
        Pool& pool = store_.at(pool_id);
        SwapPlan plan = SwapEngine::plan(pool, asset_in, amount_in, min_amount_out);
        SwapEngine::check_invariant(pool, plan);
        require_custody(plan.asset_out, plan.amount_out);

        transfer_.pull(plan.asset_in, caller, plan.amount_in);
        try {
            transfer_.push(plan.asset_out, recipient, plan.amount_out);
        } catch (...) {
            transfer_.revert_pull(plan.asset_in, caller, plan.amount_in);
            throw;
        }

        SwapEngine::apply(pool, plan);
        ++total_swaps_;

        if (logger_.enabled(LogLevel::Debug)) {
            logger_.debug("swap " + pool_id_to_hex(pool_id) + " in " + to_string(plan.amount_in) +
                          " out " + to_string(plan.amount_out));
        }
        emit(Swapped{pool_id, caller, recipient, plan.asset_in, plan.amount_in,
                     plan.asset_out, plan.amount_out});
        return plan.amount_out;
    });
}

// =============================================================================
// Query Operations
// =============================================================================

PoolInfo Amm::get_pool(PoolId pool_id) const {
    return store_.info(pool_id);
}

U128 Amm::get_share_balance(PoolId pool_id, const Address& holder) const {
    return store_.share_balance(pool_id, holder);
}

std::optional<PoolId> Amm::find_pool(const Asset& a, const Asset& b) const {
    if (a == b) return std::nullopt;
    return store_.find(PoolStore::canonical_pair(a, b));
}

U128 Amm::quote_swap(PoolId pool_id, const Asset& asset_in, U128 amount_in) const {
    return SwapEngine::plan(store_.at(pool_id), asset_in, amount_in, 0).amount_out;
}

AddLiquidityPlan Amm::quote_add_liquidity(PoolId pool_id, U128 amount0_desired,
                                          U128 amount1_desired) const {
    return LiquidityEngine::plan_add(store_.at(pool_id), amount0_desired, amount1_desired);
}

Amounts Amm::quote_remove_liquidity(PoolId pool_id, U128 shares) const {
    const Pool& pool = store_.at(pool_id);
    if (shares > pool.total_shares) {
        throw AmmError(ErrorCode::InsufficientLiquidity, "exceeds total shares");
    }
    if (pool.total_shares == 0) {
        return Amounts{0, 0};
    }
    return Amounts{math::mul_div(pool.reserve0, shares, pool.total_shares),
                   math::mul_div(pool.reserve1, shares, pool.total_shares)};
}

// =============================================================================
// Statistics
// =============================================================================

Amm::Stats Amm::get_stats() const {
    return Stats{
        static_cast<uint64_t>(store_.size()),
        total_swaps_,
        total_liquidity_ops_
    };
}

} // namespace cpamm
