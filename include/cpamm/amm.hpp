#ifndef CPAMM_AMM_HPP
#define CPAMM_AMM_HPP

#include <cstdint>
#include <optional>

#include "events.hpp"
#include "liquidity.hpp"
#include "log.hpp"
#include "pool_store.hpp"
#include "swap.hpp"
#include "transfer.hpp"
#include "types.hpp"

namespace cpamm {

// =============================================================================
// Amm - Constant-product pool manager
// =============================================================================

// Public operation surface. Each call either commits completely (transfers,
// pool state and notification) or throws with no state change.
//
// Not thread-safe: the host must serialize calls. The store, transfer
// adapter and sink are borrowed and must outlive the Amm.
class Amm {
public:
    // Throws std::invalid_argument if fee_bps > 10000
    Amm(uint32_t fee_bps, PoolStore& store, IAssetTransfer& transfer,
        INotificationSink& sink, Logger logger = Logger{});

    // Non-copyable
    Amm(const Amm&) = delete;
    Amm& operator=(const Amm&) = delete;

    // =========================================================================
    // Core Operations
    // =========================================================================

    // Create the pool for an unordered pair and seed it. amount_a / amount_b
    // belong to asset_a / asset_b and are reordered with them.
    PoolId create_pool(const Address& caller, const Asset& asset_a, const Asset& asset_b,
                       U128 amount_a, U128 amount_b);

    // Deposit at the pool ratio; returns shares minted to `caller`
    U128 add_liquidity(const Address& caller, PoolId pool_id,
                       U128 amount0_desired, U128 amount1_desired);

    // Burn `shares` of `caller` and pay out the proportional reserves
    Amounts remove_liquidity(const Address& caller, PoolId pool_id, U128 shares);

    // Exact-input swap; pays the output to `recipient`
    U128 swap(const Address& caller, PoolId pool_id, const Asset& asset_in,
              U128 amount_in, U128 min_amount_out, const Address& recipient);

    // =========================================================================
    // Query Operations
    // =========================================================================

    [[nodiscard]] PoolInfo get_pool(PoolId pool_id) const;
    [[nodiscard]] U128 get_share_balance(PoolId pool_id, const Address& holder) const;

    [[nodiscard]] std::optional<PoolId> find_pool(const Asset& a, const Asset& b) const;

    // Read-only previews of the mutating operations
    [[nodiscard]] U128 quote_swap(PoolId pool_id, const Asset& asset_in, U128 amount_in) const;
    [[nodiscard]] AddLiquidityPlan quote_add_liquidity(PoolId pool_id, U128 amount0_desired,
                                                       U128 amount1_desired) const;
    [[nodiscard]] Amounts quote_remove_liquidity(PoolId pool_id, U128 shares) const;

    [[nodiscard]] uint32_t fee_bps() const noexcept { return fee_bps_; }

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_pools;
        uint64_t total_swaps;
        uint64_t total_liquidity_ops;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    uint32_t fee_bps_;
    PoolStore& store_;
    IAssetTransfer& transfer_;
    INotificationSink& sink_;
    Logger logger_;

    uint64_t total_swaps_{0};
    uint64_t total_liquidity_ops_{0};

    // Pull two assets from one owner; returns the first if the second fails
    void pull_pair(const Asset& asset0, U128 amount0, const Asset& asset1, U128 amount1,
                   const Address& owner);

    // Throws AmmError(InsufficientBalance) if custody cannot cover `amount`
    void require_custody(const Asset& asset, U128 amount) const;

    void emit(const Event& event);

    // Logs AmmError rejections of `op` and rethrows
    template <typename Fn>
    auto logged(const char* op, Fn&& fn) -> decltype(fn());
};

} // namespace cpamm

#endif // CPAMM_AMM_HPP
