#ifndef CPAMM_LIQUIDITY_HPP
#define CPAMM_LIQUIDITY_HPP

#include "pool_store.hpp"
#include "types.hpp"

namespace cpamm {

// Amounts actually consumed by a deposit and the shares they mint
struct AddLiquidityPlan {
    U128 amount0;
    U128 amount1;
    U128 shares;
};

// Amounts released by burning `shares`
struct RemoveLiquidityPlan {
    U128 amount0;
    U128 amount1;
    U128 shares;
};

// =============================================================================
// LiquidityEngine - Proportional share accounting
// =============================================================================

class LiquidityEngine {
public:
    // Initial mint: floor(sqrt(amount0 * amount1))
    static U128 initial_shares(U128 amount0, U128 amount1);

    // Amount of asset B matching `amount_a` at the reserve ratio (floor)
    static U128 quote(U128 amount_a, U128 reserve_a, U128 reserve_b);

    // True when the deposit, accepted whole, is the floor slice of some
    // share count of the resulting pool (within one unit per asset)
    static bool is_proportional(const Pool& pool, U128 amount0, U128 amount1);

    // A proportional deposit is consumed in full and mints the smallest
    // share count whose slice covers it, so burning those shares right away
    // returns exactly the deposit. Any other deposit is matched to the pool
    // ratio: the binding side is consumed in full, the other is reduced to
    // its quote and the excess is left with the caller.
    // Throws AmmError(InsufficientAmounts) if either desired amount is zero
    // and AmmError(InsufficientLiquidity) if no share would be minted.
    static AddLiquidityPlan plan_add(const Pool& pool, U128 amount0_desired, U128 amount1_desired);

    // Throws AmmError(InsufficientAmounts) for zero shares and
    // AmmError(InsufficientLiquidity) if `holder` owns fewer than `shares`
    // or the burn would release nothing.
    static RemoveLiquidityPlan plan_remove(const Pool& pool, const Address& holder, U128 shares);

    // floor(min(amount0 * T / reserve0, amount1 * T / reserve1))
    static U128 floor_shares(const Pool& pool, U128 amount0, U128 amount1);

    static U128 slice_shares(const Pool& pool, U128 amount0, U128 amount1);

    // Commit a plan produced against the same pool state
    static void apply_add(Pool& pool, const Address& provider, const AddLiquidityPlan& plan);
    static void apply_remove(Pool& pool, const Address& provider, const RemoveLiquidityPlan& plan);
};

} // namespace cpamm

#endif // CPAMM_LIQUIDITY_HPP
