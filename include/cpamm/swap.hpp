#ifndef CPAMM_SWAP_HPP
#define CPAMM_SWAP_HPP

#include "pool_store.hpp"
#include "types.hpp"

namespace cpamm {

struct SwapPlan {
    bool zero_for_one;           // true = sell asset0 for asset1
    Asset asset_in;
    Asset asset_out;
    U128 amount_in;
    U128 amount_in_after_fee;
    U128 amount_out;
};

// =============================================================================
// SwapEngine - Constant-product pricing with an input fee
// =============================================================================

class SwapEngine {
public:
    // floor(amount_in * (10000 - fee_bps) / 10000)
    static U128 amount_in_after_fee(U128 amount_in, uint32_t fee_bps);

    // floor(in_after_fee * reserve_out / (reserve_in + in_after_fee))
    static U128 get_amount_out(U128 amount_in, U128 reserve_in, U128 reserve_out,
                               uint32_t fee_bps);

    // Prices a swap against the pool without touching it. Throws AmmError
    // with InvalidToken, InsufficientAmounts, InsufficientLiquidity or
    // SlippageExceeded.
    static SwapPlan plan(const Pool& pool, const Asset& asset_in, U128 amount_in,
                         U128 min_amount_out);

    // Post-condition on k: throws InvariantViolation if the reserves after
    // `plan` would hold a smaller product than before.
    static void check_invariant(const Pool& pool, const SwapPlan& plan);

    static void apply(Pool& pool, const SwapPlan& plan);
};

} // namespace cpamm

#endif // CPAMM_SWAP_HPP
