// =============================================================================
// swap.cpp - Exact-input swap pricing (x * y = k with input fee)
// =============================================================================

#include "cpamm/swap.hpp"
#include "cpamm/errors.hpp"
#include "cpamm/math.hpp"

namespace cpamm {

U128 SwapEngine::amount_in_after_fee(U128 amount_in, uint32_t fee_bps) {
    return math::mul_div(amount_in, BPS_DENOMINATOR - fee_bps, BPS_DENOMINATOR);
}

U128 SwapEngine::get_amount_out(U128 amount_in, U128 reserve_in, U128 reserve_out,
                                uint32_t fee_bps) {
    U128 in_after_fee = amount_in_after_fee(amount_in, fee_bps);
    U128 denominator = math::checked_add(reserve_in, in_after_fee);
    if (denominator == 0) return 0;
    return math::mul_div(in_after_fee, reserve_out, denominator);
}

SwapPlan SwapEngine::plan(const Pool& pool, const Asset& asset_in, U128 amount_in,
                          U128 min_amount_out) {
    if (!pool.holds(asset_in)) {
        throw AmmError(ErrorCode::InvalidToken,
                       addresses::to_hex(asset_in.addr) + " not in pool");
    }
    if (amount_in == 0) {
        throw AmmError(ErrorCode::InsufficientAmounts);
    }

    SwapPlan plan{};
    plan.zero_for_one = asset_in == pool.asset0;
    plan.asset_in = asset_in;
    plan.asset_out = plan.zero_for_one ? pool.asset1 : pool.asset0;
    plan.amount_in = amount_in;

    U128 reserve_in = plan.zero_for_one ? pool.reserve0 : pool.reserve1;
    U128 reserve_out = plan.zero_for_one ? pool.reserve1 : pool.reserve0;
    if (reserve_in == 0 || reserve_out == 0) {
        throw AmmError(ErrorCode::InsufficientLiquidity, "pool is empty");
    }

    // The full input lands in the reserve, so it must fit
    math::checked_add(reserve_in, amount_in);

    plan.amount_in_after_fee = amount_in_after_fee(amount_in, pool.fee_bps);
    plan.amount_out = get_amount_out(amount_in, reserve_in, reserve_out, pool.fee_bps);

    if (plan.amount_out < min_amount_out) {
        throw AmmError(ErrorCode::SlippageExceeded,
                       "out " + to_string(plan.amount_out) + " < min " + to_string(min_amount_out));
    }
    if (plan.amount_out == 0) {
        throw AmmError(ErrorCode::InsufficientLiquidity, "zero output");
    }
    return plan;
}

void SwapEngine::check_invariant(const Pool& pool, const SwapPlan& plan) {
    U128 reserve_in = plan.zero_for_one ? pool.reserve0 : pool.reserve1;
    U128 reserve_out = plan.zero_for_one ? pool.reserve1 : pool.reserve0;

    if (plan.amount_out >= reserve_out) {
        throw InvariantViolation("swap output " + to_string(plan.amount_out) +
                                 " drains reserve " + to_string(reserve_out) +
                                 " in pool " + pool_id_to_hex(pool.id));
    }

    math::U256 k_before = math::mul_u128(reserve_in, reserve_out);
    math::U256 k_after = math::mul_u128(reserve_in + plan.amount_in,
                                        reserve_out - plan.amount_out);
    if (k_after < k_before) {
        throw InvariantViolation("k decreased by swap in pool " + pool_id_to_hex(pool.id));
    }
}

void SwapEngine::apply(Pool& pool, const SwapPlan& plan) {
    if (plan.zero_for_one) {
        pool.reserve0 += plan.amount_in;
        pool.reserve1 -= plan.amount_out;
    } else {
        pool.reserve1 += plan.amount_in;
        pool.reserve0 -= plan.amount_out;
    }
}

} // namespace cpamm
