// =============================================================================
// liquidity.cpp - Deposit / withdrawal share math
// =============================================================================

#include "cpamm/liquidity.hpp"
#include "cpamm/errors.hpp"
#include "cpamm/math.hpp"

#include <algorithm>

namespace cpamm {

U128 LiquidityEngine::initial_shares(U128 amount0, U128 amount1) {
    return math::isqrt(math::mul_u128(amount0, amount1));
}

U128 LiquidityEngine::quote(U128 amount_a, U128 reserve_a, U128 reserve_b) {
    return math::mul_div(amount_a, reserve_b, reserve_a);
}

U128 LiquidityEngine::floor_shares(const Pool& pool, U128 amount0, U128 amount1) {
    return std::min(math::mul_div(amount0, pool.total_shares, pool.reserve0),
                    math::mul_div(amount1, pool.total_shares, pool.reserve1));
}

U128 LiquidityEngine::slice_shares(const Pool& pool, U128 amount0, U128 amount1) {
    // Smallest share count whose slice of the enlarged pool covers both amounts
    U128 shares = std::max(math::mul_div_up(amount0, pool.total_shares, pool.reserve0),
                           math::mul_div_up(amount1, pool.total_shares, pool.reserve1));
    U128 total = math::checked_add(pool.total_shares, shares);
    U128 r0 = pool.reserve0 + amount0;
    U128 r1 = pool.reserve1 + amount1;

    // Burning them straight back must not release more than was deposited.
    // Shares coarser than one unit can break that; mint the floor instead.
    if (math::mul_u128(shares, r0) < math::mul_u128(amount0 + 1, total) &&
        math::mul_u128(shares, r1) < math::mul_u128(amount1 + 1, total)) {
        return shares;
    }
    return floor_shares(pool, amount0, amount1);
}

bool LiquidityEngine::is_proportional(const Pool& pool, U128 amount0, U128 amount1) {
    if (amount0 >= U128_MAX - pool.reserve0 || amount1 >= U128_MAX - pool.reserve1) {
        return false;
    }
    U128 r0 = pool.reserve0 + amount0;
    U128 r1 = pool.reserve1 + amount1;
    // Some fraction of the enlarged pool must floor to both amounts
    return math::mul_u128(amount0, r1) < math::mul_u128(amount1 + 1, r0) &&
           math::mul_u128(amount1, r0) < math::mul_u128(amount0 + 1, r1);
}

AddLiquidityPlan LiquidityEngine::plan_add(const Pool& pool, U128 amount0_desired,
                                           U128 amount1_desired) {
    if (amount0_desired == 0 || amount1_desired == 0) {
        throw AmmError(ErrorCode::InsufficientAmounts);
    }

    AddLiquidityPlan plan{};

    if (pool.total_shares == 0) {
        // Fully drained pool: re-seed at the depositor's ratio
        plan.amount0 = amount0_desired;
        plan.amount1 = amount1_desired;
        plan.shares = initial_shares(amount0_desired, amount1_desired);
    } else if (is_proportional(pool, amount0_desired, amount1_desired)) {
        plan.amount0 = amount0_desired;
        plan.amount1 = amount1_desired;
        plan.shares = slice_shares(pool, plan.amount0, plan.amount1);
    } else {
        // Ratio match: the binding side is consumed in full
        U128 amount1_optimal = quote(amount0_desired, pool.reserve0, pool.reserve1);
        if (amount1_optimal <= amount1_desired) {
            plan.amount0 = amount0_desired;
            plan.amount1 = amount1_optimal;
        } else {
            plan.amount0 = quote(amount1_desired, pool.reserve1, pool.reserve0);
            plan.amount1 = amount1_desired;
        }
        plan.shares = floor_shares(pool, plan.amount0, plan.amount1);

        if (plan.amount0 == 0 || plan.amount1 == 0) {
            throw AmmError(ErrorCode::InsufficientLiquidity, "deposit below pool resolution");
        }
    }

    if (plan.shares == 0) {
        throw AmmError(ErrorCode::InsufficientLiquidity, "no shares minted");
    }

    // New totals must stay representable
    math::checked_add(pool.reserve0, plan.amount0);
    math::checked_add(pool.reserve1, plan.amount1);
    math::checked_add(pool.total_shares, plan.shares);

    return plan;
}

RemoveLiquidityPlan LiquidityEngine::plan_remove(const Pool& pool, const Address& holder,
                                                 U128 shares) {
    if (shares == 0) {
        throw AmmError(ErrorCode::InsufficientAmounts);
    }

    U128 balance = pool.share_balance(holder);
    if (shares > balance) {
        throw AmmError(ErrorCode::InsufficientLiquidity,
                       "holder has " + to_string(balance) + " shares, requested " + to_string(shares));
    }

    RemoveLiquidityPlan plan{};
    plan.shares = shares;
    plan.amount0 = math::mul_div(pool.reserve0, shares, pool.total_shares);
    plan.amount1 = math::mul_div(pool.reserve1, shares, pool.total_shares);

    if (plan.amount0 == 0 || plan.amount1 == 0) {
        throw AmmError(ErrorCode::InsufficientLiquidity, "burn releases nothing");
    }
    return plan;
}

void LiquidityEngine::apply_add(Pool& pool, const Address& provider,
                                const AddLiquidityPlan& plan) {
    pool.share_balances[provider] += plan.shares;
    pool.total_shares += plan.shares;
    pool.reserve0 += plan.amount0;
    pool.reserve1 += plan.amount1;
}

void LiquidityEngine::apply_remove(Pool& pool, const Address& provider,
                                   const RemoveLiquidityPlan& plan) {
    auto it = pool.share_balances.find(provider);
    it->second -= plan.shares;
    if (it->second == 0) {
        pool.share_balances.erase(it);
    }
    pool.total_shares -= plan.shares;
    pool.reserve0 -= plan.amount0;
    pool.reserve1 -= plan.amount1;
}

} // namespace cpamm
