// =============================================================================
// ledger.cpp - In-memory asset balances backing IAssetTransfer
// =============================================================================

#include "cpamm/ledger.hpp"
#include "cpamm/errors.hpp"
#include "cpamm/math.hpp"

namespace cpamm {

Ledger::Ledger(const Address& custody) : custody_(custody) {}

void Ledger::mint(const Asset& asset, const Address& to, U128 amount) {
    U128& supply = supply_[asset];
    supply = math::checked_add(supply, amount);
    U128& balance = balances_[{asset, to}];
    balance += amount;  // bounded by supply
}

void Ledger::approve(const Asset& asset, const Address& owner, U128 amount) {
    allowances_[{asset, owner}] = amount;
}

void Ledger::transfer(const Asset& asset, const Address& from, const Address& to, U128 amount) {
    move(asset, from, to, amount);
}

U128 Ledger::balance_of(const Asset& asset, const Address& holder) const {
    auto it = balances_.find({asset, holder});
    return it != balances_.end() ? it->second : 0;
}

U128 Ledger::allowance(const Asset& asset, const Address& owner) const {
    auto it = allowances_.find({asset, owner});
    return it != allowances_.end() ? it->second : 0;
}

U128 Ledger::total_supply(const Asset& asset) const {
    auto it = supply_.find(asset);
    return it != supply_.end() ? it->second : 0;
}

void Ledger::pull(const Asset& asset, const Address& owner, U128 amount) {
    if (owner != custody_) {
        U128 allowed = allowance(asset, owner);
        if (allowed < amount) {
            throw AmmError(ErrorCode::InsufficientAllowance,
                           addresses::to_hex(owner) + " allows " + to_string(allowed) +
                           " < " + to_string(amount));
        }
        // Balance is checked before the allowance is consumed
        if (balance_of(asset, owner) < amount) {
            throw AmmError(ErrorCode::InsufficientBalance,
                           addresses::to_hex(owner) + " holds " +
                           to_string(balance_of(asset, owner)) + " < " + to_string(amount));
        }
        allowances_[{asset, owner}] = allowed - amount;
    }
    move(asset, owner, custody_, amount);
}

void Ledger::push(const Asset& asset, const Address& recipient, U128 amount) {
    move(asset, custody_, recipient, amount);
}

void Ledger::revert_pull(const Asset& asset, const Address& owner, U128 amount) {
    move(asset, custody_, owner, amount);
    if (owner != custody_) {
        U128& allowed = allowances_[{asset, owner}];
        allowed = math::checked_add(allowed, amount);
    }
}

void Ledger::revert_push(const Asset& asset, const Address& recipient, U128 amount) {
    move(asset, recipient, custody_, amount);
}

U128 Ledger::custody_balance(const Asset& asset) const {
    return balance_of(asset, custody_);
}

void Ledger::move(const Asset& asset, const Address& from, const Address& to, U128 amount) {
    U128 available = balance_of(asset, from);
    if (available < amount) {
        throw AmmError(ErrorCode::InsufficientBalance,
                       addresses::to_hex(from) + " holds " + to_string(available) +
                       " < " + to_string(amount));
    }
    if (amount == 0 || from == to) return;
    balances_[{asset, from}] = available - amount;
    balances_[{asset, to}] += amount;
}

} // namespace cpamm
