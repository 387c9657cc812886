#ifndef CPAMM_LEDGER_HPP
#define CPAMM_LEDGER_HPP

#include <map>
#include <utility>

#include "transfer.hpp"
#include "types.hpp"

namespace cpamm {

// =============================================================================
// Ledger - In-memory fungible asset accounting
// =============================================================================

// Balances and allowances for any number of assets. Allowances are always
// granted to the custody account, which is the only spender.
class Ledger : public IAssetTransfer {
public:
    explicit Ledger(const Address& custody = addresses::AMM_CUSTODY);

    // Credit new units to `to`
    void mint(const Asset& asset, const Address& to, U128 amount);

    // Set the amount custody may pull from `owner`
    void approve(const Asset& asset, const Address& owner, U128 amount);

    // Holder-to-holder transfer; throws AmmError(InsufficientBalance)
    void transfer(const Asset& asset, const Address& from, const Address& to, U128 amount);

    [[nodiscard]] U128 balance_of(const Asset& asset, const Address& holder) const;
    [[nodiscard]] U128 allowance(const Asset& asset, const Address& owner) const;
    [[nodiscard]] U128 total_supply(const Asset& asset) const;
    [[nodiscard]] const Address& custody() const noexcept { return custody_; }

    // IAssetTransfer
    void pull(const Asset& asset, const Address& owner, U128 amount) override;
    void push(const Asset& asset, const Address& recipient, U128 amount) override;
    void revert_pull(const Asset& asset, const Address& owner, U128 amount) override;
    void revert_push(const Asset& asset, const Address& recipient, U128 amount) override;
    U128 custody_balance(const Asset& asset) const override;

private:
    using Key = std::pair<Asset, Address>;

    Address custody_;
    std::map<Key, U128> balances_;
    std::map<Key, U128> allowances_;
    std::map<Asset, U128> supply_;

    void move(const Asset& asset, const Address& from, const Address& to, U128 amount);
};

} // namespace cpamm

#endif // CPAMM_LEDGER_HPP
