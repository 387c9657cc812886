#ifndef CPAMM_TRANSFER_HPP
#define CPAMM_TRANSFER_HPP

#include "types.hpp"

namespace cpamm {

// =============================================================================
// Asset Transfer Interface
// =============================================================================

// Moves asset units in and out of the core's custody. Failures are reported
// by throwing AmmError with InsufficientAllowance or InsufficientBalance.
class IAssetTransfer {
public:
    virtual ~IAssetTransfer() = default;

    // Move `amount` of `asset` from `owner` into custody
    virtual void pull(const Asset& asset, const Address& owner, U128 amount) = 0;

    // Move `amount` of `asset` from custody to `recipient`
    virtual void push(const Asset& asset, const Address& recipient, U128 amount) = 0;

    // Undo a pull made earlier in the same operation. The default returns
    // the units; adapters that consume an authorization should restore it.
    virtual void revert_pull(const Asset& asset, const Address& owner, U128 amount) {
        push(asset, owner, amount);
    }

    // Undo a push made earlier in the same operation: take the units back
    // from `recipient` without any authorization from them
    virtual void revert_push(const Asset& asset, const Address& recipient, U128 amount) = 0;

    // Units of `asset` currently held in custody
    virtual U128 custody_balance(const Asset& asset) const = 0;
};

} // namespace cpamm

#endif // CPAMM_TRANSFER_HPP
