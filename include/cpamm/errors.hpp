#ifndef CPAMM_ERRORS_HPP
#define CPAMM_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cpamm {

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : uint8_t {
    PoolExists = 1,
    PoolNotFound = 2,
    InsufficientAmounts = 3,
    InsufficientLiquidity = 4,
    InvalidToken = 5,
    SlippageExceeded = 6,
    InsufficientAllowance = 7,
    InsufficientBalance = 8
};

inline constexpr const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::PoolExists: return "PoolExists";
        case ErrorCode::PoolNotFound: return "PoolNotFound";
        case ErrorCode::InsufficientAmounts: return "InsufficientAmounts";
        case ErrorCode::InsufficientLiquidity: return "InsufficientLiquidity";
        case ErrorCode::InvalidToken: return "InvalidToken";
        case ErrorCode::SlippageExceeded: return "SlippageExceeded";
        case ErrorCode::InsufficientAllowance: return "InsufficientAllowance";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
    }
    return "unknown";
}

// Short reason reported to callers
inline constexpr const char* default_message(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::PoolExists: return "pool exists";
        case ErrorCode::PoolNotFound: return "pool not found";
        case ErrorCode::InsufficientAmounts: return "insufficient amounts";
        case ErrorCode::InsufficientLiquidity: return "insufficient liquidity";
        case ErrorCode::InvalidToken: return "invalid token";
        case ErrorCode::SlippageExceeded: return "slippage";
        case ErrorCode::InsufficientAllowance: return "insufficient allowance";
        case ErrorCode::InsufficientBalance: return "insufficient balance";
    }
    return "unknown error";
}

// Caller-correctable rejection; the operation left no state change
class AmmError : public std::runtime_error {
public:
    explicit AmmError(ErrorCode code)
        : std::runtime_error(default_message(code)), code_(code) {}

    AmmError(ErrorCode code, const std::string& detail)
        : std::runtime_error(std::string(default_message(code)) + ": " + detail), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Internal defect in the pricing math. Never a caller error and never
// retried; deliberately outside the AmmError hierarchy.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& msg) : std::logic_error(msg) {}
};

} // namespace cpamm

#endif // CPAMM_ERRORS_HPP
