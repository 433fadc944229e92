#ifndef REWARDLEDGER_CORE_SETTLEMENT_ERROR_HPP
#define REWARDLEDGER_CORE_SETTLEMENT_ERROR_HPP

#include <stdexcept>
#include <string>

/**
 * @file settlement_error.hpp
 * @brief Error taxonomy of the settlement paths.
 *
 * Every code is terminal for the operation that raised it; nothing is retried
 * internally. ErrorCodeName() is the stable string handed to calling layers.
 * Infrastructure faults (database, files) stay plain std::runtime_error.
 */

namespace rewardledger {
namespace core {

enum class ErrorCode {
    Unauthorized,
    InvalidBatch,
    InsufficientBalance,
    AlreadyClaimed,
    InvalidSignature,
    InvalidAmount,
    TransferFailed
};

enum class ErrorCategory {
    Authorization, ///< bad signature, unauthorized caller
    State,         ///< already claimed, malformed batch
    Resource,      ///< insufficient balance, transfer failure
    Validation     ///< non-positive amount, mismatched input
};

inline const char* ErrorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::Unauthorized:        return "unauthorized";
    case ErrorCode::InvalidBatch:        return "invalid_batch";
    case ErrorCode::InsufficientBalance: return "insufficient_balance";
    case ErrorCode::AlreadyClaimed:      return "already_claimed";
    case ErrorCode::InvalidSignature:    return "invalid_signature";
    case ErrorCode::InvalidAmount:       return "invalid_amount";
    case ErrorCode::TransferFailed:      return "transfer_failed";
    }
    return "unknown";
}

inline ErrorCategory CategoryOf(ErrorCode code)
{
    switch (code) {
    case ErrorCode::Unauthorized:
    case ErrorCode::InvalidSignature:
        return ErrorCategory::Authorization;
    case ErrorCode::AlreadyClaimed:
    case ErrorCode::InvalidBatch:
        return ErrorCategory::State;
    case ErrorCode::InsufficientBalance:
    case ErrorCode::TransferFailed:
        return ErrorCategory::Resource;
    case ErrorCode::InvalidAmount:
        return ErrorCategory::Validation;
    }
    return ErrorCategory::Validation;
}

inline const char* ErrorCategoryName(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Authorization: return "authorization";
    case ErrorCategory::State:         return "state";
    case ErrorCategory::Resource:      return "resource";
    case ErrorCategory::Validation:    return "validation";
    }
    return "unknown";
}

class SettlementError : public std::runtime_error
{
public:
    SettlementError(ErrorCode code, const std::string &what)
        : std::runtime_error(what)
        , m_code(code)
    {
    }

    ErrorCode Code() const noexcept { return m_code; }

    ErrorCategory Category() const noexcept { return CategoryOf(m_code); }

private:
    ErrorCode m_code;
};

} // namespace core
} // namespace rewardledger

#endif // REWARDLEDGER_CORE_SETTLEMENT_ERROR_HPP
