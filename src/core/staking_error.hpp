#ifndef LOCKSTAKE_CORE_STAKING_ERROR_HPP
#define LOCKSTAKE_CORE_STAKING_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @file staking_error.hpp
 * @brief Error kinds raised by the LockStake ledger.
 *
 * Every rejected operation throws a StakingError. The ledger never recovers an
 * error internally: the caller sees the kind and decides whether to retry.
 *
 * USAGE:
 *   @code
 *   try {
 *       ledger.stake("alice", 1000, 0);
 *   } catch (const lockstake::core::StakingError &err) {
 *       if (err.code() == lockstake::core::ErrorCode::AlreadyStaking) { ... }
 *   }
 *   @endcode
 */

namespace lockstake {
namespace core {

/**
 * @enum ErrorCode
 * @brief Distinguishes the reasons an operation can be rejected.
 */
enum class ErrorCode : uint8_t {
    AlreadyStaking = 0,   ///< Account already holds an active record.
    InvalidAmount,        ///< Stake amount is zero.
    IndexOutOfRange,      ///< Schedule index past the end of the catalog.
    ScheduleDisabled,     ///< Schedule exists but is soft-disabled.
    NotStaking,           ///< Account has no active record.
    LockNotMatured,       ///< Principal is still locked.
    LockMatured,          ///< Rewards can no longer be claimed.
    NoRewardAvailable,    ///< Less than one whole day accrued since the last claim.
    Unauthorized,         ///< Caller is not the privileged operator.
    TransferFailed,       ///< Transfer collaborator refused the movement.
    InvalidState,         ///< Catalog operation not valid in the current state.
    InvalidSchedule,      ///< Schedule parameters cannot be used (zero-day lock).
    ReentrantCall,        ///< A mutating call arrived while another was in flight.
    ArithmeticOverflow    ///< Reward math does not fit in 64 bits.
};

/**
 * @brief Stable name of an error kind, used in logs and service responses.
 */
inline const char *errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::AlreadyStaking:     return "AlreadyStaking";
    case ErrorCode::InvalidAmount:      return "InvalidAmount";
    case ErrorCode::IndexOutOfRange:    return "IndexOutOfRange";
    case ErrorCode::ScheduleDisabled:   return "ScheduleDisabled";
    case ErrorCode::NotStaking:         return "NotStaking";
    case ErrorCode::LockNotMatured:     return "LockNotMatured";
    case ErrorCode::LockMatured:        return "LockMatured";
    case ErrorCode::NoRewardAvailable:  return "NoRewardAvailable";
    case ErrorCode::Unauthorized:       return "Unauthorized";
    case ErrorCode::TransferFailed:     return "TransferFailed";
    case ErrorCode::InvalidState:       return "InvalidState";
    case ErrorCode::InvalidSchedule:    return "InvalidSchedule";
    case ErrorCode::ReentrantCall:      return "ReentrantCall";
    case ErrorCode::ArithmeticOverflow: return "ArithmeticOverflow";
    }
    return "Unknown";
}

/**
 * @class StakingError
 * @brief Exception carrying an ErrorCode plus a human-readable detail.
 *
 * what() reads "<Kind>: <detail>".
 */
class StakingError : public std::runtime_error
{
public:
    StakingError(ErrorCode code, const std::string &detail)
        : std::runtime_error(std::string(errorCodeName(code)) + ": " + detail)
        , code_(code)
    {
    }

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace core
} // namespace lockstake

#endif // LOCKSTAKE_CORE_STAKING_ERROR_HPP
