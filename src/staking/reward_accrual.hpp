#ifndef LOCKSTAKE_STAKING_REWARD_ACCRUAL_HPP
#define LOCKSTAKE_STAKING_REWARD_ACCRUAL_HPP

#include <cstdint>
#include <limits>
#include <string>
#include "../../config/staking_params.hpp"
#include "../core/staking_error.hpp"
#include "stake_record.hpp"

/**
 * @file reward_accrual.hpp
 * @brief Stateless reward math for locked stakes.
 *
 * The daily rate truncates twice: first the percentage cut of the principal,
 * then the split of that cut over the lock days. For principal=1000, 10%,
 * 90 days: floor(1000*10/100) = 100, floor(100/90) = 1 per day.
 * The percentage cut is always truncated first.
 *
 * Rewards accrue in whole days only. The remainder of a partial day is not
 * carried anywhere except implicitly through lastClaimTime.
 */

namespace lockstake {
namespace staking {
namespace accrual {

/**
 * @brief floor(floor(principal * percentage / 100) / lockDays).
 * @throw StakingError(InvalidSchedule) if lockDays == 0.
 * @throw StakingError(ArithmeticOverflow) if principal * percentage exceeds 64 bits.
 */
inline core::Amount dailyRate(core::Amount principal, uint32_t lockDays, uint32_t percentage)
{
    if (lockDays == 0) {
        throw core::StakingError(core::ErrorCode::InvalidSchedule,
                                 "daily rate needs lockDays >= 1");
    }
    if (percentage != 0 && principal > std::numeric_limits<core::Amount>::max() / percentage) {
        throw core::StakingError(core::ErrorCode::ArithmeticOverflow,
                                 "principal " + std::to_string(principal) + " * " +
                                 std::to_string(percentage) + "% overflows");
    }
    core::Amount cut = principal * percentage / lockstake::config::kPercentDenominator;
    return cut / lockDays;
}

/**
 * @brief Most a single lock can pay: lockDays whole days at the daily rate.
 */
inline core::Amount totalRewardAtMaturity(core::Amount principal, uint32_t lockDays,
                                          uint32_t percentage)
{
    // dailyRate <= cut / lockDays, so this never exceeds the percentage cut
    return dailyRate(principal, lockDays, percentage) * lockDays;
}

/**
 * @brief Whole days elapsed between two instants; 0 if to precedes from.
 */
inline uint64_t wholeDaysBetween(core::Timestamp from, core::Timestamp to)
{
    if (to <= from) {
        return 0;
    }
    return (to - from) / lockstake::config::kSecondsPerDay;
}

/**
 * @brief Reward owed to record at time now since its last claim.
 * @throw StakingError(NotStaking) if the record is inactive.
 * @throw StakingError(LockMatured) if now >= maturityTime.
 */
inline core::Amount accruedReward(const StakeRecord &record, core::Timestamp now)
{
    if (!record.isActive) {
        throw core::StakingError(core::ErrorCode::NotStaking, "record is not active");
    }
    if (now >= record.maturityTime) {
        throw core::StakingError(core::ErrorCode::LockMatured,
                                 "lock matured at " + std::to_string(record.maturityTime));
    }
    uint64_t elapsedDays = wholeDaysBetween(record.lastClaimTime, now);
    if (elapsedDays == 0) {
        return 0;
    }
    core::Amount rate = dailyRate(record.principal, record.lockDays, record.percentage);
    if (rate != 0 && elapsedDays > std::numeric_limits<core::Amount>::max() / rate) {
        throw core::StakingError(core::ErrorCode::ArithmeticOverflow,
                                 "accrued reward overflows");
    }
    return elapsedDays * rate;
}

} // namespace accrual
} // namespace staking
} // namespace lockstake

#endif // LOCKSTAKE_STAKING_REWARD_ACCRUAL_HPP
