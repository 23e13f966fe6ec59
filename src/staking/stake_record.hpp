#ifndef LOCKSTAKE_STAKING_STAKE_RECORD_HPP
#define LOCKSTAKE_STAKING_STAKE_RECORD_HPP

#include <cstdint>
#include "../core/asset_transfer.hpp"
#include "../core/clock.hpp"

namespace lockstake {
namespace staking {

/**
 * @struct StakeRecord
 * @brief One account's staking position.
 *
 * Schedule parameters are copied in at stake/restake time, so later catalog
 * edits never reach a live record. A default-constructed record is the
 * inactive sentinel: every field zero, isActive false. unstake() resets a
 * record to exactly this value.
 */
struct StakeRecord
{
    core::Amount principal;
    core::Timestamp startTime;
    core::Timestamp maturityTime;  ///< startTime + lockSeconds
    uint64_t lockSeconds;
    uint32_t lockDays;
    uint32_t percentage;
    core::Amount totalClaimed;     ///< Rewards paid during the current lock.
    core::Timestamp lastClaimTime;
    bool isActive;

    StakeRecord()
        : principal(0), startTime(0), maturityTime(0), lockSeconds(0), lockDays(0),
          percentage(0), totalClaimed(0), lastClaimTime(0), isActive(false)
    {}

    bool operator==(const StakeRecord &o) const
    {
        return principal == o.principal && startTime == o.startTime &&
               maturityTime == o.maturityTime && lockSeconds == o.lockSeconds &&
               lockDays == o.lockDays && percentage == o.percentage &&
               totalClaimed == o.totalClaimed && lastClaimTime == o.lastClaimTime &&
               isActive == o.isActive;
    }

    bool operator!=(const StakeRecord &o) const { return !(*this == o); }
};

} // namespace staking
} // namespace lockstake

#endif // LOCKSTAKE_STAKING_STAKE_RECORD_HPP
