#ifndef LOCKSTAKE_CONFIG_STAKING_PARAMS_HPP
#define LOCKSTAKE_CONFIG_STAKING_PARAMS_HPP

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file staking_params.hpp
 * @brief Compiled-in parameters of the LockStake ledger (day length, seed schedules).
 *
 * Example usage:
 *  @code
 *    auto params = lockstake::config::getDefaultParams();
 *    registry.initialize(params.seedSchedules);
 *  @endcode
 */

namespace lockstake {
namespace config {

/// Length of one accrual day. Fixed: lockSeconds is always lockDays * this.
constexpr uint64_t kSecondsPerDay = 86400;

/// Percentages are whole percent of principal over the full lock.
constexpr uint64_t kPercentDenominator = 100;

/**
 * @struct ScheduleSeed
 * @brief Lock length and payout used to seed one catalog entry.
 */
struct ScheduleSeed
{
    uint32_t lockDays;
    uint32_t percentage;
};

/**
 * @struct StakingParams
 * @brief Ledger-wide constants a host normally leaves alone.
 */
struct StakingParams
{
    // Account that holds pooled principal in the in-memory bank.
    std::string poolAccount;

    // Schedules seeded by ConfigRegistry::initialize, in catalog order.
    std::vector<ScheduleSeed> seedSchedules;
};

/**
 * @brief The standard three-tier catalog: 90 days/10%, 180 days/20%, 360 days/40%.
 */
inline StakingParams getDefaultParams()
{
    StakingParams sp;
    sp.poolAccount   = "stake.pool";
    sp.seedSchedules = {
        {90, 10},
        {180, 20},
        {360, 40},
    };
    return sp;
}

} // namespace config
} // namespace lockstake

#endif // LOCKSTAKE_CONFIG_STAKING_PARAMS_HPP
