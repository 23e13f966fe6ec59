#ifndef LOCKSTAKE_STAKING_CONFIG_REGISTRY_HPP
#define LOCKSTAKE_STAKING_CONFIG_REGISTRY_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "../../config/staking_params.hpp"
#include "../core/staking_error.hpp"
#include "../governance/operator_gate.hpp"
#include "../util/logger.hpp"

/**
 * @file config_registry.hpp
 * @brief Append-only catalog of reward schedules.
 *
 * DESIGN:
 *   - A schedule's index is its permanent identity. Entries are never removed
 *     or reordered; retiring one flips its enabled flag.
 *   - lockSeconds is always derived from lockDays when an entry is written;
 *     there is no way to set it on its own.
 *   - upsert/disable go through the injected IOperatorGate before anything
 *     else is looked at.
 *   - Readers receive copies; nothing hands out references into the catalog.
 *
 * USAGE EXAMPLE:
 *   @code
 *   SingleOperatorGate gate("operator");
 *   ConfigRegistry registry(gate);
 *   registry.initialize();                    // 90/10, 180/20, 360/40
 *   registry.upsert("operator", 30, 3);       // appends index 3
 *   registry.disable("operator", 0);
 *   RewardSchedule s = registry.get(1);
 *   @endcode
 */

namespace lockstake {
namespace staking {

/**
 * @struct RewardSchedule
 * @brief One catalog entry: how long principal is locked and what it pays.
 */
struct RewardSchedule
{
    uint32_t lockDays;     ///< Lock length in whole days.
    uint64_t lockSeconds;  ///< lockDays * kSecondsPerDay.
    uint32_t percentage;   ///< Percent of principal paid over the full lock.
    bool enabled;          ///< New stakes/restakes allowed.

    RewardSchedule()
        : lockDays(0), lockSeconds(0), percentage(0), enabled(false)
    {}

    RewardSchedule(uint32_t days, uint32_t pct)
        : lockDays(days)
        , lockSeconds(static_cast<uint64_t>(days) * lockstake::config::kSecondsPerDay)
        , percentage(pct)
        , enabled(true)
    {}
};

/**
 * @struct UpsertOutcome
 * @brief Which entry an upsert touched and whether it was newly appended.
 */
struct UpsertOutcome
{
    size_t index;
    bool appended;
};

class ConfigRegistry
{
public:
    explicit ConfigRegistry(const lockstake::governance::IOperatorGate &gate)
        : gate_(gate)
    {
    }

    ConfigRegistry(const ConfigRegistry&) = delete;
    ConfigRegistry& operator=(const ConfigRegistry&) = delete;

    /**
     * @brief Seed the catalog, once, in the given order.
     * @throw StakingError(InvalidState) if the catalog is already populated.
     * @throw StakingError(InvalidSchedule) if a seed has lockDays == 0.
     */
    void initialize(const std::vector<lockstake::config::ScheduleSeed> &seeds =
                        lockstake::config::getDefaultParams().seedSchedules)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!schedules_.empty()) {
            throw core::StakingError(core::ErrorCode::InvalidState,
                                     "schedule catalog already initialized");
        }
        for (const auto &seed : seeds) {
            requireValidDays(seed.lockDays);
        }
        for (const auto &seed : seeds) {
            schedules_.emplace_back(seed.lockDays, seed.percentage);
        }
        lockstake::util::logger::info("[ConfigRegistry] Seeded " + std::to_string(seeds.size()) +
                                      " schedule(s).");
    }

    /**
     * @brief Update the percentage of the first entry with matching lockDays
     *        (enabled or not), otherwise append a new enabled entry.
     * @throw StakingError(Unauthorized) for anyone but the operator.
     * @throw StakingError(InvalidSchedule) if lockDays == 0.
     */
    UpsertOutcome upsert(const std::string &caller, uint32_t lockDays, uint32_t percentage)
    {
        gate_.requireOperator(caller, "upsert schedule");
        requireValidDays(lockDays);

        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < schedules_.size(); ++i) {
            if (schedules_[i].lockDays == lockDays) {
                schedules_[i].percentage = percentage;
                lockstake::util::logger::info("[ConfigRegistry] Schedule #" + std::to_string(i) +
                    " (" + std::to_string(lockDays) + " days) percentage -> " +
                    std::to_string(percentage));
                return {i, false};
            }
        }

        schedules_.emplace_back(lockDays, percentage);
        size_t index = schedules_.size() - 1;
        lockstake::util::logger::info("[ConfigRegistry] Schedule #" + std::to_string(index) +
            " added: " + std::to_string(lockDays) + " days / " + std::to_string(percentage) + "%");
        return {index, true};
    }

    /**
     * @brief Soft-disable an entry. It stays addressable by index.
     * @throw StakingError(Unauthorized) for anyone but the operator.
     * @throw StakingError(InvalidState) if index is out of bounds or already disabled.
     */
    void disable(const std::string &caller, size_t index)
    {
        gate_.requireOperator(caller, "disable schedule");

        std::lock_guard<std::mutex> lock(mutex_);
        if (index >= schedules_.size()) {
            throw core::StakingError(core::ErrorCode::InvalidState,
                                     "no schedule at index " + std::to_string(index));
        }
        if (!schedules_[index].enabled) {
            throw core::StakingError(core::ErrorCode::InvalidState,
                                     "schedule " + std::to_string(index) + " already disabled");
        }
        schedules_[index].enabled = false;
        lockstake::util::logger::info("[ConfigRegistry] Schedule #" + std::to_string(index) +
                                      " disabled.");
    }

    /**
     * @throw StakingError(IndexOutOfRange) if index is out of bounds.
     */
    RewardSchedule get(size_t index) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index >= schedules_.size()) {
            throw core::StakingError(core::ErrorCode::IndexOutOfRange,
                                     "schedule index " + std::to_string(index) + " >= " +
                                     std::to_string(schedules_.size()));
        }
        return schedules_[index];
    }

    /// Every entry, disabled ones included, in catalog order.
    std::vector<RewardSchedule> list() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return schedules_;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return schedules_.size();
    }

private:
    static void requireValidDays(uint32_t lockDays)
    {
        if (lockDays == 0) {
            throw core::StakingError(core::ErrorCode::InvalidSchedule,
                                     "lockDays must be at least 1");
        }
    }

    const lockstake::governance::IOperatorGate &gate_;
    mutable std::mutex mutex_;
    std::vector<RewardSchedule> schedules_;
};

} // namespace staking
} // namespace lockstake

#endif // LOCKSTAKE_STAKING_CONFIG_REGISTRY_HPP
