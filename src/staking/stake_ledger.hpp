#ifndef LOCKSTAKE_STAKING_STAKE_LEDGER_HPP
#define LOCKSTAKE_STAKING_STAKE_LEDGER_HPP

#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "../core/asset_transfer.hpp"
#include "../core/clock.hpp"
#include "../core/staking_error.hpp"
#include "../util/hashing.hpp"
#include "../util/logger.hpp"
#include "config_registry.hpp"
#include "participant_roster.hpp"
#include "reward_accrual.hpp"
#include "stake_record.hpp"

/**
 * @file stake_ledger.hpp
 * @brief Per-account staking state machine and the aggregates built over it.
 *
 * STATES:
 *   Inactive (no live record)  --stake-->            Active
 *   Active                     --restake-->          Active (same record, new lock)
 *   Active                     --claimReward-->      Active (before maturity only)
 *   Active                     --unstake-->          Inactive (after maturity only)
 *
 * ATOMICITY:
 *   - Every precondition is checked before anything is written.
 *   - The record is written before the transfer collaborator is called, so a
 *     collaborator that calls back into the ledger sees the new state.
 *   - If the transfer reports failure (or throws) the previous record is put
 *     back and the call fails with TransferFailed; nothing else has changed.
 *   - The roster and the event journal are appended only after the transfer
 *     succeeded.
 *   - A mutating call that arrives while another mutating call is still in
 *     flight fails with ReentrantCall. A recursive mutex serializes callers
 *     on other threads for the duration of an operation.
 *
 * The clock is read once at the start of each operation.
 */

namespace lockstake {
namespace staking {

/**
 * @enum EventKind
 * @brief What a committed ledger operation did.
 */
enum class EventKind : uint8_t {
    Staked = 0,
    Unstaked,
    Restaked,
    RewardClaimed,
    ScheduleAdded,
    ScheduleUpdated,
    ScheduleDisabled
};

inline const char *eventKindName(EventKind kind)
{
    switch (kind) {
    case EventKind::Staked:           return "Staked";
    case EventKind::Unstaked:         return "Unstaked";
    case EventKind::Restaked:         return "Restaked";
    case EventKind::RewardClaimed:    return "RewardClaimed";
    case EventKind::ScheduleAdded:    return "ScheduleAdded";
    case EventKind::ScheduleUpdated:  return "ScheduleUpdated";
    case EventKind::ScheduleDisabled: return "ScheduleDisabled";
    }
    return "Unknown";
}

/**
 * @struct LedgerEvent
 * @brief Journal entry for one committed operation.
 *
 * amount is the principal (Staked, Unstaked, Restaked), the reward
 * (RewardClaimed) or the new percentage (ScheduleAdded, ScheduleUpdated).
 */
struct LedgerEvent
{
    EventKind kind;
    std::string account;
    core::Amount amount;
    uint64_t scheduleIndex;
    core::Timestamp at;
};

class StakeLedger
{
public:
    StakeLedger(ConfigRegistry &registry, core::IAssetTransfer &transfer, const core::IClock &clock)
        : registry_(registry)
        , transfer_(transfer)
        , clock_(clock)
        , inFlight_(false)
    {
    }

    StakeLedger(const StakeLedger&) = delete;
    StakeLedger& operator=(const StakeLedger&) = delete;

    // ------------------------------------------------------------------
    //  State transitions
    // ------------------------------------------------------------------

    /**
     * @brief Lock amount under schedule scheduleIndex.
     * @throw StakingError AlreadyStaking, InvalidAmount, IndexOutOfRange,
     *        ScheduleDisabled, ArithmeticOverflow, TransferFailed, ReentrantCall.
     */
    void stake(const std::string &account, core::Amount amount, size_t scheduleIndex)
    {
        OperationGuard guard(*this, "stake");
        const core::Timestamp now = clock_.now();

        if (isActiveLocked(account)) {
            reject(core::ErrorCode::AlreadyStaking, account + " already has an active stake");
        }
        if (amount == 0) {
            reject(core::ErrorCode::InvalidAmount, "stake amount must be positive");
        }
        const RewardSchedule schedule = usableSchedule(scheduleIndex);
        requireComputableRate(amount, schedule);
        const core::Timestamp maturity = maturityFrom(now, schedule);

        StakeRecord fresh;
        fresh.principal = amount;
        applySchedule(fresh, schedule, now, maturity);

        RecordWrite write(*this, account);
        records_[account] = fresh;
        if (!callTransfer(write, [&] { return transfer_.pullFrom(account, amount); })) {
            reject(core::ErrorCode::TransferFailed,
                   "could not pull " + std::to_string(amount) + " from " + account);
        }

        roster_.append(account);
        journal(EventKind::Staked, account, amount, scheduleIndex, now);
        lockstake::util::logger::info("[StakeLedger] " + account + " staked " +
            std::to_string(amount) + " on schedule #" + std::to_string(scheduleIndex) +
            ", matures at " + std::to_string(fresh.maturityTime));
    }

    /**
     * @brief Return principal after maturity and reset the record.
     * @return The principal paid back.
     * @throw StakingError NotStaking, LockNotMatured, TransferFailed, ReentrantCall.
     */
    core::Amount unstake(const std::string &account)
    {
        OperationGuard guard(*this, "unstake");
        const core::Timestamp now = clock_.now();

        const StakeRecord current = activeRecord(account);
        if (now < current.maturityTime) {
            reject(core::ErrorCode::LockNotMatured,
                   account + " is locked until " + std::to_string(current.maturityTime));
        }

        const core::Amount principal = current.principal;
        RecordWrite write(*this, account);
        records_[account] = StakeRecord();
        if (!callTransfer(write, [&] { return transfer_.pushTo(account, principal); })) {
            reject(core::ErrorCode::TransferFailed,
                   "could not return " + std::to_string(principal) + " to " + account);
        }

        journal(EventKind::Unstaked, account, principal, 0, now);
        lockstake::util::logger::info("[StakeLedger] " + account + " unstaked " +
                                      std::to_string(principal));
        return principal;
    }

    /**
     * @brief Start a new lock on the same principal after maturity. No transfer.
     * @throw StakingError NotStaking, LockNotMatured, IndexOutOfRange,
     *        ScheduleDisabled, ArithmeticOverflow, ReentrantCall.
     */
    void restake(const std::string &account, size_t scheduleIndex)
    {
        OperationGuard guard(*this, "restake");
        const core::Timestamp now = clock_.now();

        const StakeRecord current = activeRecord(account);
        if (now < current.maturityTime) {
            reject(core::ErrorCode::LockNotMatured,
                   account + " is locked until " + std::to_string(current.maturityTime));
        }
        const RewardSchedule schedule = usableSchedule(scheduleIndex);
        requireComputableRate(current.principal, schedule);
        const core::Timestamp maturity = maturityFrom(now, schedule);

        StakeRecord &record = records_[account];
        applySchedule(record, schedule, now, maturity);

        journal(EventKind::Restaked, account, record.principal, scheduleIndex, now);
        lockstake::util::logger::info("[StakeLedger] " + account + " restaked " +
            std::to_string(record.principal) + " on schedule #" + std::to_string(scheduleIndex) +
            ", matures at " + std::to_string(record.maturityTime));
    }

    /**
     * @brief Pay the whole days accrued since the last claim.
     * @return The reward paid.
     * @throw StakingError NotStaking, LockMatured, NoRewardAvailable,
     *        TransferFailed, ReentrantCall.
     */
    core::Amount claimReward(const std::string &account)
    {
        OperationGuard guard(*this, "claimReward");
        const core::Timestamp now = clock_.now();

        const StakeRecord current = activeRecord(account);
        if (now >= current.maturityTime) {
            reject(core::ErrorCode::LockMatured,
                   account + " matured at " + std::to_string(current.maturityTime) +
                   "; unstake or restake instead");
        }
        const core::Amount reward = accrual::accruedReward(current, now);
        if (reward == 0) {
            reject(core::ErrorCode::NoRewardAvailable,
                   account + " has no whole day accrued since " +
                   std::to_string(current.lastClaimTime));
        }

        RecordWrite write(*this, account);
        StakeRecord &record = records_[account];
        record.totalClaimed += reward;
        record.lastClaimTime = now;
        if (!callTransfer(write, [&] { return transfer_.pushTo(account, reward); })) {
            reject(core::ErrorCode::TransferFailed,
                   "could not pay reward " + std::to_string(reward) + " to " + account);
        }

        journal(EventKind::RewardClaimed, account, reward, 0, now);
        lockstake::util::logger::info("[StakeLedger] " + account + " claimed " +
                                      std::to_string(reward));
        return reward;
    }

    // ------------------------------------------------------------------
    //  Catalog changes (operator only), journaled here
    // ------------------------------------------------------------------

    UpsertOutcome upsertSchedule(const std::string &caller, uint32_t lockDays, uint32_t percentage)
    {
        OperationGuard guard(*this, "upsertSchedule");
        const core::Timestamp now = clock_.now();
        UpsertOutcome out = registry_.upsert(caller, lockDays, percentage);
        journal(out.appended ? EventKind::ScheduleAdded : EventKind::ScheduleUpdated,
                caller, percentage, out.index, now);
        return out;
    }

    void disableSchedule(const std::string &caller, size_t index)
    {
        OperationGuard guard(*this, "disableSchedule");
        const core::Timestamp now = clock_.now();
        registry_.disable(caller, index);
        journal(EventKind::ScheduleDisabled, caller, 0, index, now);
    }

    // ------------------------------------------------------------------
    //  Queries
    // ------------------------------------------------------------------

    /// The account's record, or the inactive sentinel.
    StakeRecord getStake(const std::string &account) const
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = records_.find(account);
        if (it == records_.end()) {
            return StakeRecord();
        }
        return it->second;
    }

    bool isStaking(const std::string &account) const
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return isActiveLocked(account);
    }

    /**
     * @brief What claimReward would pay right now; 0 when inactive or matured.
     */
    core::Amount pendingReward(const std::string &account) const
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto it = records_.find(account);
        const core::Timestamp now = clock_.now();
        if (it == records_.end() || !it->second.isActive || now >= it->second.maturityTime) {
            return 0;
        }
        return accrual::accruedReward(it->second, now);
    }

    /// Historical: every stake ever made, re-entries included.
    size_t participantCount() const
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return roster_.length();
    }

    /// Live: accounts holding an active record right now.
    size_t activeParticipantCount() const
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        size_t n = 0;
        for (const auto &kv : records_) {
            if (kv.second.isActive) {
                ++n;
            }
        }
        return n;
    }

    /**
     * @brief Sum of current principal over the roster's distinct accounts.
     * @throw StakingError(ArithmeticOverflow) if the sum does not fit in 64 bits.
     */
    core::Amount poolTotal() const
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        core::Amount total = 0;
        for (const auto &account : roster_.distinctAccounts()) {
            auto it = records_.find(account);
            if (it != records_.end() && it->second.isActive) {
                if (it->second.principal > std::numeric_limits<core::Amount>::max() - total) {
                    reject(core::ErrorCode::ArithmeticOverflow, "pooled principal exceeds 64 bits");
                }
                total += it->second.principal;
            }
        }
        return total;
    }

    /**
     * @brief Daily rate a hypothetical stake would earn on a catalog entry.
     *        Disabled entries can still be previewed.
     * @throw StakingError(IndexOutOfRange)
     */
    core::Amount estimateDailyRate(core::Amount principal, size_t scheduleIndex) const
    {
        const RewardSchedule s = registry_.get(scheduleIndex);
        return accrual::dailyRate(principal, s.lockDays, s.percentage);
    }

    std::vector<std::string> roster() const
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return roster_.entries();
    }

    std::vector<LedgerEvent> events() const
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return events_;
    }

    const ConfigRegistry &registry() const { return registry_; }

    /**
     * @brief SHA-256 fingerprint of the catalog, active records and roster.
     *
     * Inactive rows are skipped so a reset record hashes like an account that
     * never staked.
     */
    std::string stateDigest() const
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        lockstake::util::hashing::Sha256Builder h;

        const auto schedules = registry_.list();
        h.addU64(schedules.size());
        for (const auto &s : schedules) {
            h.addU64(s.lockDays);
            h.addU64(s.lockSeconds);
            h.addU64(s.percentage);
            h.addBool(s.enabled);
        }

        h.addU64(activeParticipantCount());
        for (const auto &kv : records_) {   // std::map: sorted by account
            const StakeRecord &r = kv.second;
            if (!r.isActive) {
                continue;
            }
            h.addString(kv.first);
            h.addU64(r.principal);
            h.addU64(r.startTime);
            h.addU64(r.maturityTime);
            h.addU64(r.lockSeconds);
            h.addU64(r.lockDays);
            h.addU64(r.percentage);
            h.addU64(r.totalClaimed);
            h.addU64(r.lastClaimTime);
        }

        h.addU64(roster_.length());
        for (const auto &account : roster_.entries()) {
            h.addString(account);
        }
        return h.finalizeHex();
    }

private:
    /**
     * Holds the ledger mutex and marks a mutating operation in flight.
     */
    class OperationGuard
    {
    public:
        OperationGuard(StakeLedger &ledger, const char *op)
            : ledger_(ledger), lock_(ledger.mutex_)
        {
            if (ledger_.inFlight_) {
                lockstake::util::logger::warn(std::string("[StakeLedger] reentrant ") + op +
                                              " rejected");
                throw core::StakingError(core::ErrorCode::ReentrantCall,
                                         std::string(op) + " called while another operation is in flight");
            }
            ledger_.inFlight_ = true;
        }

        ~OperationGuard() { ledger_.inFlight_ = false; }

        OperationGuard(const OperationGuard&) = delete;
        OperationGuard& operator=(const OperationGuard&) = delete;

    private:
        StakeLedger &ledger_;
        std::lock_guard<std::recursive_mutex> lock_;
    };

    /**
     * Remembers an account's row before it is written so an aborted transfer
     * can put it back exactly, including "no row at all".
     */
    class RecordWrite
    {
    public:
        RecordWrite(StakeLedger &ledger, const std::string &account)
            : ledger_(ledger), account_(account)
        {
            auto it = ledger_.records_.find(account_);
            hadRow_ = it != ledger_.records_.end();
            if (hadRow_) {
                prior_ = it->second;
            }
        }

        void restore()
        {
            if (hadRow_) {
                ledger_.records_[account_] = prior_;
            } else {
                ledger_.records_.erase(account_);
            }
        }

    private:
        StakeLedger &ledger_;
        std::string account_;
        bool hadRow_;
        StakeRecord prior_;
    };

    // Runs the transfer; on false or on an exception the record write is undone.
    template <typename Fn>
    bool callTransfer(RecordWrite &write, Fn &&fn)
    {
        bool ok = false;
        try {
            ok = fn();
        } catch (...) {
            write.restore();
            throw;
        }
        if (!ok) {
            write.restore();
        }
        return ok;
    }

    [[noreturn]] static void reject(core::ErrorCode code, const std::string &detail)
    {
        lockstake::util::logger::warn(std::string("[StakeLedger] ") + core::errorCodeName(code) +
                                      ": " + detail);
        throw core::StakingError(code, detail);
    }

    bool isActiveLocked(const std::string &account) const
    {
        auto it = records_.find(account);
        return it != records_.end() && it->second.isActive;
    }

    StakeRecord activeRecord(const std::string &account) const
    {
        auto it = records_.find(account);
        if (it == records_.end() || !it->second.isActive) {
            reject(core::ErrorCode::NotStaking, account + " has no active stake");
        }
        return it->second;
    }

    RewardSchedule usableSchedule(size_t index) const
    {
        if (index >= registry_.size()) {
            reject(core::ErrorCode::IndexOutOfRange,
                   "schedule index " + std::to_string(index) + " out of range");
        }
        RewardSchedule s = registry_.get(index);
        if (!s.enabled) {
            reject(core::ErrorCode::ScheduleDisabled,
                   "schedule " + std::to_string(index) + " is disabled");
        }
        return s;
    }

    // Reject up front a principal whose reward math would overflow later.
    static void requireComputableRate(core::Amount principal, const RewardSchedule &s)
    {
        accrual::dailyRate(principal, s.lockDays, s.percentage);
    }

    static core::Timestamp maturityFrom(core::Timestamp now, const RewardSchedule &s)
    {
        if (s.lockSeconds > std::numeric_limits<core::Timestamp>::max() - now) {
            reject(core::ErrorCode::ArithmeticOverflow,
                   "a " + std::to_string(s.lockDays) + "-day lock starting at " +
                   std::to_string(now) + " ends past the clock range");
        }
        return now + s.lockSeconds;
    }

    // Fresh lock starting at now; principal is left as is.
    static void applySchedule(StakeRecord &r, const RewardSchedule &s, core::Timestamp now,
                              core::Timestamp maturity)
    {
        r.startTime     = now;
        r.maturityTime  = maturity;
        r.lockSeconds   = s.lockSeconds;
        r.lockDays      = s.lockDays;
        r.percentage    = s.percentage;
        r.totalClaimed  = 0;
        r.lastClaimTime = now;
        r.isActive      = true;
    }

    void journal(EventKind kind, const std::string &account, core::Amount amount,
                 uint64_t scheduleIndex, core::Timestamp at)
    {
        events_.push_back(LedgerEvent{kind, account, amount, scheduleIndex, at});
    }

    ConfigRegistry &registry_;
    core::IAssetTransfer &transfer_;
    const core::IClock &clock_;

    mutable std::recursive_mutex mutex_;
    bool inFlight_;

    std::map<std::string, StakeRecord> records_;
    ParticipantRoster roster_;
    std::vector<LedgerEvent> events_;
};

} // namespace staking
} // namespace lockstake

#endif // LOCKSTAKE_STAKING_STAKE_LEDGER_HPP
