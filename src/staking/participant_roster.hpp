#ifndef LOCKSTAKE_STAKING_PARTICIPANT_ROSTER_HPP
#define LOCKSTAKE_STAKING_PARTICIPANT_ROSTER_HPP

#include <set>
#include <string>
#include <vector>

namespace lockstake {
namespace staking {

/**
 * @class ParticipantRoster
 * @brief Append-only log of every successful stake, in order.
 *
 * This is a log and not a membership set: an account that stakes, unstakes
 * and stakes again is listed twice. length() is therefore the historical
 * number of stake events; live membership comes from the ledger's records.
 *
 * Not synchronized. StakeLedger owns it and serializes access.
 */
class ParticipantRoster
{
public:
    void append(const std::string &account)
    {
        log_.push_back(account);
    }

    size_t length() const { return log_.size(); }

    /// Copy of the log, duplicates and order preserved.
    std::vector<std::string> entries() const { return log_; }

    /// Each account that ever staked, once, sorted.
    std::set<std::string> distinctAccounts() const
    {
        return std::set<std::string>(log_.begin(), log_.end());
    }

private:
    std::vector<std::string> log_;
};

} // namespace staking
} // namespace lockstake

#endif // LOCKSTAKE_STAKING_PARTICIPANT_ROSTER_HPP
