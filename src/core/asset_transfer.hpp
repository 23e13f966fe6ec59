#ifndef LOCKSTAKE_CORE_ASSET_TRANSFER_HPP
#define LOCKSTAKE_CORE_ASSET_TRANSFER_HPP

#include <cstdint>
#include <limits>
#include <mutex>
#include <string>
#include <unordered_map>
#include "../util/logger.hpp"

/**
 * @file asset_transfer.hpp
 * @brief Value-transfer seam between the staking ledger and the fungible asset.
 *
 * The ledger never touches balances directly. It asks an IAssetTransfer to pull
 * principal into the pool and to push principal or rewards back out. The
 * collaborator performs its own balance/allowance checks and reports failure
 * by returning false; the ledger then aborts the whole operation.
 *
 * InMemoryAssetBank is a complete in-process implementation: a map from
 * account to balance plus a designated pool account. The CLI host and the
 * tests use it. A production host would plug in its own token transfer.
 */

namespace lockstake {
namespace core {

/// Amount of the staked asset in minor units.
using Amount = uint64_t;

/**
 * @class IAssetTransfer
 * @brief Moves the staked asset between participant accounts and the pool.
 */
class IAssetTransfer
{
public:
    virtual ~IAssetTransfer() = default;

    /**
     * @brief Move amount from account into the pool.
     * @return false if the account cannot cover it.
     */
    virtual bool pullFrom(const std::string &account, Amount amount) = 0;

    /**
     * @brief Move amount from the pool to account.
     * @return false if the pool cannot cover it.
     */
    virtual bool pushTo(const std::string &account, Amount amount) = 0;
};

/**
 * @class InMemoryAssetBank
 * @brief Balance table with a pool account, implementing IAssetTransfer.
 */
class InMemoryAssetBank : public IAssetTransfer
{
public:
    explicit InMemoryAssetBank(const std::string &poolAccount = "stake.pool")
        : poolAccount_(poolAccount)
    {
    }

    /**
     * @brief Mint amount into account (opening balances, reward funding).
     * @return false if the balance would overflow.
     */
    bool credit(const std::string &account, Amount amount)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Amount &bal = balances_[account];
        if (bal > std::numeric_limits<Amount>::max() - amount) {
            lockstake::util::logger::warn("[AssetBank] credit overflow for " + account);
            return false;
        }
        bal += amount;
        return true;
    }

    bool pullFrom(const std::string &account, Amount amount) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return move(account, poolAccount_, amount);
    }

    bool pushTo(const std::string &account, Amount amount) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return move(poolAccount_, account, amount);
    }

    /**
     * @brief Balance of account; 0 if never seen.
     */
    Amount balanceOf(const std::string &account) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = balances_.find(account);
        if (it == balances_.end()) {
            return 0;
        }
        return it->second;
    }

    Amount poolBalance() const { return balanceOf(poolAccount_); }

    const std::string &poolAccount() const { return poolAccount_; }

private:
    // caller holds mutex_
    bool move(const std::string &from, const std::string &to, Amount amount)
    {
        if (from == to) {
            return true;
        }
        auto src = balances_.find(from);
        if (src == balances_.end() || src->second < amount) {
            lockstake::util::logger::warn("[AssetBank] insufficient balance: " + from +
                                          " needs " + std::to_string(amount));
            return false;
        }
        Amount &dst = balances_[to];
        if (dst > std::numeric_limits<Amount>::max() - amount) {
            lockstake::util::logger::warn("[AssetBank] balance overflow for " + to);
            return false;
        }
        src->second -= amount;
        dst += amount;
        lockstake::util::logger::debug("[AssetBank] moved " + std::to_string(amount) +
                                       " from " + from + " to " + to);
        return true;
    }

    std::string poolAccount_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Amount> balances_;
};

} // namespace core
} // namespace lockstake

#endif // LOCKSTAKE_CORE_ASSET_TRANSFER_HPP
