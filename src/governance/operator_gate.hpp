#ifndef LOCKSTAKE_GOVERNANCE_OPERATOR_GATE_HPP
#define LOCKSTAKE_GOVERNANCE_OPERATOR_GATE_HPP

#include <string>
#include "../core/staking_error.hpp"
#include "../util/logger.hpp"

/**
 * @file operator_gate.hpp
 * @brief Authorization check for catalog changes.
 *
 * Only schedule upserts and disables are privileged. The gate is injected into
 * the ConfigRegistry at construction, so the registry never knows who the
 * operator is, only whether a given caller passes.
 */

namespace lockstake {
namespace governance {

/**
 * @class IOperatorGate
 * @brief Decides whether a caller may change the reward catalog.
 */
class IOperatorGate
{
public:
    virtual ~IOperatorGate() = default;

    virtual bool isAuthorized(const std::string &caller) const = 0;

    /**
     * @brief Throw Unauthorized unless caller passes isAuthorized().
     * @param action Short label for the log line (e.g. "upsert").
     */
    void requireOperator(const std::string &caller, const std::string &action) const
    {
        if (!isAuthorized(caller)) {
            lockstake::util::logger::warn("[OperatorGate] " + caller + " denied for " + action);
            throw lockstake::core::StakingError(lockstake::core::ErrorCode::Unauthorized,
                                                caller + " may not " + action);
        }
    }
};

/**
 * @class SingleOperatorGate
 * @brief Admits exactly one configured operator identity.
 */
class SingleOperatorGate : public IOperatorGate
{
public:
    explicit SingleOperatorGate(const std::string &operatorAccount)
        : operator_(operatorAccount)
    {
    }

    bool isAuthorized(const std::string &caller) const override
    {
        return !operator_.empty() && caller == operator_;
    }

    const std::string &operatorAccount() const { return operator_; }

private:
    std::string operator_;
};

} // namespace governance
} // namespace lockstake

#endif // LOCKSTAKE_GOVERNANCE_OPERATOR_GATE_HPP
