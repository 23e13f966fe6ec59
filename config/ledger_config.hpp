#ifndef LOCKSTAKE_CONFIG_LEDGER_CONFIG_HPP
#define LOCKSTAKE_CONFIG_LEDGER_CONFIG_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "staking_params.hpp"

/**
 * @file ledger_config.hpp
 * @brief Host-level settings for a lockstaked process.
 *
 * USAGE:
 *   - Populated with defaults here, then overridden by config_parser.hpp.
 *   - Holds the operator identity, logging, the command script to replay and
 *     the opening balances of the in-memory asset bank.
 */

namespace lockstake {
namespace config {

/**
 * @struct LedgerConfig
 * @brief Settings read from lockstake.conf:
 *   - operatorAccount: the only identity allowed to change the catalog.
 *   - poolAccount: bank account holding pooled principal and reward funds.
 *   - logLevel / logFile: logger setup.
 *   - scriptFile: command script replayed by the CLI (empty = stdin).
 *   - startTime: initial value of the host's manual clock.
 *   - openingBalances: balances credited before the script runs.
 *   - seedSchedules: catalog seeded at start-up.
 */
struct LedgerConfig
{
    /**
     * @brief Construct a LedgerConfig with defaults:
     *   operatorAccount = "operator"
     *   poolAccount     = getDefaultParams().poolAccount
     *   logLevel        = "info"
     *   startTime       = 0
     *   seedSchedules   = getDefaultParams().seedSchedules
     */
    LedgerConfig()
        : operatorAccount("operator"),
          poolAccount(getDefaultParams().poolAccount),
          logLevel("info"),
          startTime(0),
          seedSchedules(getDefaultParams().seedSchedules),
          customSchedules(false)
    {
    }

    std::string operatorAccount;

    std::string poolAccount;

    /// One of debug, info, warn, error, critical.
    std::string logLevel;

    /// Mirror log lines into this file when non-empty.
    std::string logFile;

    std::string scriptFile;

    uint64_t startTime;

    std::vector<std::pair<std::string, uint64_t>> openingBalances;

    std::vector<ScheduleSeed> seedSchedules;

    /// True once a config file supplied its own schedule= lines.
    bool customSchedules;
};

} // namespace config
} // namespace lockstake

#endif // LOCKSTAKE_CONFIG_LEDGER_CONFIG_HPP
