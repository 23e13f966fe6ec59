#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

#include "core/asset_transfer.hpp"
#include "core/clock.hpp"
#include "governance/operator_gate.hpp"
#include "service/script_runner.hpp"
#include "service/staking_service.hpp"
#include "staking/config_registry.hpp"
#include "staking/stake_ledger.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

int main(int argc, char** argv) {
    namespace logger = lockstake::util::logger;

    // 1. Configuration
    lockstake::config::LedgerConfig config;
    std::string configPath = "lockstake.conf";
    if (argc > 1) {
        configPath = argv[1];
    }
    try {
        lockstake::util::ConfigParser parser(config);
        parser.loadFromFile(configPath);
        logger::setLogLevel(logger::parseLogLevel(config.logLevel));
    } catch (const std::exception& ex) {
        logger::critical(std::string("[main] Bad configuration: ") + ex.what());
        return 1;
    }
    if (!config.logFile.empty() && !logger::enableFileOutput(config.logFile, true)) {
        logger::warn("[main] Continuing without log file " + config.logFile);
    }
    if (argc > 2) {
        config.scriptFile = argv[2];
    }

    // 2. Collaborators: asset bank, host clock, operator gate
    lockstake::core::InMemoryAssetBank bank(config.poolAccount);
    for (const auto& entry : config.openingBalances) {
        if (!bank.credit(entry.first, entry.second)) {
            logger::critical("[main] Cannot credit opening balance of " + entry.first);
            return 1;
        }
    }
    lockstake::core::ManualClock clock(config.startTime);
    lockstake::governance::SingleOperatorGate gate(config.operatorAccount);
    logger::info("[main] lockstaked starting, operator=" + gate.operatorAccount());

    // 3. Catalog and ledger
    lockstake::staking::ConfigRegistry registry(gate);
    try {
        registry.initialize(config.seedSchedules);
    } catch (const lockstake::core::StakingError& err) {
        logger::critical(std::string("[main] Cannot seed schedules: ") + err.what());
        return 1;
    }
    lockstake::staking::StakeLedger ledger(registry, bank, clock);
    lockstake::service::StakingService service(ledger);

    // 4. Replay the command script
    lockstake::service::ScriptRunner runner(service, clock, std::cout);
    int failures = 0;
    if (config.scriptFile.empty()) {
        logger::info("[main] Reading commands from stdin");
        failures = runner.Run(std::cin);
    } else {
        std::ifstream script(config.scriptFile);
        if (!script.is_open()) {
            logger::critical("[main] Cannot open script " + config.scriptFile);
            return 1;
        }
        logger::info("[main] Replaying " + config.scriptFile);
        failures = runner.Run(script);
    }

    std::map<std::string, size_t> byKind;
    const auto events = ledger.events();
    for (const auto& ev : events) {
        ++byKind[lockstake::staking::eventKindName(ev.kind)];
    }
    for (const auto& kv : byKind) {
        logger::info("[main]   " + kv.first + ": " + std::to_string(kv.second));
    }
    logger::info("[main] Done: " + std::to_string(events.size()) + " event(s), " +
                 std::to_string(failures) + " rejected request(s), pool balance " +
                 std::to_string(bank.poolBalance()));
    logger::info("[main] State digest " + ledger.stateDigest());
    return 0;
}
