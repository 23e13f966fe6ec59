#ifndef LOCKSTAKE_UTIL_CONFIG_PARSER_HPP
#define LOCKSTAKE_UTIL_CONFIG_PARSER_HPP

#include <cstdint>
#include <fstream>
#include <limits>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include "../../config/ledger_config.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads lockstake.conf into a LedgerConfig.
 *
 * FORMAT:
 *   - One "key=value" per line, '#' starts a comment line, blank lines ignored.
 *   - balance=<account>:<amount> and schedule=<days>:<percent> may repeat.
 *   - The first schedule= line drops the compiled-in seed schedules.
 *
 * USAGE:
 *   @code
 *   lockstake::config::LedgerConfig cfg;
 *   lockstake::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("lockstake.conf");
 *   @endcode
 */

namespace lockstake {
namespace util {

class ConfigParser
{
public:
    explicit ConfigParser(lockstake::config::LedgerConfig &config)
        : config_(config)
    {
    }

    /**
     * @brief Parse the given file into the referenced LedgerConfig.
     * @return false if the file does not exist (defaults are kept).
     * @throw std::runtime_error on malformed lines or values.
     */
    bool loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            lockstake::util::logger::warn("ConfigParser: File not found: " + filepath);
            return false;
        }

        lockstake::util::logger::info("ConfigParser: Loading config from " + filepath);
        loadFromStream(inFile);
        lockstake::util::logger::info("ConfigParser: Config loaded.");
        return true;
    }

    /**
     * @brief Parse already-open config text (used by loadFromFile and the tests).
     */
    void loadFromStream(std::istream &in)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: line " + std::to_string(lineNo) +
                                         " has no '=': " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }
    }

private:
    lockstake::config::LedgerConfig &config_;
    std::mutex mutex_;

    void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "operator") {
            requireNonEmpty(key, val);
            config_.operatorAccount = val;
            lockstake::util::logger::debug("ConfigParser: operator set to " + val);
        }
        else if (key == "poolAccount") {
            requireNonEmpty(key, val);
            config_.poolAccount = val;
            lockstake::util::logger::debug("ConfigParser: poolAccount set to " + val);
        }
        else if (key == "logLevel") {
            // validate now so a typo fails at load time
            lockstake::util::logger::parseLogLevel(val);
            config_.logLevel = val;
        }
        else if (key == "logFile") {
            config_.logFile = val;
        }
        else if (key == "scriptFile") {
            config_.scriptFile = val;
        }
        else if (key == "startTime") {
            config_.startTime = parseUInt(val);
        }
        else if (key == "balance") {
            auto parts = splitPair(key, val);
            requireNonEmpty(key, parts.first);
            config_.openingBalances.emplace_back(parts.first, parseUInt(parts.second));
        }
        else if (key == "schedule") {
            auto parts = splitPair(key, val);
            uint64_t days = parseUInt(parts.first);
            uint64_t pct = parseUInt(parts.second);
            if (days == 0 || days > std::numeric_limits<uint32_t>::max() ||
                pct > std::numeric_limits<uint32_t>::max()) {
                throw std::runtime_error("ConfigParser: schedule out of range: " + val);
            }
            if (!config_.customSchedules) {
                config_.seedSchedules.clear();
                config_.customSchedules = true;
            }
            config_.seedSchedules.push_back({static_cast<uint32_t>(days),
                                             static_cast<uint32_t>(pct)});
            lockstake::util::logger::debug("ConfigParser: schedule " + val + " added");
        }
        else {
            lockstake::util::logger::warn("ConfigParser: Unrecognized key '" + key +
                                          "' with value '" + val + "'");
        }
    }

    static void requireNonEmpty(const std::string &key, const std::string &val)
    {
        if (val.empty()) {
            throw std::runtime_error("ConfigParser: empty value for '" + key + "'");
        }
    }

    // "a:b" -> {a, b}
    std::pair<std::string, std::string> splitPair(const std::string &key, const std::string &val)
    {
        auto colon = val.rfind(':');
        if (colon == std::string::npos) {
            throw std::runtime_error("ConfigParser: '" + key + "' expects <a>:<b>, got '" + val + "'");
        }
        std::string a = val.substr(0, colon);
        std::string b = val.substr(colon + 1);
        trim(a);
        trim(b);
        return {a, b};
    }

    static void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, pos);
        s.erase(s.find_last_not_of(whitespace) + 1);
    }

    static uint64_t parseUInt(const std::string &val)
    {
        if (val.empty() || val[0] == '-' || val[0] == '+') {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("Non-numeric suffix");
            }
            return n;
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }
};

} // namespace util
} // namespace lockstake

#endif // LOCKSTAKE_UTIL_CONFIG_PARSER_HPP
