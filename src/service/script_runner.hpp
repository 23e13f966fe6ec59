#ifndef LOCKSTAKE_SERVICE_SCRIPT_RUNNER_HPP
#define LOCKSTAKE_SERVICE_SCRIPT_RUNNER_HPP

#include <cstdint>
#include <exception>
#include <istream>
#include <ostream>
#include <string>
#include "../core/clock.hpp"
#include "../util/logger.hpp"
#include "staking_service.hpp"

namespace lockstake {
namespace service {

/*
  script_runner.hpp
  --------------------------------
  Replays a command script against a StakingService, one result line per
  command:

    <lineNo>: OK <message>[ | <payload>]
    <lineNo>: ERR <code> <message>

  Besides "<caller> <RequestType> [args...]" lines, two clock directives drive
  the host's ManualClock:

    advance <seconds>     move forward
    at <timestamp>        jump to an absolute time, never backwards

  Their argument must be a plain unsigned decimal. A directive that would move
  the clock backwards or past the end of its range is rejected with code
  InvalidClock and the clock is left as it was. Blank lines and '#' comments
  are skipped.
*/

class ScriptRunner
{
public:
    ScriptRunner(StakingService &service, lockstake::core::ManualClock &clock, std::ostream &out)
        : m_service(service), m_clock(clock), m_out(out)
    {
    }

    /// Runs every line of in; returns the number of rejected lines.
    int Run(std::istream &in)
    {
        int failures = 0;
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line))
        {
            ++lineNo;
            auto first = line.find_first_not_of(" \t\r");
            if (first == std::string::npos || line[first] == '#')
            {
                continue;
            }
            if (!RunLine(lineNo, line))
            {
                ++failures;
            }
        }
        return failures;
    }

private:
    bool RunLine(size_t lineNo, const std::string &line)
    {
        Request req;
        if (!StakingService::ParseLine(line, req))
        {
            m_out << lineNo << ": ERR BadRequest malformed line\n";
            return false;
        }

        if (req.caller == "advance" || req.caller == "at")
        {
            return RunClockDirective(lineNo, req);
        }

        Response resp = m_service.HandleRequest(req);
        if (resp.success)
        {
            m_out << lineNo << ": OK " << resp.message;
            if (!resp.payload.empty())
            {
                m_out << " | " << resp.payload;
            }
            m_out << "\n";
            return true;
        }
        m_out << lineNo << ": ERR " << resp.code << " " << resp.message << "\n";
        return false;
    }

    // For directives the "caller" slot holds the keyword and requestType the number.
    bool RunClockDirective(size_t lineNo, const Request &req)
    {
        uint64_t value = 0;
        if (!req.args.empty() || !StakingService::ParseUInt(req.requestType, value))
        {
            m_out << lineNo << ": ERR BadRequest '" << req.caller
                  << "' needs one unsigned number of seconds\n";
            return false;
        }
        try
        {
            if (req.caller == "advance")
            {
                m_clock.advance(value);
            }
            else
            {
                m_clock.set(value);
            }
        }
        catch (const std::exception &ex)
        {
            lockstake::util::logger::warn(std::string("[ScriptRunner] ") + ex.what());
            m_out << lineNo << ": ERR InvalidClock " << ex.what() << "\n";
            return false;
        }
        m_out << lineNo << ": OK now=" << m_clock.now() << "\n";
        return true;
    }

    StakingService &m_service;
    lockstake::core::ManualClock &m_clock;
    std::ostream &m_out;
};

} // namespace service
} // namespace lockstake

#endif // LOCKSTAKE_SERVICE_SCRIPT_RUNNER_HPP
