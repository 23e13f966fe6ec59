#ifndef LOCKSTAKE_SERVICE_STAKING_SERVICE_HPP
#define LOCKSTAKE_SERVICE_STAKING_SERVICE_HPP

#include <cstdint>
#include <limits>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "../core/staking_error.hpp"
#include "../staking/stake_ledger.hpp"
#include "../util/logger.hpp"

namespace lockstake {
namespace service {

struct Request
{
    // e.g. "Stake", "ClaimReward", "ListSchedules"
    std::string requestType;

    // Account the request acts for (its own record, or the operator)
    std::string caller;

    // Positional arguments, still as text
    std::vector<std::string> args;

    Request() = default;

    Request(const std::string &type, const std::string &who,
            const std::vector<std::string> &arguments = {})
        : requestType(type), caller(who), args(arguments)
    {}
};

struct Response
{
    bool success;

    // "OK", an ErrorCode name, "BadRequest" or "UnknownRequest"
    std::string code;

    // Human-readable message or error detail
    std::string message;

    // Query result as text, empty for commands without output
    std::string payload;

    Response()
        : success(false)
    {}

    Response(bool ok, const std::string &c, const std::string &msg, const std::string &data = "")
        : success(ok), code(c), message(msg), payload(data)
    {}
};

/*
  staking_service.hpp
  --------------------------------
  Routes textual requests (from the CLI script, a shell, tests) to the
  StakeLedger and its catalog, and turns every outcome into a Response.

  Request types and their args:
    Stake <amount> <scheduleIndex>          Unstake
    Restake <scheduleIndex>                 ClaimReward
    UpsertSchedule <lockDays> <percentage>  DisableSchedule <index>
    ListSchedules                           GetStake
    ParticipantCount                        ActiveParticipantCount
    PoolTotal                               AccruedReward
    EstimateDailyRate <principal> <index>   StateDigest

  A StakingError becomes success=false with code = the error kind name. Bad
  argument counts or non-numeric arguments give code "BadRequest" and never
  reach the ledger.

  Script lines have the form "<caller> <RequestType> [args...]"; ParseLine
  splits them on whitespace.
*/

class StakingService
{
public:
    explicit StakingService(lockstake::staking::StakeLedger &ledger)
        : m_ledger(ledger)
    {
    }

    /*
      HandleRequest:
      - validates the argument shape for the request type,
      - calls the ledger,
      - maps the result or the StakingError onto a Response.
    */
    Response HandleRequest(const Request &req)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        try
        {
            return Dispatch(req);
        }
        catch (const lockstake::core::StakingError &err)
        {
            return Response(false, lockstake::core::errorCodeName(err.code()), err.what());
        }
    }

    /// "<caller> <RequestType> [args...]" -> Request. Returns false on a line with fewer than two words.
    static bool ParseLine(const std::string &line, Request &out)
    {
        std::istringstream iss(line);
        std::vector<std::string> words;
        std::string w;
        while (iss >> w)
        {
            words.push_back(w);
        }
        if (words.size() < 2)
        {
            return false;
        }
        out.caller = words[0];
        out.requestType = words[1];
        out.args.assign(words.begin() + 2, words.end());
        return true;
    }

    /// Plain unsigned decimal, whole string; no sign, no suffix, no overflow.
    static bool ParseUInt(const std::string &s, uint64_t &out)
    {
        if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos)
        {
            return false;
        }
        try
        {
            out = std::stoull(s);
        }
        catch (const std::out_of_range &)
        {
            return false;
        }
        return true;
    }

private:
    Response Dispatch(const Request &req)
    {
        using lockstake::staking::RewardSchedule;
        using lockstake::staking::StakeRecord;

        if (req.caller.empty())
        {
            return BadRequest("caller is required");
        }

        if (req.requestType == "Stake")
        {
            uint64_t amount = 0, index = 0;
            if (req.args.size() != 2 || !ParseUInt(req.args[0], amount) || !ParseUInt(req.args[1], index))
            {
                return BadRequest("expected 'Stake <amount> <scheduleIndex>'");
            }
            m_ledger.stake(req.caller, amount, static_cast<size_t>(index));
            return Ok(req.caller + " staked " + std::to_string(amount));
        }
        else if (req.requestType == "Unstake")
        {
            if (!req.args.empty())
            {
                return BadRequest("expected 'Unstake'");
            }
            auto principal = m_ledger.unstake(req.caller);
            return Ok(req.caller + " unstaked", std::to_string(principal));
        }
        else if (req.requestType == "Restake")
        {
            uint64_t index = 0;
            if (req.args.size() != 1 || !ParseUInt(req.args[0], index))
            {
                return BadRequest("expected 'Restake <scheduleIndex>'");
            }
            m_ledger.restake(req.caller, static_cast<size_t>(index));
            return Ok(req.caller + " restaked on schedule " + std::to_string(index));
        }
        else if (req.requestType == "ClaimReward")
        {
            if (!req.args.empty())
            {
                return BadRequest("expected 'ClaimReward'");
            }
            auto reward = m_ledger.claimReward(req.caller);
            return Ok(req.caller + " claimed reward", std::to_string(reward));
        }
        else if (req.requestType == "UpsertSchedule")
        {
            uint64_t days = 0, pct = 0;
            if (req.args.size() != 2 || !ParseUInt(req.args[0], days) || !ParseUInt(req.args[1], pct) ||
                days > std::numeric_limits<uint32_t>::max() || pct > std::numeric_limits<uint32_t>::max())
            {
                return BadRequest("expected 'UpsertSchedule <lockDays> <percentage>'");
            }
            auto out = m_ledger.upsertSchedule(req.caller, static_cast<uint32_t>(days),
                                               static_cast<uint32_t>(pct));
            return Ok(out.appended ? "schedule added" : "schedule updated", std::to_string(out.index));
        }
        else if (req.requestType == "DisableSchedule")
        {
            uint64_t index = 0;
            if (req.args.size() != 1 || !ParseUInt(req.args[0], index))
            {
                return BadRequest("expected 'DisableSchedule <index>'");
            }
            m_ledger.disableSchedule(req.caller, static_cast<size_t>(index));
            return Ok("schedule " + std::to_string(index) + " disabled");
        }
        else if (req.requestType == "ListSchedules")
        {
            // one line per entry: "<index> <lockDays> <percentage> <enabled|disabled>"
            std::ostringstream oss;
            auto schedules = m_ledger.registry().list();
            for (size_t i = 0; i < schedules.size(); ++i)
            {
                const RewardSchedule &s = schedules[i];
                oss << i << ' ' << s.lockDays << ' ' << s.percentage << ' '
                    << (s.enabled ? "enabled" : "disabled") << '\n';
            }
            return Ok(std::to_string(schedules.size()) + " schedule(s)", oss.str());
        }
        else if (req.requestType == "GetStake")
        {
            StakeRecord r = m_ledger.getStake(req.caller);
            std::ostringstream oss;
            oss << "active=" << (r.isActive ? 1 : 0)
                << " principal=" << r.principal
                << " start=" << r.startTime
                << " maturity=" << r.maturityTime
                << " lockDays=" << r.lockDays
                << " percentage=" << r.percentage
                << " claimed=" << r.totalClaimed
                << " lastClaim=" << r.lastClaimTime;
            return Ok("stake of " + req.caller, oss.str());
        }
        else if (req.requestType == "ParticipantCount")
        {
            return Ok("historical participants", std::to_string(m_ledger.participantCount()));
        }
        else if (req.requestType == "ActiveParticipantCount")
        {
            return Ok("active participants", std::to_string(m_ledger.activeParticipantCount()));
        }
        else if (req.requestType == "PoolTotal")
        {
            return Ok("pooled principal", std::to_string(m_ledger.poolTotal()));
        }
        else if (req.requestType == "AccruedReward")
        {
            return Ok("claimable now", std::to_string(m_ledger.pendingReward(req.caller)));
        }
        else if (req.requestType == "EstimateDailyRate")
        {
            uint64_t principal = 0, index = 0;
            if (req.args.size() != 2 || !ParseUInt(req.args[0], principal) || !ParseUInt(req.args[1], index))
            {
                return BadRequest("expected 'EstimateDailyRate <principal> <scheduleIndex>'");
            }
            auto rate = m_ledger.estimateDailyRate(principal, static_cast<size_t>(index));
            return Ok("daily rate", std::to_string(rate));
        }
        else if (req.requestType == "StateDigest")
        {
            return Ok("state digest", m_ledger.stateDigest());
        }

        lockstake::util::logger::warn("[StakingService] Unknown request type: " + req.requestType);
        return Response(false, "UnknownRequest", "Unknown request type: " + req.requestType);
    }

    static Response Ok(const std::string &msg, const std::string &payload = "")
    {
        return Response(true, "OK", msg, payload);
    }

    static Response BadRequest(const std::string &msg)
    {
        return Response(false, "BadRequest", msg);
    }

private:
    mutable std::mutex m_mutex;
    lockstake::staking::StakeLedger& m_ledger;
};

} // namespace service
} // namespace lockstake

#endif // LOCKSTAKE_SERVICE_STAKING_SERVICE_HPP
