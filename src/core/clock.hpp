#ifndef LOCKSTAKE_CORE_CLOCK_HPP
#define LOCKSTAKE_CORE_CLOCK_HPP

#include <chrono>
#include <cstdint>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>

/**
 * @file clock.hpp
 * @brief The host clock seen by the ledger.
 *
 * The ledger reads now() exactly once per operation and treats it as an opaque,
 * non-decreasing count of seconds. It never advances the clock itself; the host
 * chooses the implementation.
 */

namespace lockstake {
namespace core {

/// Seconds since an arbitrary epoch chosen by the host.
using Timestamp = uint64_t;

/**
 * @class IClock
 * @brief Source of the current time for ledger operations.
 */
class IClock
{
public:
    virtual ~IClock() = default;

    /**
     * @brief Current time in seconds. Successive calls never go backwards.
     */
    virtual Timestamp now() const = 0;
};

/**
 * @class SystemClock
 * @brief Wall-clock seconds since the Unix epoch.
 */
class SystemClock : public IClock
{
public:
    Timestamp now() const override
    {
        auto since = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<Timestamp>(
            std::chrono::duration_cast<std::chrono::seconds>(since).count());
    }
};

/**
 * @class ManualClock
 * @brief A clock the host moves forward explicitly.
 *
 * Used by the CLI when replaying a command script and by the unit tests.
 */
class ManualClock : public IClock
{
public:
    explicit ManualClock(Timestamp start = 0)
        : current_(start)
    {
    }

    Timestamp now() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    /**
     * @brief Move the clock forward by the given number of seconds.
     * @throw std::overflow_error if the result does not fit in a Timestamp.
     */
    void advance(uint64_t seconds)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (seconds > std::numeric_limits<Timestamp>::max() - current_) {
            throw std::overflow_error("ManualClock: advancing by " + std::to_string(seconds) +
                                      " overflows the clock");
        }
        current_ += seconds;
    }

    /**
     * @brief Jump to an absolute time.
     * @throw std::invalid_argument if t lies before the current time.
     */
    void set(Timestamp t)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (t < current_) {
            throw std::invalid_argument("ManualClock: time cannot move backwards");
        }
        current_ = t;
    }

private:
    mutable std::mutex mutex_;
    Timestamp current_;
};

} // namespace core
} // namespace lockstake

#endif // LOCKSTAKE_CORE_CLOCK_HPP
