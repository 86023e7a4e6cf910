// IptvMux - IPTV Stream Multiplexing Proxy
// Clock abstraction
//
// Idle detection and reclamation compare timestamps taken from an IClock so
// tests can drive time explicitly with ManualClock instead of sleeping.

#ifndef IPTVMUX_CORE_CLOCK_HPP
#define IPTVMUX_CORE_CLOCK_HPP

#include "iptvmux/core/types.hpp"

#include <atomic>
#include <chrono>

namespace iptvmux {
namespace core {

/**
 * @brief Source of monotonic time.
 */
class IClock {
public:
    virtual ~IClock() = default;

    /**
     * @brief Current monotonic time.
     */
    virtual TimePoint now() const = 0;
};

/**
 * @brief IClock backed by std::chrono::steady_clock.
 */
class SteadyClock : public IClock {
public:
    TimePoint now() const override {
        return Clock::now();
    }
};

/**
 * @brief Manually advanced clock for deterministic tests.
 *
 * Starts at the real steady_clock reading taken at construction and only
 * moves when advance() is called. Thread-safe.
 */
class ManualClock : public IClock {
public:
    ManualClock()
        : ticks_(Clock::now().time_since_epoch().count()) {}

    TimePoint now() const override {
        return TimePoint(Duration(ticks_.load()));
    }

    template<typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        ticks_.fetch_add(std::chrono::duration_cast<Duration>(delta).count());
    }

private:
    std::atomic<Duration::rep> ticks_;
};

} // namespace core
} // namespace iptvmux

#endif // IPTVMUX_CORE_CLOCK_HPP
