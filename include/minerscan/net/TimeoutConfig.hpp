#pragma once

#include <atomic>
#include <chrono>

namespace minerscan::net {

/**
 * @brief Process-wide fallback timeout for blocking socket helpers.
 *
 * TcpClient picks this up at construction. Sweeps and pollers pass their own
 * identification timeout explicitly; the fallback only covers calls that do
 * not, such as miner commands sent from the CLI.
 */
class TimeoutConfig {
public:
    using duration = std::chrono::milliseconds;

    /// Same as the default identification timeout.
    static constexpr duration kFallback{5000};

    /// Upper bound for any single socket call; a miner that needs longer is treated as gone.
    static constexpr duration kCeiling{120000};

    static void setDefault(duration timeout) {
        storage().store(sanitize(timeout).count(), std::memory_order_relaxed);
    }

    static duration defaultTimeout() {
        return duration{storage().load(std::memory_order_relaxed)};
    }

    /// Negative values become zero (fail at once), huge values are capped at kCeiling.
    static duration sanitize(duration timeout) {
        if (timeout.count() < 0) return duration::zero();
        return timeout > kCeiling ? kCeiling : timeout;
    }

private:
    static std::atomic<duration::rep>& storage() {
        static std::atomic<duration::rep> millis{kFallback.count()};
        return millis;
    }
};

} // namespace minerscan::net
