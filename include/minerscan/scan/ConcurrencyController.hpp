#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <random>

namespace minerscan::scan {

/**
 * @brief Tuning knobs of the adaptive concurrency controller.
 */
struct ConcurrencyLimits {
    std::size_t initialPermits = 16;
    std::size_t maxPermits = 256;

    /// Successes slower than this count as congestion.
    std::chrono::milliseconds latencyThreshold{2000};

    /// Additive increase: +1 permit with probability min(1, increaseGain / permits).
    double increaseGain = 2.0;

    /// Multiplicative decrease applied on congestion, in (0, 1).
    double decreaseFactor = 0.5;

    /// 0 seeds from std::random_device.
    std::uint32_t seed = 0;
};

/// How a finished attempt should steer the window.
enum class AttemptOutcome {
    Success,          // identified; still congestion if slower than the threshold
    TransientError,   // timeout / reset against a host that was there
    Neutral,          // nothing listening, or a definitive protocol mismatch
};

/**
 * @brief AIMD window over simultaneous per-address attempts.
 *
 * The sweep dispatcher is the only owner: it takes a permit before starting a
 * worker and hands the worker's outcome back through `release`. Workers never
 * touch the controller, so it carries no locking.
 *
 * The window starts at `initialPermits`, grows by one with probability
 * `increaseGain / permits` per fast success (about `increaseGain` permits per
 * window of successes) up to `maxPermits`, and is multiplied by
 * `decreaseFactor` on every error or slow success, never dropping below 1.
 * Shrinking never revokes permits already handed out; new ones are simply
 * withheld until enough attempts finish.
 */
class AdaptiveConcurrencyController {
public:
    static constexpr std::size_t kLatencyWindow = 32;

    explicit AdaptiveConcurrencyController(ConcurrencyLimits limits = {});

    /// Takes a permit if fewer than `permits()` attempts are in flight.
    bool tryAcquire();

    /// Returns a permit and feeds the attempt's outcome into the window.
    void release(AttemptOutcome outcome, std::chrono::milliseconds latency);

    /// Back to the initial window with no samples. Called at sweep start.
    void reset();

    std::size_t permits() const { return permits_; }
    std::size_t inFlight() const { return inFlight_; }
    std::size_t errorCount() const { return errors_; }
    std::chrono::milliseconds averageLatency() const;
    const ConcurrencyLimits& limits() const { return limits_; }

private:
    void increase();
    void decrease();

    ConcurrencyLimits limits_;
    std::size_t permits_;
    std::size_t inFlight_ = 0;
    std::size_t errors_ = 0;
    std::deque<std::chrono::milliseconds> latencies_;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> coin_{0.0, 1.0};
};

} // namespace minerscan::scan
