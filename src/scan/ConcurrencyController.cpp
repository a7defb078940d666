#include "minerscan/scan/ConcurrencyController.hpp"

#include "minerscan/log/Log.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace minerscan::scan {

namespace {

ConcurrencyLimits sanitize(ConcurrencyLimits limits) {
    limits.maxPermits = std::max<std::size_t>(limits.maxPermits, 1);
    limits.initialPermits = std::clamp<std::size_t>(limits.initialPermits, 1, limits.maxPermits);
    if (!(limits.decreaseFactor > 0.0 && limits.decreaseFactor < 1.0)) {
        limits.decreaseFactor = 0.5;
    }
    if (!(limits.increaseGain > 0.0)) {
        limits.increaseGain = 1.0;
    }
    return limits;
}

std::uint32_t seedFor(const ConcurrencyLimits& limits) {
    if (limits.seed != 0) {
        return limits.seed;
    }
    std::random_device rd;
    return rd();
}

} // namespace

AdaptiveConcurrencyController::AdaptiveConcurrencyController(ConcurrencyLimits limits)
: limits_(sanitize(limits))
, permits_(limits_.initialPermits)
, rng_(seedFor(limits_))
{}

bool AdaptiveConcurrencyController::tryAcquire() {
    if (inFlight_ >= permits_) {
        return false;
    }
    ++inFlight_;
    return true;
}

void AdaptiveConcurrencyController::release(AttemptOutcome outcome, std::chrono::milliseconds latency) {
    if (inFlight_ > 0) {
        --inFlight_;
    }

    switch (outcome) {
        case AttemptOutcome::Success:
            latencies_.push_back(latency);
            if (latencies_.size() > kLatencyWindow) {
                latencies_.pop_front();
            }
            if (latency > limits_.latencyThreshold) {
                decrease();
            } else {
                increase();
            }
            break;
        case AttemptOutcome::TransientError:
            ++errors_;
            decrease();
            break;
        case AttemptOutcome::Neutral:
            break;
    }
}

void AdaptiveConcurrencyController::reset() {
    permits_ = limits_.initialPermits;
    inFlight_ = 0;
    errors_ = 0;
    latencies_.clear();
}

std::chrono::milliseconds AdaptiveConcurrencyController::averageLatency() const {
    if (latencies_.empty()) {
        return std::chrono::milliseconds::zero();
    }
    const auto total = std::accumulate(latencies_.begin(), latencies_.end(),
                                       std::chrono::milliseconds::zero());
    return total / static_cast<long long>(latencies_.size());
}

void AdaptiveConcurrencyController::increase() {
    if (permits_ >= limits_.maxPermits) {
        return;
    }
    const double probability = std::min(1.0, limits_.increaseGain / static_cast<double>(permits_));
    if (probability >= 1.0 || coin_(rng_) < probability) {
        ++permits_;
    }
}

void AdaptiveConcurrencyController::decrease() {
    const auto shrunk = static_cast<std::size_t>(std::floor(static_cast<double>(permits_) * limits_.decreaseFactor));
    const auto next = std::max<std::size_t>(shrunk, 1);
    if (next != permits_) {
        logDebug("[ConcurrencyController] window ", permits_, " -> ", next, "\n");
    }
    permits_ = next;
}

} // namespace minerscan::scan
