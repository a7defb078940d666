#pragma once
#include "minerscan/core/Channel.hpp"
#include "minerscan/core/Expected.hpp"
#include "minerscan/device/DeviceIdentifier.hpp"
#include "minerscan/registry/LiveDeviceRegistry.hpp"
#include "minerscan/scan/AddressRange.hpp"
#include "minerscan/scan/ConcurrencyController.hpp"
#include "minerscan/scan/ReachabilityProbe.hpp"
#include "minerscan/scan/ScanProgress.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

namespace minerscan::scan {

struct ScanOptions {
    std::chrono::milliseconds identificationTimeout{5000};

    /// Additional identification attempts after the first one.
    unsigned connectivityRetries = 2;

    bool portCheckEnabled = true;
    std::chrono::milliseconds probeTimeout{5000};

    ConcurrencyLimits concurrency{};

    /// Capacity of the progress channel; older snapshots are dropped first.
    std::size_t progressBuffer = 64;
};

/**
 * @brief One running (or finished) sweep.
 *
 * Created by ScanCoordinator::startSweep. A dispatcher thread walks the range,
 * takes a permit from the adaptive controller for every address, and starts a
 * worker that probes and identifies it. Workers report back through a
 * completion queue; only the dispatcher updates progress, merges identified
 * devices into the registry and publishes to the channels.
 *
 * Consumers either poll `progress()` or read `progressUpdates()` / `results()`.
 * Both channels are closed when the sweep completes or is cancelled.
 *
 * Cancellation stops dispatching, freezes progress and closes the channels at
 * once. Workers already running finish on their own; whatever they produce
 * afterwards is discarded. `wait()` returns once they have all returned.
 */
class SweepHandle {
    // Only ScanCoordinator can name this, so only it can construct a handle.
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    SweepHandle(ConstructionKey,
                AddressRange range,
                ScanOptions options,
                std::shared_ptr<device::DeviceIdentifier> identifier,
                std::shared_ptr<ReachabilityProbe> probe,
                std::shared_ptr<registry::LiveDeviceRegistry> registry);
    ~SweepHandle();

    SweepHandle(const SweepHandle&) = delete;
    SweepHandle& operator=(const SweepHandle&) = delete;

    ScanProgress progress() const;
    SweepState state() const;

    core::Channel<ScanProgress>& progressUpdates() { return progressUpdates_; }
    core::Channel<device::DeviceRecord>& results() { return results_; }

    /// Idempotent. Has no effect on a sweep that already completed.
    void cancel();

    /// Blocks until the dispatcher and every worker have finished.
    void wait();
    bool waitFor(std::chrono::milliseconds timeout);

    /// Devices identified by this sweep so far, in completion order.
    std::vector<device::DeviceRecord> discovered() const;

    const AddressRange& range() const { return range_; }
    const ScanOptions& options() const { return options_; }

    /// Current size of the adaptive window.
    std::size_t permits() const { return permits_.load(std::memory_order_relaxed); }

private:
    friend class ScanCoordinator;

    struct AttemptResult {
        net::address_v4 address;
        std::optional<device::DeviceRecord> record;
        AttemptOutcome feedback = AttemptOutcome::Neutral;
        std::chrono::milliseconds latency{0};
    };

    void start();
    void dispatchLoop();
    void runAttempt(const net::address_v4& address);
    void markInFlight(const net::address_v4& address);
    void recordCompletion(const AttemptResult& result);
    void finish();
    void publishLocked();

    const AddressRange range_;
    const ScanOptions options_;
    std::shared_ptr<device::DeviceIdentifier> identifier_;
    std::shared_ptr<ReachabilityProbe> probe_;
    std::shared_ptr<registry::LiveDeviceRegistry> registry_;

    mutable std::mutex progressMutex_;
    ScanProgress progress_;
    std::vector<device::DeviceRecord> discovered_;

    core::Channel<ScanProgress> progressUpdates_;
    core::Channel<device::DeviceRecord> results_;
    core::Channel<AttemptResult> completions_;

    std::atomic<bool> cancelRequested_{false};
    std::atomic<std::size_t> permits_{0};

    std::mutex doneMutex_;
    std::condition_variable doneCv_;
    bool done_ = false;

    std::thread dispatcher_;
};

/**
 * @brief Starts sweeps against a shared registry.
 *
 * Several sweeps may run at once; they only meet in the registry, where the
 * newest timestamp wins.
 */
class ScanCoordinator {
public:
    /// @param identifier null means a CgminerClient on the default port.
    /// @param probe may be null, in which case the port check is skipped.
    /// @param registry null means a fresh registry.
    ScanCoordinator(std::shared_ptr<device::DeviceIdentifier> identifier,
                    std::shared_ptr<ReachabilityProbe> probe,
                    std::shared_ptr<registry::LiveDeviceRegistry> registry);

    /// Returns immediately; the sweep runs in the background.
    std::shared_ptr<SweepHandle> startSweep(const AddressRange& range, const ScanOptions& options = {});

    /// Validates the endpoints first; fails with RangeError::InvalidRange without touching the network.
    expected<std::shared_ptr<SweepHandle>>
    startSweep(std::string_view start, std::string_view end, const ScanOptions& options = {});

    const std::shared_ptr<registry::LiveDeviceRegistry>& registry() const { return registry_; }
    const std::shared_ptr<device::DeviceIdentifier>& identifier() const { return identifier_; }

private:
    std::shared_ptr<device::DeviceIdentifier> identifier_;
    std::shared_ptr<ReachabilityProbe> probe_;
    std::shared_ptr<registry::LiveDeviceRegistry> registry_;
};

} // namespace minerscan::scan
