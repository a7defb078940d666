#pragma once
#include "minerscan/device/DeviceIdentifier.hpp"
#include "minerscan/poll/Recorder.hpp"
#include "minerscan/registry/LiveDeviceRegistry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace minerscan::poll {

constexpr std::chrono::milliseconds kMinPollInterval{5000};
constexpr std::chrono::milliseconds kMaxPollInterval{60000};
constexpr std::chrono::milliseconds kDefaultPollInterval{10000};

/// Clamps to [kMinPollInterval, kMaxPollInterval].
std::chrono::milliseconds clampPollInterval(std::chrono::milliseconds interval);

struct PollerOptions {
    std::chrono::milliseconds interval = kDefaultPollInterval;
    std::chrono::milliseconds timeout{5000};
    unsigned retries = 0;
};

/**
 * @brief Keeps one registry entry fresh from a background thread.
 *
 * The loop polls once straight away and then once per interval until `stop()`.
 * Every poll re-reads the device's address from the registry, identifies it and
 * merges the result (record plus history sample). A failed poll leaves the
 * record as it was and bumps `consecutiveFailures()`; the next success resets
 * it. The poller never removes the device.
 *
 * Threading model:
 * - `start()` spawns the worker; `stop()` wakes it, waits for the current poll
 *   to end and joins. Both are idempotent.
 * - `pollOnce()` runs one poll on the calling thread and may be used without
 *   starting the loop.
 */
class DevicePoller {
public:
    DevicePoller(std::string identity,
                 std::shared_ptr<device::DeviceIdentifier> identifier,
                 std::shared_ptr<registry::LiveDeviceRegistry> registry,
                 PollerOptions options = {});
    ~DevicePoller();

    DevicePoller(const DevicePoller&) = delete;
    DevicePoller& operator=(const DevicePoller&) = delete;

    void start();
    void stop();
    bool isRunning() const { return running_.load(); }

    /// Returns true if the device answered and the registry was refreshed.
    bool pollOnce();

    /// Clamped. A running loop reschedules its next poll right away.
    void setInterval(std::chrono::milliseconds interval);
    std::chrono::milliseconds interval() const;

    void attachRecorder(std::shared_ptr<Recorder> recorder);
    void detachRecorder();

    const std::string& identity() const { return identity_; }
    std::size_t consecutiveFailures() const { return consecutiveFailures_.load(); }
    std::size_t pollCount() const { return polls_.load(); }
    std::size_t successCount() const { return successes_.load(); }

private:
    void run();
    bool fail();

    const std::string identity_;
    std::shared_ptr<device::DeviceIdentifier> identifier_;
    std::shared_ptr<registry::LiveDeviceRegistry> registry_;
    const std::chrono::milliseconds timeout_;
    const unsigned retries_;
    std::atomic<long long> intervalMillis_;

    std::mutex recorderMutex_;
    std::shared_ptr<Recorder> recorder_;

    std::atomic<std::size_t> consecutiveFailures_{0};
    std::atomic<std::size_t> polls_{0};
    std::atomic<std::size_t> successes_{0};

    std::mutex lifecycleMutex_;
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
    bool intervalChanged_ = false; // guarded by wakeMutex_
    std::atomic<bool> stopping_{false};
    std::atomic<bool> running_{false};
    std::thread worker_;
};

} // namespace minerscan::poll
