#include "minerscan/poll/DevicePoller.hpp"
#include "minerscan/log/Log.hpp"

#include <algorithm>
#include <utility>

namespace minerscan::poll {

std::chrono::milliseconds clampPollInterval(std::chrono::milliseconds interval) {
    return std::clamp(interval, kMinPollInterval, kMaxPollInterval);
}

DevicePoller::DevicePoller(std::string identity,
                           std::shared_ptr<device::DeviceIdentifier> identifier,
                           std::shared_ptr<registry::LiveDeviceRegistry> registry,
                           PollerOptions options)
: identity_(std::move(identity))
, identifier_(std::move(identifier))
, registry_(std::move(registry))
, timeout_(options.timeout)
, retries_(options.retries)
, intervalMillis_(clampPollInterval(options.interval).count())
{}

DevicePoller::~DevicePoller() {
    stop();
}

void DevicePoller::start() {
    std::lock_guard lifecycle(lifecycleMutex_);
    if (running_) return;
    stopping_ = false;
    running_ = true;
    logInfo("[DevicePoller] ", identity_, " polling every ", interval().count(), " ms\n");
    worker_ = std::thread([this] { run(); });
}

void DevicePoller::stop() {
    std::lock_guard lifecycle(lifecycleMutex_);
    {
        std::lock_guard lock(wakeMutex_);
        stopping_ = true;
    }
    wakeCv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
        logInfo("[DevicePoller] ", identity_, " stopped after ", polls_.load(), " polls\n");
    }
    running_ = false;
}

void DevicePoller::setInterval(std::chrono::milliseconds interval) {
    intervalMillis_.store(clampPollInterval(interval).count());
    {
        std::lock_guard lock(wakeMutex_);
        intervalChanged_ = true;
    }
    wakeCv_.notify_all();
}

std::chrono::milliseconds DevicePoller::interval() const {
    return std::chrono::milliseconds(intervalMillis_.load());
}

void DevicePoller::attachRecorder(std::shared_ptr<Recorder> recorder) {
    std::lock_guard lock(recorderMutex_);
    recorder_ = std::move(recorder);
}

void DevicePoller::detachRecorder() {
    std::lock_guard lock(recorderMutex_);
    recorder_.reset();
}

void DevicePoller::run() {
    while (!stopping_) {
        const auto polledAt = std::chrono::steady_clock::now();
        pollOnce();

        // The next poll is due one interval after this one started; a new
        // interval moves that deadline immediately.
        std::unique_lock lock(wakeMutex_);
        while (!stopping_) {
            const auto due = polledAt + interval();
            if (std::chrono::steady_clock::now() >= due) {
                break;
            }
            intervalChanged_ = false;
            wakeCv_.wait_until(lock, due, [this] { return stopping_.load() || intervalChanged_; });
        }
    }
}

bool DevicePoller::pollOnce() {
    ++polls_;

    if (!identifier_ || !registry_) {
        logError("[DevicePoller] ", identity_, " has no identifier or registry\n");
        return fail();
    }

    const auto current = registry_->get(identity_);
    if (!current) {
        logWarning("[DevicePoller] ", identity_, " is not in the registry\n");
        return fail();
    }

    auto snapshot = device::identifyWithRetries(*identifier_, current->address, timeout_,
                                                retries_, &stopping_);
    if (!snapshot) {
        logDebug("[DevicePoller] ", identity_, " at ", current->address.to_string(),
                 ": ", snapshot.error().message(), "\n");
        return fail();
    }
    if (snapshot->identityKey() != identity_) {
        // Another device took over the address.
        logWarning("[DevicePoller] ", current->address.to_string(), " now answers as ",
                   snapshot->identityKey(), ", expected ", identity_, "\n");
        return fail();
    }

    registry_->merge(*snapshot);
    consecutiveFailures_ = 0;
    ++successes_;

    std::shared_ptr<Recorder> recorder;
    {
        std::lock_guard lock(recorderMutex_);
        recorder = recorder_;
    }
    if (recorder) {
        auto written = recorder->record(*snapshot);
        if (!written) {
            logWarning("[DevicePoller] ", identity_, " recording failed: ",
                       written.error().message(), "\n");
        }
    }
    return true;
}

bool DevicePoller::fail() {
    const auto failures = ++consecutiveFailures_;
    if (failures == 3 || failures % 10 == 0) {
        logWarning("[DevicePoller] ", identity_, " failed ", failures, " polls in a row\n");
    }
    return false;
}

} // namespace minerscan::poll
