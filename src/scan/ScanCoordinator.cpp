#include "minerscan/scan/ScanCoordinator.hpp"

#include "minerscan/core/Errors.hpp"
#include "minerscan/device/CgminerClient.hpp"
#include "minerscan/log/Log.hpp"

#include <exception>
#include <unordered_map>
#include <utility>

namespace minerscan::scan {

namespace {

std::chrono::milliseconds elapsedSince(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
}

} // namespace

const char* toString(SweepState state) {
    switch (state) {
        case SweepState::Idle: return "idle";
        case SweepState::Running: return "running";
        case SweepState::Completed: return "completed";
        case SweepState::Cancelled: return "cancelled";
    }
    return "unknown";
}

SweepHandle::SweepHandle(ConstructionKey,
                         AddressRange range,
                         ScanOptions options,
                         std::shared_ptr<device::DeviceIdentifier> identifier,
                         std::shared_ptr<ReachabilityProbe> probe,
                         std::shared_ptr<registry::LiveDeviceRegistry> registry)
: range_(std::move(range))
, options_(std::move(options))
, identifier_(std::move(identifier))
, probe_(std::move(probe))
, registry_(std::move(registry))
, progressUpdates_(options_.progressBuffer)
{}

SweepHandle::~SweepHandle() {
    cancel();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

void SweepHandle::start() {
    {
        std::lock_guard lock(progressMutex_);
        progress_.total = static_cast<std::size_t>(range_.size());
        progress_.state = SweepState::Running;
        publishLocked();
    }
    logInfo("[ScanCoordinator] ", range_.toString(), ": ", progress_.total, " addresses, retries=",
            options_.connectivityRetries, ", port check ", (options_.portCheckEnabled ? "on" : "off"), "\n");
    dispatcher_ = std::thread([this] { dispatchLoop(); });
}

ScanProgress SweepHandle::progress() const {
    std::lock_guard lock(progressMutex_);
    return progress_;
}

SweepState SweepHandle::state() const {
    std::lock_guard lock(progressMutex_);
    return progress_.state;
}

std::vector<device::DeviceRecord> SweepHandle::discovered() const {
    std::lock_guard lock(progressMutex_);
    return discovered_;
}

void SweepHandle::cancel() {
    cancelRequested_.store(true);
    {
        std::lock_guard lock(progressMutex_);
        if (progress_.state != SweepState::Running) {
            return;
        }
        progress_.state = SweepState::Cancelled;
        publishLocked();
        logInfo("[ScanCoordinator] ", range_.toString(), " cancelled after ", progress_.completed, "/",
                progress_.total, " addresses\n");
    }
    progressUpdates_.close();
    results_.close();
}

void SweepHandle::wait() {
    std::unique_lock lock(doneMutex_);
    doneCv_.wait(lock, [this] { return done_; });
}

bool SweepHandle::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock lock(doneMutex_);
    return doneCv_.wait_for(lock, timeout, [this] { return done_; });
}

void SweepHandle::dispatchLoop() {
    AdaptiveConcurrencyController controller(options_.concurrency);
    std::unordered_map<std::uint32_t, std::thread> workers;
    auto next = range_.begin();
    const auto end = range_.end();

    while (true) {
        while (!cancelRequested_.load() && next != end && controller.tryAcquire()) {
            const net::address_v4 address = *next;
            ++next;
            markInFlight(address);
            workers.emplace(address.to_uint(), std::thread([this, address] { runAttempt(address); }));
        }
        permits_.store(controller.permits(), std::memory_order_relaxed);

        // Empty here means the range is exhausted or dispatching was cancelled.
        if (workers.empty()) {
            break;
        }

        auto result = completions_.pop();
        if (!result) {
            break;
        }
        auto worker = workers.find(result->address.to_uint());
        if (worker != workers.end()) {
            worker->second.join();
            workers.erase(worker);
        }
        controller.release(result->feedback, result->latency);
        recordCompletion(*result);
    }

    for (auto& [key, worker] : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    logDebug("[ScanCoordinator] window ended at ", controller.permits(), " permits, ",
             controller.errorCount(), " congestion signals, avg latency ",
             controller.averageLatency().count(), " ms\n");
    finish();
}

void SweepHandle::runAttempt(const net::address_v4& address) {
    const auto started = std::chrono::steady_clock::now();
    AttemptResult result{address, std::nullopt, AttemptOutcome::Neutral, std::chrono::milliseconds{0}};

    try {
        if (options_.portCheckEnabled && probe_) {
            const auto reach = probe_->probe(address, options_.probeTimeout);
            if (reach != ProbeResult::Reachable) {
                logDebug("[ScanCoordinator] ", address.to_string(), " probe: ", toString(reach), "\n");
                result.latency = elapsedSince(started);
                completions_.push(std::move(result));
                return;
            }
        }

        auto identified = device::identifyWithRetries(*identifier_, address,
                                                      options_.identificationTimeout,
                                                      options_.connectivityRetries,
                                                      &cancelRequested_);
        result.latency = elapsedSince(started);
        if (identified) {
            result.record = std::move(*identified);
            result.feedback = AttemptOutcome::Success;
        } else {
            const auto& ec = identified.error();
            logDebug("[ScanCoordinator] ", address.to_string(), " not identified: ", ec.message(), "\n");
            // Without the port check most failures are empty addresses, not congestion.
            if (options_.portCheckEnabled && isTransient(ec)) {
                result.feedback = AttemptOutcome::TransientError;
            }
        }
    } catch (const std::exception& e) {
        logError("[ScanCoordinator] ", address.to_string(), " attempt failed: ", e.what(), "\n");
        result.record.reset();
        result.feedback = AttemptOutcome::Neutral;
        result.latency = elapsedSince(started);
    }

    completions_.push(std::move(result));
}

void SweepHandle::markInFlight(const net::address_v4& address) {
    std::lock_guard lock(progressMutex_);
    if (progress_.state != SweepState::Running) {
        return;
    }
    progress_.inFlight.insert(address);
    publishLocked();
}

void SweepHandle::recordCompletion(const AttemptResult& result) {
    std::lock_guard lock(progressMutex_);
    if (progress_.state != SweepState::Running) {
        return; // cancelled: progress stays frozen, late findings are dropped
    }

    progress_.inFlight.erase(result.address);
    ++progress_.completed;
    progress_.lastCompleted = result.address;

    if (result.record) {
        ++progress_.found;
        const auto outcome = registry_->merge(*result.record);
        logInfo("[ScanCoordinator] found ", result.record->model.empty() ? "miner" : result.record->model,
                " at ", result.address.to_string(), " (", registry::toString(outcome), ")\n");
        discovered_.push_back(*result.record);
        results_.push(*result.record);
    }
    publishLocked();
}

void SweepHandle::finish() {
    {
        std::lock_guard lock(progressMutex_);
        if (progress_.state == SweepState::Running) {
            progress_.state = SweepState::Completed;
            publishLocked();
            logInfo("[ScanCoordinator] ", range_.toString(), " completed: ", progress_.found, " found in ",
                    progress_.completed, " addresses\n");
        }
    }
    progressUpdates_.close();
    results_.close();
    completions_.close();

    {
        std::lock_guard lock(doneMutex_);
        done_ = true;
    }
    doneCv_.notify_all();
}

void SweepHandle::publishLocked() {
    progressUpdates_.push(progress_);
}

ScanCoordinator::ScanCoordinator(std::shared_ptr<device::DeviceIdentifier> identifier,
                                 std::shared_ptr<ReachabilityProbe> probe,
                                 std::shared_ptr<registry::LiveDeviceRegistry> registry)
: identifier_(std::move(identifier))
, probe_(std::move(probe))
, registry_(std::move(registry))
{
    if (!identifier_) {
        logWarning("[ScanCoordinator] no identifier given, using the cgminer API on port ",
                   device::config::CGMINER_API_PORT, "\n");
        identifier_ = std::make_shared<device::CgminerClient>();
    }
    if (!registry_) {
        registry_ = std::make_shared<registry::LiveDeviceRegistry>();
    }
}

std::shared_ptr<SweepHandle> ScanCoordinator::startSweep(const AddressRange& range, const ScanOptions& options) {
    ScanOptions effective = options;
    if (effective.portCheckEnabled && !probe_) {
        logWarning("[ScanCoordinator] no reachability probe configured, port check disabled\n");
        effective.portCheckEnabled = false;
    }
    auto handle = std::make_shared<SweepHandle>(SweepHandle::ConstructionKey{}, range, effective,
                                                identifier_, probe_, registry_);
    handle->start();
    return handle;
}

expected<std::shared_ptr<SweepHandle>>
ScanCoordinator::startSweep(std::string_view start, std::string_view end, const ScanOptions& options) {
    auto range = AddressRange::parse(start, end);
    if (!range) {
        logError("[ScanCoordinator] invalid range ", start, " - ", end, "\n");
        return tl::make_unexpected(range.error());
    }
    return startSweep(*range, options);
}

} // namespace minerscan::scan
