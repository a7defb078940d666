#include "minerscan/core/ScanSession.hpp"
#include "minerscan/core/Errors.hpp"
#include "minerscan/device/CgminerClient.hpp"
#include "minerscan/log/Log.hpp"
#include "minerscan/scan/ReachabilityProbe.hpp"

#include <utility>

namespace minerscan::core {

namespace {

std::shared_ptr<registry::LiveDeviceRegistry>
orDefault(std::shared_ptr<registry::LiveDeviceRegistry> registry) {
    if (!registry) {
        registry = std::make_shared<registry::LiveDeviceRegistry>();
    }
    return registry;
}

} // namespace

ScanSession::ScanSession(std::shared_ptr<device::DeviceIdentifier> identifier,
                         std::shared_ptr<scan::ReachabilityProbe> probe,
                         std::shared_ptr<registry::LiveDeviceRegistry> registry)
: identifier_(std::move(identifier))
, registry_(orDefault(std::move(registry)))
, coordinator_(identifier_, std::move(probe), registry_)
{
    // The coordinator substitutes a default client for a null identifier.
    identifier_ = coordinator_.identifier();
}

ScanSession::~ScanSession() {
    stopAllPollers();
}

std::unique_ptr<ScanSession> ScanSession::createDefault(unsigned short port) {
    return std::make_unique<ScanSession>(std::make_shared<device::CgminerClient>(port),
                                         std::make_shared<scan::TcpPortProbe>(port));
}

std::shared_ptr<scan::SweepHandle>
ScanSession::startSweep(const scan::AddressRange& range, const scan::ScanOptions& options) {
    return coordinator_.startSweep(range, options);
}

expected<std::shared_ptr<scan::SweepHandle>>
ScanSession::startSweep(std::string_view start, std::string_view end, const scan::ScanOptions& options) {
    return coordinator_.startSweep(start, end, options);
}

expected<PollerHandle> ScanSession::attachPoller(const std::string& identity, std::chrono::milliseconds interval) {
    if (!registry_->get(identity)) {
        logWarning("[ScanSession] cannot poll unknown device ", identity, "\n");
        return unexpected(std::make_error_code(std::errc::no_such_device_or_address));
    }

    std::lock_guard lock(pollersMutex_);
    auto it = pollers_.find(identity);
    if (it != pollers_.end()) {
        it->second->setInterval(interval);
        return it->second;
    }

    poll::PollerOptions options;
    options.interval = interval;
    auto poller = std::make_shared<poll::DevicePoller>(identity, identifier_, registry_, options);
    poller->start();
    pollers_.emplace(identity, poller);
    return poller;
}

bool ScanSession::detachPoller(const std::string& identity) {
    PollerHandle poller;
    {
        std::lock_guard lock(pollersMutex_);
        auto it = pollers_.find(identity);
        if (it == pollers_.end()) {
            return false;
        }
        poller = std::move(it->second);
        pollers_.erase(it);
    }
    // Joined outside the lock so other pollers can be attached meanwhile.
    poller->stop();
    return true;
}

PollerHandle ScanSession::poller(const std::string& identity) const {
    std::lock_guard lock(pollersMutex_);
    auto it = pollers_.find(identity);
    return it == pollers_.end() ? nullptr : it->second;
}

std::vector<std::string> ScanSession::polledIdentities() const {
    std::lock_guard lock(pollersMutex_);
    std::vector<std::string> identities;
    identities.reserve(pollers_.size());
    for (const auto& [identity, poller] : pollers_) {
        identities.push_back(identity);
    }
    return identities;
}

void ScanSession::stopAllPollers() {
    std::map<std::string, PollerHandle> pollers;
    {
        std::lock_guard lock(pollersMutex_);
        pollers.swap(pollers_);
    }
    for (auto& [identity, poller] : pollers) {
        poller->stop();
    }
}

expected<void> ScanSession::sendCommand(const std::string& identity, device::Command command) {
    const auto record = registry_->get(identity);
    if (!record) {
        logError("[ScanSession] ", device::toString(command), ": unknown device ", identity, "\n");
        return unexpected(CommandError::Unreachable);
    }
    logInfo("[ScanSession] ", device::toString(command), " -> ", identity, " (",
            record->address.to_string(), ")\n");
    return identifier_->sendCommand(record->address, command);
}

bool ScanSession::openWebInterface(const std::string& identity) {
    const auto record = registry_->get(identity);
    if (!record) {
        return false;
    }
    identifier_->openWebInterface(record->address);
    return true;
}

} // namespace minerscan::core
