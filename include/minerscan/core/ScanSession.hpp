#pragma once
#include "minerscan/core/Expected.hpp"
#include "minerscan/device/CgminerConfig.hpp"
#include "minerscan/device/DeviceIdentifier.hpp"
#include "minerscan/poll/DevicePoller.hpp"
#include "minerscan/registry/LiveDeviceRegistry.hpp"
#include "minerscan/scan/ScanCoordinator.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace minerscan::core {

using PollerHandle = std::shared_ptr<poll::DevicePoller>;

/**
 * @brief Entry point tying the pieces together for an application.
 *
 * Owns the registry shared by every sweep and poller of the session, the
 * device identifier and the coordinator. At most one poller runs per identity;
 * attaching again returns the running one with its interval updated.
 * Destroying the session stops every poller.
 */
class ScanSession {
public:
    ScanSession(std::shared_ptr<device::DeviceIdentifier> identifier,
                std::shared_ptr<scan::ReachabilityProbe> probe,
                std::shared_ptr<registry::LiveDeviceRegistry> registry = nullptr);
    ~ScanSession();

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    /// CgminerClient plus a TCP port probe on the same port.
    static std::unique_ptr<ScanSession> createDefault(unsigned short port = device::config::CGMINER_API_PORT);

    std::shared_ptr<scan::SweepHandle> startSweep(const scan::AddressRange& range,
                                                  const scan::ScanOptions& options = {});
    expected<std::shared_ptr<scan::SweepHandle>>
    startSweep(std::string_view start, std::string_view end, const scan::ScanOptions& options = {});

    /// Fails with `errc::no_such_device_or_address` for an identity the registry does not know.
    expected<PollerHandle> attachPoller(const std::string& identity,
                                        std::chrono::milliseconds interval = poll::kDefaultPollInterval);
    bool detachPoller(const std::string& identity);
    PollerHandle poller(const std::string& identity) const;
    std::vector<std::string> polledIdentities() const;
    void stopAllPollers();

    /// Resolves the address through the registry. Never retried.
    expected<void> sendCommand(const std::string& identity, device::Command command);
    bool openWebInterface(const std::string& identity);

    registry::LiveDeviceRegistry& registry() { return *registry_; }
    const registry::LiveDeviceRegistry& registry() const { return *registry_; }
    scan::ScanCoordinator& coordinator() { return coordinator_; }
    device::DeviceIdentifier& identifier() { return *identifier_; }

private:
    std::shared_ptr<device::DeviceIdentifier> identifier_;
    std::shared_ptr<registry::LiveDeviceRegistry> registry_;
    scan::ScanCoordinator coordinator_;

    mutable std::mutex pollersMutex_;
    std::map<std::string, PollerHandle> pollers_;
};

} // namespace minerscan::core
