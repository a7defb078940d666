#pragma once
#include "minerscan/device/DeviceIdentifier.hpp"
#include "minerscan/device/CgminerConfig.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace minerscan::device {

/**
 * @brief DeviceIdentifier speaking the cgminer JSON API over TCP.
 *
 * Every request opens a fresh connection, sends `{"command": ..., "parameter":
 * ...}` and reads until the miner closes the socket (the reply is NUL
 * terminated). Identification issues `version` (mandatory), then `summary`,
 * `stats`, `pools` and `config`; the optional ones are skipped when the
 * firmware rejects them.
 *
 * Start / Stop map to `resume` / `pause`; ToggleFaultLight maps to `ledset`
 * with `blink` or `auto`, chosen from the light state last commanded for that
 * address. Stock firmwares answer these with "Invalid command", reported as
 * CommandError::Unsupported.
 */
class CgminerClient : public DeviceIdentifier {
public:
    explicit CgminerClient(unsigned short port = config::CGMINER_API_PORT);

    expected<DeviceSnapshot>
    identify(const net::address_v4& address, std::chrono::milliseconds timeout) override;

    expected<void>
    sendCommand(const net::address_v4& address, Command command) override;

    /// One request/response exchange. Errors are IdentifyError codes.
    expected<nlohmann::json>
    request(const net::address_v4& address,
            const std::string& command,
            const std::string& parameter,
            std::chrono::milliseconds timeout);

    unsigned short port() const { return apiPort; }

private:
    bool lightStateFor(const net::address_v4& address) const;
    void rememberLightState(const net::address_v4& address, bool on);

    unsigned short apiPort;

    mutable std::mutex lightMutex;
    std::unordered_map<std::uint32_t, bool> lightStates;
};

/**
 * @brief Parsers for the individual API replies. Exposed for tests.
 *
 * Each one fills the fields it knows about and leaves the rest untouched.
 */
namespace cgminer {

/// STATUS[0].STATUS as a single letter ('S', 'I', 'W', 'E', 'F'), or 0 if absent.
char statusLetter(const nlohmann::json& reply);
std::string statusMessage(const nlohmann::json& reply);

void applyVersion(const nlohmann::json& reply, DeviceSnapshot& snapshot);
void applySummary(const nlohmann::json& reply, DeviceSnapshot& snapshot);
void applyStats(const nlohmann::json& reply, DeviceSnapshot& snapshot);
void applyPools(const nlohmann::json& reply, DeviceSnapshot& snapshot);
void applyConfig(const nlohmann::json& reply, DeviceSnapshot& snapshot);

/// Derives efficiency and the average board temperature when the firmware omits them.
void finalize(DeviceSnapshot& snapshot);

} // namespace cgminer

} // namespace minerscan::device
