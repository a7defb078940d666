/**
 * @brief cgminer JSON API client: request framing, reply parsing, commands.
 */
#include "minerscan/device/CgminerClient.hpp"

#include "minerscan/core/Errors.hpp"
#include "minerscan/log/Log.hpp"
#include "minerscan/net/TcpClient.hpp"
#include "minerscan/net/TimeoutConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <numeric>
#include <optional>
#include <string_view>
#include <utility>

namespace minerscan::device {

using json = nlohmann::json;
using minerscan::unexpected;

namespace {

std::optional<double> parseNumber(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    if (text.empty()) {
        return std::nullopt;
    }
    const std::string copy(text);
    char* end = nullptr;
    const double value = std::strtod(copy.c_str(), &end);
    if (end != copy.c_str() + copy.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> numberFrom(const json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        return parseNumber(value.get_ref<const std::string&>());
    }
    return std::nullopt;
}

std::optional<double> numberField(const json& object, const char* key) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    return numberFrom(*it);
}

/// Hottest value of a dash separated list such as "56-58-71-70".
std::optional<double> maxOfDashList(const json& value) {
    if (auto single = numberFrom(value)) {
        return single;
    }
    if (!value.is_string()) {
        return std::nullopt;
    }
    std::optional<double> best;
    std::string_view rest = value.get_ref<const std::string&>();
    while (!rest.empty()) {
        const auto dash = rest.find('-');
        if (auto v = parseNumber(rest.substr(0, dash)); v && (!best || *v > *best)) {
            best = v;
        }
        if (dash == std::string_view::npos) break;
        rest.remove_prefix(dash + 1);
    }
    return best;
}

std::string stringField(const json& object, std::initializer_list<const char*> keys) {
    if (!object.is_object()) {
        return {};
    }
    for (const char* key : keys) {
        auto it = object.find(key);
        if (it != object.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
            return it->get<std::string>();
        }
    }
    return {};
}

const json* firstEntry(const json& reply, const char* section) {
    if (!reply.is_object()) {
        return nullptr;
    }
    auto it = reply.find(section);
    if (it == reply.end() || !it->is_array() || it->empty()) {
        return nullptr;
    }
    return &it->front();
}

bool containsInsensitive(std::string haystack, std::string needle) {
    auto lower = [](std::string& s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    };
    lower(haystack);
    lower(needle);
    return haystack.find(needle) != std::string::npos;
}

// bmminer emits "}{" between STATS entries; make it a valid JSON array.
void repairReply(std::string& raw) {
    while (!raw.empty() && (raw.back() == '\0' || std::isspace(static_cast<unsigned char>(raw.back())))) {
        raw.pop_back();
    }
    for (std::size_t pos = raw.find("}{"); pos != std::string::npos; pos = raw.find("}{", pos + 3)) {
        raw.insert(pos + 1, ",");
    }
}

std::chrono::milliseconds remainingUntil(std::chrono::steady_clock::time_point deadline) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
}

} // namespace

namespace cgminer {

char statusLetter(const json& reply) {
    if (!reply.is_object()) {
        return 0;
    }
    auto it = reply.find("STATUS");
    if (it == reply.end()) {
        return 0;
    }
    const json* status = &*it;
    if (status->is_array()) {
        if (status->empty()) return 0;
        status = &status->front();
    }
    std::string letter;
    if (status->is_object()) {
        letter = stringField(*status, {"STATUS"});
    } else if (status->is_string()) {
        letter = status->get<std::string>();
    }
    return letter.empty() ? 0 : letter.front();
}

std::string statusMessage(const json& reply) {
    if (const json* status = firstEntry(reply, "STATUS")) {
        return stringField(*status, {"Msg", "msg"});
    }
    return stringField(reply, {"Msg", "msg"});
}

void applyVersion(const json& reply, DeviceSnapshot& snapshot) {
    const json* version = firstEntry(reply, "VERSION");
    if (!version) {
        return;
    }
    if (auto model = stringField(*version, {"Type", "Model"}); !model.empty()) {
        snapshot.model = model;
    }
    if (auto firmware = stringField(*version, {"Firmware", "CompileTime", "BMMiner", "LUXminer",
                                                "BOSminer", "CGMiner", "Miner"});
        !firmware.empty()) {
        snapshot.firmwareVersion = firmware;
    }
    if (auto board = stringField(*version, {"CB Platform", "CB Type", "Control Board"}); !board.empty()) {
        snapshot.controlBoard = board;
    }
}

void applySummary(const json& reply, DeviceSnapshot& snapshot) {
    const json* summary = firstEntry(reply, "SUMMARY");
    if (!summary) {
        return;
    }
    if (auto ghs = numberField(*summary, "GHS 5s")) {
        snapshot.hashrateThs = *ghs / 1000.0;
    } else if (auto ghsAv = numberField(*summary, "GHS av")) {
        snapshot.hashrateThs = *ghsAv / 1000.0;
    } else if (auto mhs = numberField(*summary, "MHS 5s")) {
        snapshot.hashrateThs = *mhs / 1'000'000.0;
    } else if (auto mhsAv = numberField(*summary, "MHS av")) {
        snapshot.hashrateThs = *mhsAv / 1'000'000.0;
    }
    if (auto power = numberField(*summary, "Power")) {
        snapshot.powerWatts = power;
    }
}

void applyStats(const json& reply, DeviceSnapshot& snapshot) {
    if (!reply.is_object()) {
        return;
    }
    auto section = reply.find("STATS");
    if (section == reply.end() || !section->is_array()) {
        return;
    }

    for (const auto& entry : *section) {
        if (!entry.is_object()) continue;

        if (snapshot.model.empty()) {
            snapshot.model = stringField(entry, {"Type"});
        }

        if (snapshot.fanRpm.empty()) {
            for (std::size_t n = 1; n <= config::CGMINER_MAX_FANS; ++n) {
                const std::string key = "fan" + std::to_string(n);
                if (auto rpm = numberField(entry, key.c_str()); rpm && *rpm > 0) {
                    snapshot.fanRpm.push_back(*rpm);
                }
            }
        }

        if (snapshot.boards.empty()) {
            for (std::size_t n = 1; n <= config::CGMINER_MAX_BOARDS; ++n) {
                const auto suffix = std::to_string(n);
                BoardMetrics board;
                board.index = n - 1;
                if (auto rate = numberField(entry, ("chain_rate" + suffix).c_str())) {
                    board.hashrateThs = *rate / 1000.0;
                }
                for (const auto& key : {"temp2_" + suffix, "temp_chip" + suffix, "temp" + suffix}) {
                    auto it = entry.find(key);
                    if (it == entry.end()) continue;
                    if (auto temp = maxOfDashList(*it); temp && *temp > 0) {
                        board.temperatureC = temp;
                        break;
                    }
                }
                if (board.hashrateThs || board.temperatureC) {
                    snapshot.boards.push_back(board);
                }
            }
        }

        if (!snapshot.hashrateThs) {
            if (auto ghs = numberField(entry, "GHS 5s")) {
                snapshot.hashrateThs = *ghs / 1000.0;
            }
        }
        if (!snapshot.powerWatts) {
            if (auto power = numberField(entry, "chain_power")) {
                snapshot.powerWatts = power;
            } else if (auto watts = numberField(entry, "Power")) {
                snapshot.powerWatts = watts;
            }
        }
    }
}

void applyPools(const json& reply, DeviceSnapshot& snapshot) {
    if (!reply.is_object()) {
        return;
    }
    auto section = reply.find("POOLS");
    if (section == reply.end() || !section->is_array()) {
        return;
    }
    snapshot.pools.clear();
    for (const auto& entry : *section) {
        if (!entry.is_object()) continue;
        PoolInfo pool;
        pool.url = stringField(entry, {"URL", "url"});
        pool.user = stringField(entry, {"User", "user"});
        auto active = entry.find("Stratum Active");
        if (active != entry.end() && active->is_boolean()) {
            pool.active = active->get<bool>();
        } else {
            pool.active = stringField(entry, {"Status"}) == "Alive";
        }
        if (!pool.url.empty()) {
            snapshot.pools.push_back(std::move(pool));
        }
    }
}

void applyConfig(const json& reply, DeviceSnapshot& snapshot) {
    const json* cfg = firstEntry(reply, "CONFIG");
    if (!cfg) {
        return;
    }
    if (auto hostname = stringField(*cfg, {"Hostname", "hostname"}); !hostname.empty()) {
        snapshot.hostname = hostname;
    }
    if (auto mac = normalizeMac(stringField(*cfg, {"MACAddr", "MAC", "mac"}))) {
        snapshot.mac = mac;
    }
}

void finalize(DeviceSnapshot& snapshot) {
    if (!snapshot.averageTemperatureC) {
        double sum = 0.0;
        std::size_t count = 0;
        for (const auto& board : snapshot.boards) {
            if (board.temperatureC) {
                sum += *board.temperatureC;
                ++count;
            }
        }
        if (count > 0) {
            snapshot.averageTemperatureC = sum / static_cast<double>(count);
        }
    }
    if (!snapshot.efficiencyWattsPerTh && snapshot.powerWatts && snapshot.hashrateThs
        && *snapshot.hashrateThs > 0.0) {
        snapshot.efficiencyWattsPerTh = *snapshot.powerWatts / *snapshot.hashrateThs;
    }
}

} // namespace cgminer

CgminerClient::CgminerClient(unsigned short port)
: apiPort(port) {}

expected<json>
CgminerClient::request(const net::address_v4& address,
                       const std::string& command,
                       const std::string& parameter,
                       std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    net::TcpClient client;
    if (auto ec = client.connect(address, apiPort, timeout); ec) {
        return unexpected(classifyIdentifyError(ec));
    }
    client.setLowLatency();

    json body{{"command", command}};
    if (!parameter.empty()) {
        body["parameter"] = parameter;
    }
    if (auto ec = client.write_all(body.dump(), remainingUntil(deadline)); ec) {
        return unexpected(classifyIdentifyError(ec));
    }

    std::string raw;
    if (auto ec = client.read_to_end(raw, config::CGMINER_MAX_RESPONSE_BYTES, remainingUntil(deadline)); ec) {
        logDebug("[CgminerClient] ", address.to_string(), " '", command, "' read failed: ",
                 ec.message(), "\n");
        return unexpected(classifyIdentifyError(ec));
    }

    repairReply(raw);
    if (raw.empty()) {
        return unexpected(IdentifyError::ProtocolMismatch);
    }

    json reply = json::parse(raw, nullptr, /*allow_exceptions=*/false);
    if (reply.is_discarded() || !reply.is_object()) {
        logDebug("[CgminerClient] ", address.to_string(), " '", command,
                 "' returned non-JSON (", raw.size(), " bytes)\n");
        return unexpected(IdentifyError::ProtocolMismatch);
    }
    return reply;
}

expected<DeviceSnapshot>
CgminerClient::identify(const net::address_v4& address, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    auto version = request(address, "version", "", timeout);
    if (!version) {
        return unexpected(version.error());
    }
    const char status = cgminer::statusLetter(*version);
    if (status == 'E' || status == 'F' || !version->contains("VERSION")) {
        return unexpected(IdentifyError::ProtocolMismatch);
    }

    DeviceSnapshot snapshot;
    snapshot.address = address;
    cgminer::applyVersion(*version, snapshot);

    using Apply = void (*)(const json&, DeviceSnapshot&);
    const std::pair<const char*, Apply> followUps[] = {
        {"summary", &cgminer::applySummary},
        {"stats",   &cgminer::applyStats},
        {"pools",   &cgminer::applyPools},
        {"config",  &cgminer::applyConfig},
    };

    for (const auto& [command, apply] : followUps) {
        const auto remaining = remainingUntil(deadline);
        if (remaining <= std::chrono::milliseconds::zero()) {
            return unexpected(IdentifyError::Timeout);
        }
        auto reply = request(address, command, "", remaining);
        if (!reply) {
            if (isTransient(reply.error())) {
                return unexpected(reply.error());
            }
            continue; // firmware does not implement this one
        }
        const char letter = cgminer::statusLetter(*reply);
        if (letter == 'E' || letter == 'F') {
            continue;
        }
        apply(*reply, snapshot);
    }

    snapshot.faultLight = lightStateFor(address);
    cgminer::finalize(snapshot);
    snapshot.lastUpdated = Clock::now();
    return snapshot;
}

expected<void>
CgminerClient::sendCommand(const net::address_v4& address, Command command) {
    std::string name;
    std::string parameter;
    bool nextLightState = false;

    switch (command) {
        case Command::Start:
            name = "resume";
            break;
        case Command::Stop:
            name = "pause";
            break;
        case Command::ToggleFaultLight:
            nextLightState = !lightStateFor(address);
            name = "ledset";
            parameter = nextLightState ? "red,blink" : "red,auto";
            break;
    }

    auto reply = request(address, name, parameter, net::TimeoutConfig::defaultTimeout());
    if (!reply) {
        logError("[CgminerClient] ", toString(command), " to ", address.to_string(),
                 " failed: ", reply.error().message(), "\n");
        if (reply.error() == IdentifyError::ProtocolMismatch) {
            return unexpected(CommandError::Unsupported);
        }
        return unexpected(CommandError::Unreachable);
    }

    const char letter = cgminer::statusLetter(*reply);
    if (letter != 'S' && letter != 'I') {
        const auto message = cgminer::statusMessage(*reply);
        logError("[CgminerClient] ", toString(command), " to ", address.to_string(),
                 " rejected: ", message.empty() ? "<no message>" : message, "\n");
        if (containsInsensitive(message, "invalid command")) {
            return unexpected(CommandError::Unsupported);
        }
        return unexpected(CommandError::Rejected);
    }

    if (command == Command::ToggleFaultLight) {
        rememberLightState(address, nextLightState);
    }
    logInfo("[CgminerClient] ", toString(command), " -> ", address.to_string(), " ok\n");
    return {};
}

bool CgminerClient::lightStateFor(const net::address_v4& address) const {
    std::lock_guard<std::mutex> lock(lightMutex);
    auto it = lightStates.find(address.to_uint());
    return it != lightStates.end() && it->second;
}

void CgminerClient::rememberLightState(const net::address_v4& address, bool on) {
    std::lock_guard<std::mutex> lock(lightMutex);
    lightStates[address.to_uint()] = on;
}

} // namespace minerscan::device
