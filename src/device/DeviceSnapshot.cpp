#include "minerscan/device/DeviceSnapshot.hpp"

#include <cctype>

namespace minerscan::device {

bool PoolInfo::operator==(const PoolInfo& other) const {
    return url == other.url && user == other.user && active == other.active;
}

bool BoardMetrics::operator==(const BoardMetrics& other) const {
    return index == other.index
        && hashrateThs == other.hashrateThs
        && temperatureC == other.temperatureC;
}

std::string DeviceSnapshot::identityKey() const {
    if (mac && !mac->empty()) {
        return *mac;
    }
    return address.to_string();
}

bool DeviceSnapshot::operator==(const DeviceSnapshot& other) const {
    return address == other.address
        && mac == other.mac
        && hostname == other.hostname
        && model == other.model
        && firmwareVersion == other.firmwareVersion
        && controlBoard == other.controlBoard
        && pools == other.pools
        && hashrateThs == other.hashrateThs
        && boards == other.boards
        && averageTemperatureC == other.averageTemperatureC
        && powerWatts == other.powerWatts
        && efficiencyWattsPerTh == other.efficiencyWattsPerTh
        && fanRpm == other.fanRpm
        && faultLight == other.faultLight
        && lastUpdated == other.lastUpdated;
}

MetricsSample MetricsSample::from(const DeviceSnapshot& snapshot) {
    MetricsSample sample;
    sample.timestamp = snapshot.lastUpdated;
    sample.hashrateThs = snapshot.hashrateThs.value_or(0.0);
    sample.powerWatts = snapshot.powerWatts.value_or(0.0);
    sample.averageTemperatureC = snapshot.averageTemperatureC.value_or(0.0);
    sample.boardHashratesThs.reserve(snapshot.boards.size());
    sample.boardTemperaturesC.reserve(snapshot.boards.size());
    for (const auto& board : snapshot.boards) {
        sample.boardHashratesThs.push_back(board.hashrateThs.value_or(0.0));
        sample.boardTemperaturesC.push_back(board.temperatureC.value_or(0.0));
    }
    return sample;
}

std::optional<std::string> normalizeMac(std::string_view text) {
    std::string digits;
    digits.reserve(12);
    for (char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isxdigit(uc)) {
            digits.push_back(static_cast<char>(std::tolower(uc)));
        } else if (c != ':' && c != '-' && c != '.') {
            return std::nullopt;
        }
    }
    if (digits.size() != 12) {
        return std::nullopt;
    }

    std::string out;
    out.reserve(17);
    for (std::size_t i = 0; i < digits.size(); i += 2) {
        if (i) out.push_back(':');
        out.append(digits, i, 2);
    }
    return out;
}

} // namespace minerscan::device
