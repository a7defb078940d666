#pragma once

#include "minerscan/net/NetConfig.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace minerscan::device {

using Clock = std::chrono::system_clock;

struct PoolInfo {
    std::string url;
    std::string user;
    bool active = false;

    bool operator==(const PoolInfo& other) const;
    bool operator!=(const PoolInfo& other) const { return !(*this == other); }
};

/// Telemetry of one hash board. Fields are absent when the firmware does not report them.
struct BoardMetrics {
    std::size_t index = 0;
    std::optional<double> hashrateThs;
    std::optional<double> temperatureC;

    bool operator==(const BoardMetrics& other) const;
    bool operator!=(const BoardMetrics& other) const { return !(*this == other); }
};

/**
 * @brief Identity and telemetry of one miner as of `lastUpdated`.
 *
 * Produced by a DeviceIdentifier for every successful identification and
 * stored as-is by the registry, so a snapshot and a registry record are the
 * same type (`DeviceRecord`). Field names are stable; the CSV recorder and any
 * other exporter serialize them directly.
 */
struct DeviceSnapshot {
    net::address_v4 address{};
    std::optional<std::string> mac;     // normalised "aa:bb:cc:dd:ee:ff"
    std::string hostname;
    std::string model;
    std::string firmwareVersion;
    std::string controlBoard;
    std::vector<PoolInfo> pools;

    std::optional<double> hashrateThs;
    std::vector<BoardMetrics> boards;
    std::optional<double> averageTemperatureC;
    std::optional<double> powerWatts;
    std::optional<double> efficiencyWattsPerTh;
    std::vector<double> fanRpm;
    bool faultLight = false;

    Clock::time_point lastUpdated{};

    /// MAC when known, otherwise the dotted-quad address.
    std::string identityKey() const;

    bool operator==(const DeviceSnapshot& other) const;
    bool operator!=(const DeviceSnapshot& other) const { return !(*this == other); }
};

using DeviceRecord = DeviceSnapshot;

/**
 * @brief One history entry: the numeric metrics of a snapshot at its timestamp.
 *
 * Missing values are recorded as 0 so every sample has the same shape.
 */
struct MetricsSample {
    Clock::time_point timestamp{};
    double hashrateThs = 0.0;
    double powerWatts = 0.0;
    std::vector<double> boardHashratesThs;
    double averageTemperatureC = 0.0;
    std::vector<double> boardTemperaturesC;

    static MetricsSample from(const DeviceSnapshot& snapshot);
};

/// Lower-case, colon separated. Returns nullopt for anything that is not 6 hex octets.
std::optional<std::string> normalizeMac(std::string_view text);

} // namespace minerscan::device
