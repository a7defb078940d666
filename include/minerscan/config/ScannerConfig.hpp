#pragma once
#include "minerscan/core/Expected.hpp"
#include "minerscan/scan/AddressRange.hpp"
#include "minerscan/scan/ScanCoordinator.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace minerscan::config {

struct SavedRange {
    std::string name;
    std::string range;   // "a.b.c.d-e" or "a.b.c.d-w.x.y.z"

    bool operator==(const SavedRange& other) const {
        return name == other.name && range == other.range;
    }
};

/// Floor for the pause between automatic re-scans.
constexpr std::chrono::seconds kMinAutoScanInterval{10};

struct ScanSettings {
    unsigned identificationTimeoutSecs = 5;
    unsigned connectivityRetries = 2;
    bool portCheck = true;
};

/**
 * @brief Persistent user settings, stored as JSON.
 *
 * @code{.json}
 * {
 *   "saved_ranges": [ { "name": "rack A", "range": "10.0.81.1-254" } ],
 *   "detail_refresh_interval_secs": 10,
 *   "auto_scan_interval_secs": 120,
 *   "scan": { "identification_timeout_secs": 5, "connectivity_retries": 2, "port_check": true }
 * }
 * @endcode
 *
 * Older files that hold only the array of saved ranges are still accepted.
 */
struct ScannerConfig {
    std::vector<SavedRange> savedRanges;
    unsigned detailRefreshIntervalSecs = 10;
    unsigned autoScanIntervalSecs = 120;
    ScanSettings scanSettings;

    /// Fails with RangeError::InvalidRange, or `errc::file_exists` if the range is already saved.
    expected<void> addSavedRange(std::string name, std::string range);
    bool removeSavedRange(std::string_view name);
    const SavedRange* findSavedRange(std::string_view name) const;

    /// Every saved range that parses, in saved order. Broken entries are logged and skipped.
    std::vector<scan::AddressRange> savedAddressRanges() const;

    scan::ScanOptions toScanOptions() const;

    /// Default poll interval for watched devices, clamped to the poller limits.
    std::chrono::milliseconds detailRefreshInterval() const;

    /// Pause between automatic re-scans, at least kMinAutoScanInterval.
    std::chrono::seconds autoScanInterval() const;
};

void to_json(nlohmann::json& j, const SavedRange& range);
void from_json(const nlohmann::json& j, SavedRange& range);
void to_json(nlohmann::json& j, const ScannerConfig& config);
void from_json(const nlohmann::json& j, ScannerConfig& config);

/// `$HOME/.minerscan/scanner_config.json`, or `./scanner_config.json` when HOME is not set.
std::filesystem::path defaultConfigPath();

/// Missing or unreadable files yield the defaults; problems are logged, never thrown.
ScannerConfig loadConfig(const std::filesystem::path& path = defaultConfigPath());

/// Writes pretty-printed JSON, creating the parent directory.
expected<void> saveConfig(const ScannerConfig& config,
                          const std::filesystem::path& path = defaultConfigPath());

} // namespace minerscan::config
