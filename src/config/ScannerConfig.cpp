#include "minerscan/config/ScannerConfig.hpp"
#include "minerscan/device/DeviceIdentifier.hpp"
#include "minerscan/log/Log.hpp"
#include "minerscan/poll/DevicePoller.hpp"
#include "minerscan/scan/AddressRange.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstdint>
#include <fstream>
#include <limits>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace minerscan::config {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

// Negative or non-integer values fall back to the default instead of wrapping.
unsigned unsignedField(const json& j, const char* key, unsigned fallback) {
    const auto it = j.find(key);
    if (it == j.end()) {
        return fallback;
    }
    if (!it->is_number_unsigned() || it->get<std::uint64_t>() > std::numeric_limits<unsigned>::max()) {
        logWarning("[ScannerConfig] ignoring ", key, "=", it->dump(), ", using ", fallback, "\n");
        return fallback;
    }
    return it->get<unsigned>();
}

} // namespace

expected<void> ScannerConfig::addSavedRange(std::string name, std::string range) {
    auto parsed = scan::AddressRange::parse(range);
    if (!parsed) {
        return tl::make_unexpected(parsed.error());
    }
    const bool duplicate = std::any_of(savedRanges.begin(), savedRanges.end(),
        [&](const SavedRange& saved) {
            auto existing = scan::AddressRange::parse(saved.range);
            return existing && *existing == *parsed;
        });
    if (duplicate) {
        return unexpected(std::make_error_code(std::errc::file_exists));
    }
    savedRanges.push_back(SavedRange{std::move(name), std::move(range)});
    return {};
}

bool ScannerConfig::removeSavedRange(std::string_view name) {
    const auto before = savedRanges.size();
    savedRanges.erase(std::remove_if(savedRanges.begin(), savedRanges.end(),
                                     [&](const SavedRange& saved) { return saved.name == name; }),
                      savedRanges.end());
    return savedRanges.size() != before;
}

const SavedRange* ScannerConfig::findSavedRange(std::string_view name) const {
    for (const auto& saved : savedRanges) {
        if (saved.name == name) {
            return &saved;
        }
    }
    return nullptr;
}

scan::ScanOptions ScannerConfig::toScanOptions() const {
    scan::ScanOptions options;
    options.identificationTimeout = std::chrono::seconds(scanSettings.identificationTimeoutSecs);
    options.probeTimeout = options.identificationTimeout;
    options.connectivityRetries = device::clampRetries(scanSettings.connectivityRetries);
    options.portCheckEnabled = scanSettings.portCheck;
    return options;
}

std::vector<scan::AddressRange> ScannerConfig::savedAddressRanges() const {
    std::vector<scan::AddressRange> ranges;
    ranges.reserve(savedRanges.size());
    for (const auto& saved : savedRanges) {
        auto range = scan::AddressRange::parse(saved.range);
        if (!range) {
            logWarning("[ScannerConfig] skipping saved range '", saved.name, "': ", saved.range, "\n");
            continue;
        }
        ranges.push_back(*range);
    }
    return ranges;
}

std::chrono::milliseconds ScannerConfig::detailRefreshInterval() const {
    return poll::clampPollInterval(std::chrono::seconds(detailRefreshIntervalSecs));
}

std::chrono::seconds ScannerConfig::autoScanInterval() const {
    return std::max(std::chrono::seconds(autoScanIntervalSecs), kMinAutoScanInterval);
}

void to_json(json& j, const SavedRange& range) {
    j = json{{"name", range.name}, {"range", range.range}};
}

void from_json(const json& j, SavedRange& range) {
    j.at("name").get_to(range.name);
    j.at("range").get_to(range.range);
}

void to_json(json& j, const ScannerConfig& config) {
    j = json{
        {"saved_ranges", config.savedRanges},
        {"detail_refresh_interval_secs", config.detailRefreshIntervalSecs},
        {"auto_scan_interval_secs", config.autoScanIntervalSecs},
        {"scan", {
            {"identification_timeout_secs", config.scanSettings.identificationTimeoutSecs},
            {"connectivity_retries", config.scanSettings.connectivityRetries},
            {"port_check", config.scanSettings.portCheck},
        }},
    };
}

void from_json(const json& j, ScannerConfig& config) {
    ScannerConfig defaults;
    config.savedRanges = j.value("saved_ranges", defaults.savedRanges);
    config.detailRefreshIntervalSecs = unsignedField(j, "detail_refresh_interval_secs", defaults.detailRefreshIntervalSecs);
    config.autoScanIntervalSecs = unsignedField(j, "auto_scan_interval_secs", defaults.autoScanIntervalSecs);
    config.scanSettings = defaults.scanSettings;
    if (j.contains("scan")) {
        const auto& s = j.at("scan");
        config.scanSettings.identificationTimeoutSecs =
            unsignedField(s, "identification_timeout_secs", defaults.scanSettings.identificationTimeoutSecs);
        config.scanSettings.connectivityRetries = device::clampRetries(
            unsignedField(s, "connectivity_retries", defaults.scanSettings.connectivityRetries));
        config.scanSettings.portCheck = s.value("port_check", defaults.scanSettings.portCheck);
    }
}

fs::path defaultConfigPath() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return fs::path("scanner_config.json");
    }
    return fs::path(home) / ".minerscan" / "scanner_config.json";
}

ScannerConfig loadConfig(const fs::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        logDebug("[ScannerConfig] ", path.string(), " not found, using defaults\n");
        return {};
    }

    try {
        const json j = json::parse(in);
        if (j.is_array()) {
            // Legacy layout: the file is just the saved ranges.
            ScannerConfig config;
            config.savedRanges = j.get<std::vector<SavedRange>>();
            logInfo("[ScannerConfig] loaded legacy range list from ", path.string(), "\n");
            return config;
        }
        if (!j.is_object()) {
            logWarning("[ScannerConfig] ", path.string(), " is not a JSON object, using defaults\n");
            return {};
        }
        auto config = j.get<ScannerConfig>();
        logDebug("[ScannerConfig] loaded ", path.string(), "\n");
        return config;
    } catch (const json::exception& e) {
        logWarning("[ScannerConfig] failed to parse ", path.string(), ": ", e.what(), ", using defaults\n");
        return {};
    }
}

expected<void> saveConfig(const ScannerConfig& config, const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            logError("[ScannerConfig] cannot create ", path.parent_path().string(), ": ", ec.message(), "\n");
            return unexpected(ec);
        }
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) {
        logError("[ScannerConfig] cannot write ", path.string(), "\n");
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    out << json(config).dump(2) << '\n';
    if (!out) {
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    return {};
}

} // namespace minerscan::config
