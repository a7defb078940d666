#include "minerscan/config/ScannerConfig.hpp"
#include "minerscan/core/Errors.hpp"
#include "minerscan/device/DeviceIdentifier.hpp"
#include "minerscan/poll/DevicePoller.hpp"
#include "minerscan/record/CsvRecorder.hpp"
#include "support/TestSupport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace minerscan;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

fs::path scratchDir(const std::string& name) {
    auto dir = fs::temp_directory_path() / ("minerscan-test-" + std::to_string(::getpid())) / name;
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    return dir;
}

void writeFile(const fs::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

std::vector<std::string> readLines(const fs::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) {
        lines.push_back(line);
    }
    return lines;
}

device::DeviceRecord sampleRecord() {
    device::DeviceRecord record;
    record.address = net::make_address_v4("10.0.81.17");
    record.mac = "aa:bb:cc:dd:ee:17";
    record.model = "Antminer S19j Pro";
    record.firmwareVersion = "2023.01";
    record.hashrateThs = 100.456;
    record.powerWatts = 3249.6;
    record.efficiencyWattsPerTh = 32.3456;
    record.averageTemperatureC = 66.0;
    record.boards = {device::BoardMetrics{0, 33.1, 65.0}, device::BoardMetrics{1, 33.2, std::nullopt}};
    record.fanRpm = {5400.4, 5460.6, 5500.0};
    record.lastUpdated = device::Clock::now();
    return record;
}

} // namespace

static void testSavedRanges() {
    config::ScannerConfig cfg;
    ASSERT_TRUE(cfg.addSavedRange("rack A", "10.0.81.1-254").has_value(), "shorthand accepted");
    ASSERT_TRUE(cfg.addSavedRange("rack B", "10.0.82.0-10.0.82.255").has_value(), "long form accepted");

    auto bad = cfg.addSavedRange("broken", "10.0.81.300-4");
    ASSERT_TRUE(!bad && bad.error() == RangeError::InvalidRange, "invalid range rejected");

    auto duplicate = cfg.addSavedRange("again", "10.0.81.1-10.0.81.254");
    ASSERT_TRUE(!duplicate, "same range in another spelling rejected");
    ASSERT_EQ(cfg.savedRanges.size(), std::size_t{2}, "two ranges kept");

    const auto* found = cfg.findSavedRange("rack B");
    ASSERT_TRUE(found && found->range == "10.0.82.0-10.0.82.255", "lookup by name");
    ASSERT_TRUE(cfg.removeSavedRange("rack A"), "remove");
    ASSERT_TRUE(!cfg.removeSavedRange("rack A"), "remove twice");
    ASSERT_TRUE(cfg.findSavedRange("rack A") == nullptr, "gone");
}

static void testSaveAndLoadRoundTrip() {
    const auto dir = scratchDir("config");
    const auto path = dir / "nested" / "scanner_config.json";

    config::ScannerConfig cfg;
    cfg.addSavedRange("lab", "192.168.1.10-20");
    cfg.detailRefreshIntervalSecs = 15;
    cfg.autoScanIntervalSecs = 300;
    cfg.scanSettings.connectivityRetries = 4;
    cfg.scanSettings.portCheck = false;
    ASSERT_TRUE(config::saveConfig(cfg, path).has_value(), "saved, directory created");

    const auto loaded = config::loadConfig(path);
    ASSERT_TRUE(loaded.savedRanges == cfg.savedRanges, "ranges");
    ASSERT_EQ(loaded.detailRefreshIntervalSecs, 15u, "refresh interval");
    ASSERT_EQ(loaded.autoScanIntervalSecs, 300u, "auto scan interval");
    ASSERT_EQ(loaded.scanSettings.connectivityRetries, 4u, "retries");
    ASSERT_TRUE(!loaded.scanSettings.portCheck, "port check");

    const auto options = loaded.toScanOptions();
    ASSERT_TRUE(options.identificationTimeout == 5s, "default identification timeout");
    ASSERT_EQ(options.connectivityRetries, 4u, "options retries");
    ASSERT_TRUE(!options.portCheckEnabled, "options port check");
}

static void testLegacyAndBrokenFiles() {
    const auto dir = scratchDir("legacy");

    writeFile(dir / "legacy.json", R"([{"name":"old","range":"10.1.1.1-50"}])");
    const auto legacy = config::loadConfig(dir / "legacy.json");
    ASSERT_EQ(legacy.savedRanges.size(), std::size_t{1}, "bare array read as saved ranges");
    ASSERT_EQ(legacy.detailRefreshIntervalSecs, 10u, "default refresh");
    ASSERT_EQ(legacy.autoScanIntervalSecs, 120u, "default auto scan");

    writeFile(dir / "partial.json", R"({"saved_ranges":[],"auto_scan_interval_secs":60})");
    const auto partial = config::loadConfig(dir / "partial.json");
    ASSERT_EQ(partial.autoScanIntervalSecs, 60u, "present key read");
    ASSERT_EQ(partial.detailRefreshIntervalSecs, 10u, "missing key defaulted");

    writeFile(dir / "broken.json", "{ not json");
    const auto broken = config::loadConfig(dir / "broken.json");
    ASSERT_TRUE(broken.savedRanges.empty(), "parse error falls back to defaults");

    writeFile(dir / "wrongtype.json", R"({"detail_refresh_interval_secs":"soon"})");
    const auto wrongType = config::loadConfig(dir / "wrongtype.json");
    ASSERT_EQ(wrongType.detailRefreshIntervalSecs, 10u, "type error falls back to defaults");

    const auto missing = config::loadConfig(dir / "missing.json");
    ASSERT_EQ(missing.autoScanIntervalSecs, 120u, "missing file gives defaults");
}

static void testNegativeAndOversizedNumbersAreBounded() {
    const auto dir = scratchDir("bounds");

    writeFile(dir / "negative.json",
              R"({"auto_scan_interval_secs":-5,"scan":{"connectivity_retries":-1,"identification_timeout_secs":3}})");
    const auto negative = config::loadConfig(dir / "negative.json");
    ASSERT_EQ(negative.scanSettings.connectivityRetries, 2u, "negative retries fall back to the default");
    ASSERT_EQ(negative.autoScanIntervalSecs, 120u, "negative interval falls back to the default");
    ASSERT_EQ(negative.scanSettings.identificationTimeoutSecs, 3u, "valid sibling kept");

    writeFile(dir / "huge.json", R"({"scan":{"connectivity_retries":4294967295}})");
    const auto huge = config::loadConfig(dir / "huge.json");
    ASSERT_EQ(huge.scanSettings.connectivityRetries, device::kMaxConnectivityRetries, "clamped on load");

    config::ScannerConfig cfg;
    cfg.scanSettings.connectivityRetries = 1000;
    ASSERT_EQ(cfg.toScanOptions().connectivityRetries, device::kMaxConnectivityRetries, "clamped for sweeps");
}

static void testCsvLayout() {
    ASSERT_EQ(record::csvHeader(2, 3),
              std::string("Miner IP,MAC Address,Model,Firmware,Timestamp,Total Hashrate (TH/s),Power (W),"
                          "Efficiency (W/TH),Avg Temperature (°C),Board 0 Hashrate,Board 1 Hashrate,"
                          "Board 0 Temp,Board 1 Temp,Fan 1 RPM,Fan 2 RPM,Fan 3 RPM"),
              "dynamic header");

    const auto record = sampleRecord();
    const auto row = record::csvRow(record, 2, 3);
    ASSERT_TRUE(row.rfind("10.0.81.17,aa:bb:cc:dd:ee:17,Antminer S19j Pro,2023.01,", 0) == 0, "identity columns");
    ASSERT_TRUE(row.find(",100.46,3250,32.35,66.00,33.10,33.20,65.00,0.00,5400,5461,5500") != std::string::npos,
                "numeric columns and precision");

    const auto padded = record::csvRow(record, 3, 1);
    ASSERT_TRUE(padded.size() > 10 && padded.substr(padded.size() - 10) == ",0.00,5400", "padded and truncated to header");

    auto noMac = record;
    noMac.mac.reset();
    noMac.model = "Model, With Comma";
    const auto quoted = record::csvRow(noMac, 0, 0);
    ASSERT_TRUE(quoted.find(",N/A,\"Model, With Comma\",") != std::string::npos, "N/A and quoting");

    const auto name = record::recordingFileName(record, record.lastUpdated);
    ASSERT_TRUE(name.rfind("recording_10.0.81.17_AntminerS19jPro_aa:bb:cc:dd:ee:17_", 0) == 0, "file name");
    ASSERT_TRUE(name.size() > 4 && name.substr(name.size() - 4) == ".csv", "csv extension");
}

static void testRecorderWritesRows() {
    const auto dir = scratchDir("recordings");
    const auto record = sampleRecord();

    auto recorder = record::CsvRecorder::start(record, dir / "out");
    ASSERT_TRUE(recorder.has_value(), "recorder started");
    if (!recorder) return;
    auto& rec = **recorder;
    ASSERT_TRUE(rec.isRecording(), "recording");

    ASSERT_TRUE(rec.record(record).has_value(), "row 1");
    ASSERT_TRUE(rec.record(record).has_value(), "row 2");
    ASSERT_EQ(rec.rowCount(), std::size_t{2}, "two rows");

    rec.stop();
    ASSERT_TRUE(!rec.isRecording(), "stopped");
    ASSERT_TRUE(rec.record(record).has_value(), "records after stop are ignored");
    ASSERT_EQ(rec.rowCount(), std::size_t{2}, "still two rows");

    const auto lines = readLines(rec.path());
    ASSERT_EQ(lines.size(), std::size_t{3}, "header plus two rows");
    if (!lines.empty()) {
        ASSERT_EQ(lines[0], record::csvHeader(2, 3), "header sized from the first record");
    }

    const auto exported = dir / "export.csv";
    ASSERT_TRUE(rec.exportTo(exported).has_value(), "exported");
    ASSERT_EQ(readLines(exported).size(), std::size_t{3}, "export is a full copy");

    ASSERT_TRUE(rec.discard().has_value(), "discarded");
    ASSERT_TRUE(!fs::exists(rec.path()), "file removed");
}

static void testConfigIntervalsAndRangeList() {
    config::ScannerConfig cfg;
    ASSERT_TRUE(cfg.addSavedRange("rack A", "10.0.81.1-10").has_value(), "rack A");
    ASSERT_TRUE(cfg.addSavedRange("rack B", "10.0.82.5").has_value(), "rack B");
    config::SavedRange hand;
    hand.name = "edited by hand";
    hand.range = "10.0.83.9-10.0.83.1";
    cfg.savedRanges.push_back(hand);

    const auto ranges = cfg.savedAddressRanges();
    ASSERT_EQ(ranges.size(), std::size_t{2}, "invalid saved range skipped");
    if (ranges.size() == 2) {
        ASSERT_EQ(ranges[0].size(), std::uint64_t{10}, "first range in order");
        ASSERT_EQ(ranges[1].first().to_string(), std::string("10.0.82.5"), "second range in order");
    }

    cfg.detailRefreshIntervalSecs = 1;
    ASSERT_EQ(cfg.detailRefreshInterval().count(), poll::kMinPollInterval.count(), "refresh raised to the poll floor");
    cfg.detailRefreshIntervalSecs = 600;
    ASSERT_EQ(cfg.detailRefreshInterval().count(), poll::kMaxPollInterval.count(), "refresh capped at the poll ceiling");
    cfg.detailRefreshIntervalSecs = 15;
    ASSERT_EQ(cfg.detailRefreshInterval().count(), std::chrono::milliseconds::rep{15000}, "refresh in range kept");

    cfg.autoScanIntervalSecs = 0;
    ASSERT_EQ(cfg.autoScanInterval().count(), config::kMinAutoScanInterval.count(), "auto-scan floor");
    cfg.autoScanIntervalSecs = 300;
    ASSERT_EQ(cfg.autoScanInterval().count(), std::chrono::seconds::rep{300}, "auto-scan kept");
}

static void testFleetExport() {
    ASSERT_EQ(record::fleetCsvHeader(),
              std::string("IP,Hostname,Model,Firmware,Control Board,Hashrate (TH/s),Wattage (W),"
                          "Efficiency (W/TH),Temperature (°C),Fan Speed (RPM),Pool,Worker"),
              "fleet header");

    auto record = sampleRecord();
    ASSERT_EQ(record::fleetCsvRow(record),
              std::string("10.0.81.17,,Antminer S19j Pro,2023.01,,100.46,3250,32.35,66.0,5454,,"),
              "missing hostname, board and pool left empty; fans averaged");

    record.hostname = "rack-a-17";
    record.controlBoard = "Xilinx";
    record.pools = {device::PoolInfo{"stratum+tcp://backup:3333", "acct.backup", false},
                    device::PoolInfo{"stratum+tcp://main:3333", "acct.s19", true}};
    ASSERT_EQ(record::fleetCsvRow(record),
              std::string("10.0.81.17,rack-a-17,Antminer S19j Pro,2023.01,Xilinx,100.46,3250,32.35,66.0,5454,"
                          "stratum+tcp://main:3333,acct.s19"),
              "active pool chosen");

    auto bare = device::DeviceRecord{};
    bare.address = net::make_address_v4("10.0.81.18");
    bare.pools = {device::PoolInfo{"stratum+tcp://only:3333", "acct", false}};
    ASSERT_EQ(record::fleetCsvRow(bare), std::string("10.0.81.18,,,,,,,,,,stratum+tcp://only:3333,acct"),
              "no metrics, first pool when none is active");

    const auto dir = scratchDir("fleet");
    const auto target = dir / "nested" / "fleet.csv";
    auto written = record::exportFleet({record, bare}, target);
    ASSERT_TRUE(written.has_value(), "exported");
    if (written) {
        ASSERT_EQ(*written, std::size_t{2}, "two miners");
    }
    const auto lines = readLines(target);
    ASSERT_EQ(lines.size(), std::size_t{3}, "header plus one row per miner");
    if (lines.size() == 3) {
        ASSERT_EQ(lines[0], record::fleetCsvHeader(), "header first");
        ASSERT_EQ(lines[2], record::fleetCsvRow(bare), "rows in input order");
    }

    ASSERT_TRUE(record::exportFleet({}, target).has_value(), "empty export");
    ASSERT_EQ(readLines(target).size(), std::size_t{1}, "rewritten, header only");

    const auto name = record::fleetExportFileName(device::Clock::now());
    ASSERT_TRUE(name.rfind("miner_export_", 0) == 0, "export file prefix");
    ASSERT_EQ(name.size(), std::string("miner_export_2024-01-01_00-00-00.csv").size(), "timestamped name");
}

int main() {
    testing::silenceInfoLogs();
    testSavedRanges();
    testSaveAndLoadRoundTrip();
    testLegacyAndBrokenFiles();
    testNegativeAndOversizedNumbersAreBounded();
    testCsvLayout();
    testRecorderWritesRows();
    testConfigIntervalsAndRangeList();
    testFleetExport();
    return testing::finishTests("ScannerConfig/CsvRecorder");
}
