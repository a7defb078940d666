#include "minerscan/record/CsvRecorder.hpp"
#include "minerscan/log/Log.hpp"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

namespace minerscan::record {

namespace fs = std::filesystem;

namespace {

std::string formatLocalTime(device::Clock::time_point when, const char* format) {
    const std::time_t seconds = device::Clock::to_time_t(when);
    std::tm local{};
    localtime_r(&seconds, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, format);
    return oss.str();
}

std::string csvField(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void appendNumber(std::ostringstream& oss, double value, int precision) {
    oss << ',' << std::fixed << std::setprecision(precision) << value;
}

void appendOptional(std::ostringstream& oss, const std::optional<double>& value, int precision) {
    if (value) {
        appendNumber(oss, *value, precision);
    } else {
        oss << ',';
    }
}

const device::PoolInfo* activePool(const device::DeviceRecord& record) {
    for (const auto& pool : record.pools) {
        if (pool.active) return &pool;
    }
    return record.pools.empty() ? nullptr : &record.pools.front();
}

} // namespace

fs::path defaultRecordingsDirectory() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return fs::path("recordings");
    }
    return fs::path(home) / ".minerscan" / "recordings";
}

std::string recordingFileName(const device::DeviceRecord& record, device::Clock::time_point startedAt) {
    std::string model = record.model;
    model.erase(std::remove(model.begin(), model.end(), ' '), model.end());
    if (model.empty()) {
        model = "unknown";
    }
    return "recording_" + record.address.to_string() + "_" + model + "_" +
           record.mac.value_or("unknown") + "_" + formatLocalTime(startedAt, "%Y-%m-%d_%H-%M-%S") + ".csv";
}

std::string csvHeader(std::size_t boards, std::size_t fans) {
    std::ostringstream oss;
    oss << "Miner IP,MAC Address,Model,Firmware,Timestamp,Total Hashrate (TH/s),Power (W),"
           "Efficiency (W/TH),Avg Temperature (°C)";
    for (std::size_t i = 0; i < boards; ++i) {
        oss << ",Board " << i << " Hashrate";
    }
    for (std::size_t i = 0; i < boards; ++i) {
        oss << ",Board " << i << " Temp";
    }
    for (std::size_t i = 1; i <= fans; ++i) {
        oss << ",Fan " << i << " RPM";
    }
    return oss.str();
}

std::string csvRow(const device::DeviceRecord& record, std::size_t boards, std::size_t fans) {
    std::ostringstream oss;
    oss << record.address.to_string() << ','
        << record.mac.value_or("N/A") << ','
        << csvField(record.model) << ','
        << csvField(record.firmwareVersion) << ','
        << formatLocalTime(record.lastUpdated, "%Y-%m-%d %H:%M:%S");
    appendNumber(oss, record.hashrateThs.value_or(0.0), 2);
    appendNumber(oss, record.powerWatts.value_or(0.0), 0);
    appendNumber(oss, record.efficiencyWattsPerTh.value_or(0.0), 2);
    appendNumber(oss, record.averageTemperatureC.value_or(0.0), 2);

    for (std::size_t i = 0; i < boards; ++i) {
        const double value = i < record.boards.size() ? record.boards[i].hashrateThs.value_or(0.0) : 0.0;
        appendNumber(oss, value, 2);
    }
    for (std::size_t i = 0; i < boards; ++i) {
        const double value = i < record.boards.size() ? record.boards[i].temperatureC.value_or(0.0) : 0.0;
        appendNumber(oss, value, 2);
    }
    for (std::size_t i = 0; i < fans; ++i) {
        appendNumber(oss, i < record.fanRpm.size() ? record.fanRpm[i] : 0.0, 0);
    }
    return oss.str();
}

std::string fleetExportFileName(device::Clock::time_point at) {
    return "miner_export_" + formatLocalTime(at, "%Y-%m-%d_%H-%M-%S") + ".csv";
}

std::string fleetCsvHeader() {
    return "IP,Hostname,Model,Firmware,Control Board,Hashrate (TH/s),Wattage (W),Efficiency (W/TH),"
           "Temperature (°C),Fan Speed (RPM),Pool,Worker";
}

std::string fleetCsvRow(const device::DeviceRecord& record) {
    std::ostringstream oss;
    oss << record.address.to_string() << ','
        << csvField(record.hostname) << ','
        << csvField(record.model) << ','
        << csvField(record.firmwareVersion) << ','
        << csvField(record.controlBoard);
    appendOptional(oss, record.hashrateThs, 2);
    appendOptional(oss, record.powerWatts, 0);
    appendOptional(oss, record.efficiencyWattsPerTh, 2);
    appendOptional(oss, record.averageTemperatureC, 1);

    std::optional<double> fan;
    if (!record.fanRpm.empty()) {
        double sum = 0.0;
        for (double rpm : record.fanRpm) sum += rpm;
        fan = sum / static_cast<double>(record.fanRpm.size());
    }
    appendOptional(oss, fan, 0);

    const auto* pool = activePool(record);
    oss << ',' << (pool ? csvField(pool->url) : std::string())
        << ',' << (pool ? csvField(pool->user) : std::string());
    return oss.str();
}

expected<std::size_t> exportFleet(const std::vector<device::DeviceRecord>& records,
                                  const fs::path& destination) {
    std::error_code ec;
    if (destination.has_parent_path()) {
        fs::create_directories(destination.parent_path(), ec);
        if (ec) {
            logError("[CsvRecorder] cannot create ", destination.parent_path().string(), ": ",
                     ec.message(), "\n");
            return unexpected(ec);
        }
    }

    std::ofstream out(destination, std::ios::out | std::ios::trunc);
    if (!out) {
        logError("[CsvRecorder] cannot write ", destination.string(), "\n");
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    out << fleetCsvHeader() << '\n';
    for (const auto& record : records) {
        out << fleetCsvRow(record) << '\n';
    }
    out.flush();
    if (!out) {
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    logInfo("[CsvRecorder] exported ", records.size(), " miners to ", destination.string(), "\n");
    return records.size();
}

CsvRecorder::CsvRecorder(ConstructionKey, fs::path path, std::size_t boards, std::size_t fans)
: path_(std::move(path))
, boards_(boards)
, fans_(fans)
, startedAt_(std::chrono::steady_clock::now())
{}

expected<std::shared_ptr<CsvRecorder>>
CsvRecorder::start(const device::DeviceRecord& first, const fs::path& directory) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        logError("[CsvRecorder] cannot create ", directory.string(), ": ", ec.message(), "\n");
        return unexpected(ec);
    }

    auto path = directory / recordingFileName(first, device::Clock::now());
    auto recorder = std::make_shared<CsvRecorder>(ConstructionKey{}, path, first.boards.size(),
                                                  first.fanRpm.size());

    recorder->out_.open(path, std::ios::out | std::ios::trunc);
    if (!recorder->out_) {
        logError("[CsvRecorder] cannot open ", path.string(), "\n");
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    recorder->out_ << csvHeader(recorder->boards_, recorder->fans_) << '\n';
    recorder->out_.flush();
    logInfo("[CsvRecorder] recording ", first.identityKey(), " to ", path.string(), "\n");
    return recorder;
}

expected<void> CsvRecorder::record(const device::DeviceRecord& snapshot) {
    std::lock_guard lock(mutex_);
    if (!recording_) {
        return {};
    }
    out_ << csvRow(snapshot, boards_, fans_) << '\n';
    out_.flush();
    if (!out_) {
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    ++rows_;
    return {};
}

void CsvRecorder::stop() {
    std::lock_guard lock(mutex_);
    if (!recording_) return;
    recording_ = false;
    out_.close();
    logInfo("[CsvRecorder] ", path_.filename().string(), ": ", rows_, " rows\n");
}

bool CsvRecorder::isRecording() const {
    std::lock_guard lock(mutex_);
    return recording_;
}

std::size_t CsvRecorder::rowCount() const {
    std::lock_guard lock(mutex_);
    return rows_;
}

std::chrono::steady_clock::duration CsvRecorder::elapsed() const {
    return std::chrono::steady_clock::now() - startedAt_;
}

expected<void> CsvRecorder::exportTo(const fs::path& destination) const {
    std::lock_guard lock(mutex_);
    std::error_code ec;
    fs::copy_file(path_, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return unexpected(ec);
    }
    return {};
}

expected<void> CsvRecorder::discard() {
    stop();
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        return unexpected(ec);
    }
    return {};
}

} // namespace minerscan::record
