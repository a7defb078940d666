#pragma once
#include "minerscan/core/Expected.hpp"
#include "minerscan/device/DeviceSnapshot.hpp"
#include "minerscan/poll/Recorder.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace minerscan::record {

/// `$HOME/.minerscan/recordings`, or `./recordings` when HOME is not set.
std::filesystem::path defaultRecordingsDirectory();

/// `recording_<ip>_<model>_<mac>_<YYYY-mm-dd_HH-MM-SS>.csv`, spaces removed from the model.
std::string recordingFileName(const device::DeviceRecord& record, device::Clock::time_point startedAt);

/// Base columns, then `Board i Hashrate` and `Board i Temp` per board, then `Fan i RPM` (1-based).
std::string csvHeader(std::size_t boards, std::size_t fans);

/// One data row shaped like csvHeader(boards, fans). Missing values are written as 0.
std::string csvRow(const device::DeviceRecord& record, std::size_t boards, std::size_t fans);

/// `miner_export_<YYYY-mm-dd_HH-MM-SS>.csv`
std::string fleetExportFileName(device::Clock::time_point at);

/// IP, hostname, model, firmware, control board, hashrate, power, efficiency,
/// temperature, average fan RPM, active pool and worker.
std::string fleetCsvHeader();

/// One row per device. Unknown values are left empty.
std::string fleetCsvRow(const device::DeviceRecord& record);

/// Writes header plus one row per record; returns the number of rows written.
expected<std::size_t> exportFleet(const std::vector<device::DeviceRecord>& records,
                                  const std::filesystem::path& destination);

/**
 * @brief Appends one CSV row per poll of a single device.
 *
 * The column layout is fixed by the record passed to `start`: later records
 * with more boards or fans are truncated to it, fewer are padded with zeros.
 * Each row is flushed as it is written so an interrupted session keeps
 * everything recorded so far.
 */
class CsvRecorder : public poll::Recorder {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    /// Use start(); the key keeps construction inside this class.
    CsvRecorder(ConstructionKey, std::filesystem::path path, std::size_t boards, std::size_t fans);

    /// Creates the directory and the file, and writes the header.
    static expected<std::shared_ptr<CsvRecorder>>
    start(const device::DeviceRecord& first,
          const std::filesystem::path& directory = defaultRecordingsDirectory());

    expected<void> record(const device::DeviceRecord& snapshot) override;

    /// Closes the file. Later records are ignored.
    void stop();

    bool isRecording() const;
    std::size_t rowCount() const;
    const std::filesystem::path& path() const { return path_; }
    std::chrono::steady_clock::duration elapsed() const;

    expected<void> exportTo(const std::filesystem::path& destination) const;

    /// Stops and deletes the file.
    expected<void> discard();

private:
    const std::filesystem::path path_;
    const std::size_t boards_;
    const std::size_t fans_;
    const std::chrono::steady_clock::time_point startedAt_;

    mutable std::mutex mutex_;
    std::ofstream out_;
    std::size_t rows_ = 0;
    bool recording_ = true;
};

} // namespace minerscan::record
