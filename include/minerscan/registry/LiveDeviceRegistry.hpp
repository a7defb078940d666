#pragma once
#include "minerscan/device/DeviceSnapshot.hpp"
#include "minerscan/net/NetConfig.hpp"

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace minerscan::registry {

using device::DeviceRecord;
using device::MetricsSample;

/// 24 hours of 5-minute samples.
constexpr std::size_t kDefaultHistoryCapacity = 288;

enum class UpsertOutcome {
    Created,
    Updated,
    Stale,   // timestamp not newer than the stored record; nothing changed
};

const char* toString(UpsertOutcome outcome);

/**
 * @brief Last known state of every device, shared by sweeps, pollers and readers.
 *
 * Concurrency:
 * - The map itself sits behind a shared mutex that is taken exclusively only
 *   to insert or drop keys.
 * - Every entry has its own mutex, held for exactly one record copy or
 *   assignment. Unrelated devices never contend, and no lock is held while
 *   the caller talks to the network.
 * - Readers get copies, so they never observe a half-written record.
 *
 * Ordering: an upsert whose `lastUpdated` is not strictly newer than the stored
 * record is dropped (`UpsertOutcome::Stale`). This is how a slow response from
 * one producer is kept from overwriting a newer one from another. Snapshots
 * without a timestamp are always stale.
 */
class LiveDeviceRegistry {
public:
    explicit LiveDeviceRegistry(std::size_t historyCapacity = kDefaultHistoryCapacity);

    LiveDeviceRegistry(const LiveDeviceRegistry&) = delete;
    LiveDeviceRegistry& operator=(const LiveDeviceRegistry&) = delete;

    UpsertOutcome upsert(const DeviceRecord& snapshot);

    /**
     * @brief upsert + appendHistory under one entry lock.
     *
     * The history sample is only appended when the record was accepted.
     */
    UpsertOutcome merge(const DeviceRecord& snapshot);

    std::optional<DeviceRecord> get(const std::string& identity) const;
    std::optional<DeviceRecord> findByAddress(const net::address_v4& address) const;

    /// Copies of every record, ordered by address.
    std::vector<DeviceRecord> list() const;

    /**
     * @brief Append to the identity's bounded history.
     *
     * Returns false for an unknown identity or a sample not newer than the
     * latest one. The oldest sample is evicted once capacity is reached.
     */
    bool appendHistory(const std::string& identity, const MetricsSample& sample);

    /// Oldest first.
    std::vector<MetricsSample> historyOf(const std::string& identity) const;

    bool remove(const std::string& identity);
    void clear();

    std::size_t size() const;
    std::size_t historyCapacity() const { return historyCapacity_; }

private:
    struct Entry {
        mutable std::mutex mutex;
        DeviceRecord record;
        std::deque<MetricsSample> history;
    };

    std::shared_ptr<Entry> find(const std::string& identity) const;
    UpsertOutcome write(const DeviceRecord& snapshot, bool withHistory);
    UpsertOutcome apply(Entry& entry, const DeviceRecord& snapshot, bool withHistory);
    void pushHistory(Entry& entry, const MetricsSample& sample);

    const std::size_t historyCapacity_;
    mutable std::shared_mutex mapMutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace minerscan::registry
