#include "minerscan/registry/LiveDeviceRegistry.hpp"

#include "minerscan/log/Log.hpp"

#include <algorithm>

namespace minerscan::registry {

const char* toString(UpsertOutcome outcome) {
    switch (outcome) {
        case UpsertOutcome::Created: return "created";
        case UpsertOutcome::Updated: return "updated";
        case UpsertOutcome::Stale:   return "stale";
    }
    return "unknown";
}

LiveDeviceRegistry::LiveDeviceRegistry(std::size_t historyCapacity)
: historyCapacity_(std::max<std::size_t>(historyCapacity, 1)) {}

std::shared_ptr<LiveDeviceRegistry::Entry>
LiveDeviceRegistry::find(const std::string& identity) const {
    std::shared_lock lock(mapMutex_);
    auto it = entries_.find(identity);
    return it == entries_.end() ? nullptr : it->second;
}

UpsertOutcome LiveDeviceRegistry::apply(Entry& entry, const DeviceRecord& snapshot,
                                        bool withHistory) {
    std::lock_guard<std::mutex> lock(entry.mutex);
    // A freshly created entry still holds a default record.
    const bool empty = entry.record.lastUpdated == device::Clock::time_point{};
    if (!empty && snapshot.lastUpdated <= entry.record.lastUpdated) {
        return UpsertOutcome::Stale;
    }
    entry.record = snapshot;
    if (withHistory) {
        pushHistory(entry, MetricsSample::from(snapshot));
    }
    return empty ? UpsertOutcome::Created : UpsertOutcome::Updated;
}

UpsertOutcome LiveDeviceRegistry::write(const DeviceRecord& snapshot, bool withHistory) {
    if (snapshot.lastUpdated == device::Clock::time_point{}) {
        return UpsertOutcome::Stale; // untimestamped snapshots cannot be ordered
    }
    const auto key = snapshot.identityKey();

    UpsertOutcome outcome = UpsertOutcome::Stale;
    bool applied = false;
    {
        // Shared map lock held across the entry update so remove()/clear()
        // cannot drop the entry between lookup and write.
        std::shared_lock lock(mapMutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            outcome = apply(*it->second, snapshot, withHistory);
            applied = true;
        }
    }
    if (!applied) {
        std::unique_lock lock(mapMutex_);
        auto [it, inserted] = entries_.try_emplace(key, nullptr);
        if (inserted) {
            it->second = std::make_shared<Entry>();
        }
        outcome = apply(*it->second, snapshot, withHistory);
    }

    if (outcome == UpsertOutcome::Stale) {
        logDebug("[LiveDeviceRegistry] dropped stale update for ", key, "\n");
    }
    return outcome;
}

UpsertOutcome LiveDeviceRegistry::upsert(const DeviceRecord& snapshot) {
    return write(snapshot, false);
}

UpsertOutcome LiveDeviceRegistry::merge(const DeviceRecord& snapshot) {
    return write(snapshot, true);
}

std::optional<DeviceRecord> LiveDeviceRegistry::get(const std::string& identity) const {
    auto entry = find(identity);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->record;
}

std::optional<DeviceRecord> LiveDeviceRegistry::findByAddress(const net::address_v4& address) const {
    for (auto& record : list()) {
        if (record.address == address) {
            return std::move(record);
        }
    }
    return std::nullopt;
}

std::vector<DeviceRecord> LiveDeviceRegistry::list() const {
    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::shared_lock lock(mapMutex_);
        snapshot.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            snapshot.push_back(entry);
        }
    }

    std::vector<DeviceRecord> records;
    records.reserve(snapshot.size());
    for (const auto& entry : snapshot) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        records.push_back(entry->record);
    }

    std::sort(records.begin(), records.end(), [](const DeviceRecord& a, const DeviceRecord& b) {
        return a.address < b.address;
    });
    return records;
}

void LiveDeviceRegistry::pushHistory(Entry& entry, const MetricsSample& sample) {
    if (!entry.history.empty() && sample.timestamp <= entry.history.back().timestamp) {
        return;
    }
    entry.history.push_back(sample);
    while (entry.history.size() > historyCapacity_) {
        entry.history.pop_front();
    }
}

bool LiveDeviceRegistry::appendHistory(const std::string& identity, const MetricsSample& sample) {
    auto entry = find(identity);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!entry->history.empty() && sample.timestamp <= entry->history.back().timestamp) {
        return false;
    }
    pushHistory(*entry, sample);
    return true;
}

std::vector<MetricsSample> LiveDeviceRegistry::historyOf(const std::string& identity) const {
    auto entry = find(identity);
    if (!entry) {
        return {};
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    return {entry->history.begin(), entry->history.end()};
}

bool LiveDeviceRegistry::remove(const std::string& identity) {
    std::unique_lock lock(mapMutex_);
    return entries_.erase(identity) > 0;
}

void LiveDeviceRegistry::clear() {
    std::unique_lock lock(mapMutex_);
    entries_.clear();
}

std::size_t LiveDeviceRegistry::size() const {
    std::shared_lock lock(mapMutex_);
    return entries_.size();
}

} // namespace minerscan::registry
