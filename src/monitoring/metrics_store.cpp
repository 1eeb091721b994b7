/**
 * @file metrics_store.cpp
 * @brief MetricsStore implementation.
 */

#include "monitoring/metrics_store.hpp"

#include <mutex>

namespace fleetwatch {

MetricsStore::MetricsStore(size_t history_capacity)
    : capacity_(history_capacity == 0 ? DEFAULT_HISTORY : history_capacity) {}

void MetricsStore::record(StatusSample sample, Timestamp seen_at) {
    std::unique_lock lock(mutex_);
    append_locked(std::move(sample), seen_at);
}

bool MetricsStore::record_if(StatusSample sample, Timestamp seen_at,
                             const std::function<bool(const DeviceId&)>& still_tracked) {
    std::unique_lock lock(mutex_);
    if (!still_tracked(sample.device_id)) return false;
    append_locked(std::move(sample), seen_at);
    return true;
}

void MetricsStore::append_locked(StatusSample sample, Timestamp seen_at) {
    auto it = devices_.find(sample.device_id);
    if (it == devices_.end()) {
        it = devices_.emplace(sample.device_id, Entry{RingBuffer<StatusSample>(capacity_), {}}).first;
    }
    auto& entry = it->second;
    entry.live.last_seen = seen_at;
    entry.live.last_status = sample;
    entry.history.push(std::move(sample));
}

std::optional<DeviceLiveState> MetricsStore::live_state(const DeviceId& id) const {
    std::shared_lock lock(mutex_);
    auto it = devices_.find(id);
    if (it == devices_.end()) return std::nullopt;
    return it->second.live;
}

std::vector<StatusSample> MetricsStore::history(const DeviceId& id) const {
    std::shared_lock lock(mutex_);
    auto it = devices_.find(id);
    if (it == devices_.end()) return {};
    return it->second.history.to_vector();
}

std::map<DeviceId, DeviceLiveState> MetricsStore::live_states() const {
    std::shared_lock lock(mutex_);
    std::map<DeviceId, DeviceLiveState> states;
    for (const auto& [id, entry] : devices_) {
        states.emplace(id, entry.live);
    }
    return states;
}

std::vector<DeviceId> MetricsStore::collect_garbage(Timestamp now, std::chrono::seconds max_age) {
    std::unique_lock lock(mutex_);
    std::vector<DeviceId> removed;
    for (auto it = devices_.begin(); it != devices_.end();) {
        if (now - it->second.live.last_seen > max_age) {
            removed.push_back(it->first);
            it = devices_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

void MetricsStore::erase(const DeviceId& id) {
    std::unique_lock lock(mutex_);
    devices_.erase(id);
}

size_t MetricsStore::device_count() const {
    std::shared_lock lock(mutex_);
    return devices_.size();
}

}  // namespace fleetwatch
