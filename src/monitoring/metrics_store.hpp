/**
 * @file metrics_store.hpp
 * @brief Bounded per-device sample history plus last-known live state.
 */

#pragma once

#include "core/ring_buffer.hpp"
#include "core/types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace fleetwatch {

struct DeviceLiveState {
    Timestamp last_seen;
    StatusSample last_status;
};

/**
 * @brief Thread-safe store written by the collection cadence and read by
 *        the alert cadence and queries.
 *
 * History and live state for a device are created and removed together.
 * Samples appear in history in the order they were recorded.
 */
class MetricsStore {
public:
    static constexpr size_t DEFAULT_HISTORY = 60;

    explicit MetricsStore(size_t history_capacity = DEFAULT_HISTORY);

    /// Append @p sample and set last_seen = @p seen_at (the tick time).
    void record(StatusSample sample, Timestamp seen_at);

    /**
     * @brief Record only if @p still_tracked accepts the device id.
     *
     * The predicate runs under the store's write lock, so a concurrent
     * erase() either happens first (nothing recorded) or removes the sample.
     * @return false when the sample was dropped.
     */
    bool record_if(StatusSample sample, Timestamp seen_at,
                   const std::function<bool(const DeviceId&)>& still_tracked);

    [[nodiscard]] std::optional<DeviceLiveState> live_state(const DeviceId& id) const;

    /// Oldest first; empty for an unknown device.
    [[nodiscard]] std::vector<StatusSample> history(const DeviceId& id) const;

    /// Consistent copy of every device's live state.
    [[nodiscard]] std::map<DeviceId, DeviceLiveState> live_states() const;

    /// Drop devices with now - last_seen > max_age. Returns the ids removed.
    std::vector<DeviceId> collect_garbage(Timestamp now, std::chrono::seconds max_age);

    void erase(const DeviceId& id);

    [[nodiscard]] size_t device_count() const;
    [[nodiscard]] size_t history_capacity() const noexcept { return capacity_; }

private:
    void append_locked(StatusSample sample, Timestamp seen_at);

    struct Entry {
        RingBuffer<StatusSample> history;
        DeviceLiveState live;
    };

    size_t capacity_;
    mutable std::shared_mutex mutex_;
    std::map<DeviceId, Entry> devices_;
};

}  // namespace fleetwatch
