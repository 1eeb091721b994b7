/**
 * @file monitor_service.cpp
 * @brief MonitorService implementation.
 */

#include "service/monitor_service.hpp"

#include "discovery/ipv4.hpp"

#include <algorithm>

namespace fleetwatch {

std::vector<AlertRule> configured_rules(const AlertsConfig& config, Logger& logger) {
    auto rules = default_rules(std::chrono::seconds(config.offline_after_s));
    for (const auto& name : apply_overrides(rules, config.rules)) {
        logger.log(LogLevel::Warn, "config", "Ignoring override for unknown alert rule '" + name + "'");
    }
    return rules;
}

MonitorService::MonitorService(const Config& config,
                               IProtocolClient& client,
                               IDeviceStore& store,
                               Logger& logger,
                               MetricsCollector* telemetry,
                               Clock clock)
    : config_(config)
    , store_(store)
    , logger_(logger)
    , telemetry_(telemetry)
    , clock_(std::move(clock))
    , driver_ctx_{client, config.driver, logger}
    , registry_(driver_ctx_, config.driver.max_backups_per_device)
    , metrics_(MetricsStore::DEFAULT_HISTORY)
    , alerts_(configured_rules(config.alerts, logger), config.alerts.capacity, logger)
    , scanner_(client, config.scanner, config.driver, logger)
    , poller_(registry_, metrics_, alerts_, config.poller, logger, telemetry, clock_) {}

MonitorService::~MonitorService() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> MonitorService::load() {
    auto devices = store_.load_devices();
    if (!devices) return devices.error();

    size_t loaded = 0;
    for (auto& device : *devices) {
        auto id = device.id;
        if (auto added = registry_.add(std::move(device)); !added) {
            logger_.log(LogLevel::Warn, "service",
                        "Skipping inventory entry '" + id + "': " + added.error().message);
            continue;
        }
        ++loaded;
    }
    logger_.log(LogLevel::Info, "service",
                "Loaded " + std::to_string(loaded) + " devices from inventory");
    return {};
}

void MonitorService::start() {
    poller_.start();
}

void MonitorService::stop() {
    poller_.stop();
    if (telemetry_) telemetry_->flush();
}

// ─────────────────────────────────────────────
// Device queries
// ─────────────────────────────────────────────

std::vector<DeviceOverview> MonitorService::list_devices() const {
    auto states = metrics_.live_states();
    std::vector<DeviceOverview> rows;
    for (auto& device : registry_.list()) {
        DeviceOverview row;
        if (auto it = states.find(device.id); it != states.end()) {
            row.online = it->second.last_status.reachable;
            row.last_seen = it->second.last_seen;
        }
        row.config = std::move(device);
        rows.push_back(std::move(row));
    }
    return rows;
}

Result<std::vector<DiscoveryCandidate>> MonitorService::discover_devices(std::string_view cidr) {
    auto started = std::chrono::steady_clock::now();
    auto candidates = scanner_.discover(cidr);
    if (!candidates) return candidates;

    if (telemetry_) {
        auto hosts = parse_cidr(cidr).map([](const Ipv4Range& r) { return r.host_count(); }).value_or(uint64_t{0});
        telemetry_->record_discovery(
            cidr, hosts, candidates->size(),
            std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started));
    }
    return candidates;
}

Result<DeviceStatusView> MonitorService::get_device_status(const DeviceId& id) const {
    auto device = registry_.find(id);
    if (!device) return device.error();

    DeviceStatusView view;
    view.config = std::move(*device);
    view.live = metrics_.live_state(id);

    auto history = metrics_.history(id);
    auto skip = history.size() > STATUS_HISTORY_POINTS ? history.size() - STATUS_HISTORY_POINTS : 0;
    view.recent_history.assign(std::make_move_iterator(history.begin() + static_cast<std::ptrdiff_t>(skip)),
                               std::make_move_iterator(history.end()));
    return view;
}

// ─────────────────────────────────────────────
// Live configuration
// ─────────────────────────────────────────────

Result<ConfigSnapshot> MonitorService::get_device_config(const DeviceId& id) {
    auto driver = registry_.driver(id);
    if (!driver) return driver.error();
    return (*driver)->config();
}

Result<UpdateOutcome> MonitorService::update_device_config(const DeviceId& id, const ConfigPatch& patch) {
    auto driver = registry_.driver(id);
    if (!driver) return driver.error();

    auto outcome = (*driver)->update_config(patch);
    if (outcome) {
        logger_.log(LogLevel::Info, "service",
                    "Applied " + std::to_string(outcome->applied) + " settings to " + id);
    } else {
        logger_.log(LogLevel::Warn, "service",
                    "Config update on " + id + " failed: " + outcome.error().message);
    }
    return outcome;
}

Result<BackupHandle> MonitorService::backup_device_config(const DeviceId& id) {
    auto driver = registry_.driver(id);
    if (!driver) return driver.error();

    auto handle = (*driver)->backup(registry_.backups());
    if (handle) {
        logger_.log(LogLevel::Info, "service", "Backed up " + id + " as " + handle->id);
    }
    return handle;
}

Result<UpdateOutcome> MonitorService::restore_device_config(const DeviceId& id, const std::string& backup_id) {
    auto driver = registry_.driver(id);
    if (!driver) return driver.error();

    auto outcome = (*driver)->restore(registry_.backups(), backup_id);
    if (outcome) {
        logger_.log(LogLevel::Info, "service", "Restored " + id + " from " + backup_id);
    } else {
        logger_.log(LogLevel::Warn, "service",
                    "Restore of " + id + " from " + backup_id + " failed: " + outcome.error().message);
    }
    return outcome;
}

Result<std::vector<BackupHandle>> MonitorService::list_backups(const DeviceId& id) const {
    if (!registry_.contains(id)) {
        return Error{ErrorCode::UnknownDevice, "Unknown device " + id};
    }
    return registry_.backups().list(id);
}

// ─────────────────────────────────────────────
// Dashboard & alerts
// ─────────────────────────────────────────────

Dashboard MonitorService::get_dashboard() const {
    return build_dashboard(metrics_.live_states(), alerts_.alerts(), clock_());
}

std::vector<Alert> MonitorService::list_alerts() const {
    return alerts_.alerts();
}

Result<Alert> MonitorService::acknowledge_alert(const std::string& alert_id) {
    return alerts_.acknowledge(alert_id, clock_());
}

Result<Alert> MonitorService::resolve_alert(const std::string& alert_id) {
    return alerts_.resolve(alert_id, clock_());
}

// ─────────────────────────────────────────────
// Inventory
// ─────────────────────────────────────────────

Result<void> MonitorService::persist() {
    auto saved = store_.save_devices(registry_.list());
    if (!saved) {
        logger_.log(LogLevel::Error, "service", "Saving inventory failed: " + saved.error().message);
    }
    return saved;
}

Result<void> MonitorService::add_device(DeviceConfig device) {
    std::lock_guard lock(inventory_mutex_);
    auto id = device.id;
    if (auto added = registry_.add(std::move(device)); !added) return added;

    if (auto saved = persist(); !saved) {
        if (auto undone = registry_.remove(id); !undone) {
            logger_.log(LogLevel::Error, "service", "Rollback of " + id + " failed: " + undone.error().message);
        }
        return saved;
    }
    logger_.log(LogLevel::Info, "service", "Added device " + id);
    return {};
}

Result<void> MonitorService::update_device(DeviceConfig device) {
    std::lock_guard lock(inventory_mutex_);
    auto previous = registry_.find(device.id);
    if (!previous) return previous.error();

    auto id = device.id;
    if (auto updated = registry_.update(std::move(device)); !updated) return updated;

    if (auto saved = persist(); !saved) {
        if (auto undone = registry_.update(std::move(*previous)); !undone) {
            logger_.log(LogLevel::Error, "service", "Rollback of " + id + " failed: " + undone.error().message);
        }
        return saved;
    }
    logger_.log(LogLevel::Info, "service", "Updated device " + id);
    return {};
}

Result<void> MonitorService::remove_device(const DeviceId& id) {
    std::lock_guard lock(inventory_mutex_);
    auto previous = registry_.find(id);
    if (!previous) return previous.error();

    if (auto removed = registry_.remove(id); !removed) return removed;

    if (auto saved = persist(); !saved) {
        if (auto undone = registry_.add(std::move(*previous)); !undone) {
            logger_.log(LogLevel::Error, "service", "Rollback of " + id + " failed: " + undone.error().message);
        }
        return saved;
    }
    metrics_.erase(id);
    logger_.log(LogLevel::Info, "service", "Removed device " + id);
    return {};
}

ServiceHealth MonitorService::health() const {
    ServiceHealth h;
    h.running = poller_.running();
    h.registered_devices = registry_.size();
    h.monitored_devices = metrics_.device_count();
    h.alerts = alerts_.size();
    h.unresolved_alerts = alerts_.unresolved_count();
    h.ticks_completed = poller_.ticks_completed();
    return h;
}

}  // namespace fleetwatch
