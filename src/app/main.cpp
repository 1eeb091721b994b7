/**
 * @file main.cpp
 * @brief FleetWatch daemon entry point.
 *
 * Wires all modules into a running monitor:
 *   Config → Logger → ProtocolClient → DeviceStore → MonitorService (Registry, Poller, Alerts) → Telemetry
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "device/oids.hpp"
#include "protocol/mock_client.hpp"
#include "protocol/socket_client.hpp"
#include "registry/device_store.hpp"
#include "service/monitor_service.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace fleetwatch;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║             FleetWatch v1.0.0             ║
  ║   Network Device Fleet Monitor            ║
  ║   Access Points & Switches                ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path inventory_path;
    std::string log_dir;
    std::string discover_cidr;
    bool demo_mode = false;
};

void print_usage() {
    std::cout << "Usage: fleetwatch [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --inventory <path>   Device inventory TOML (overrides [service].inventory_path)\n"
              << "  --log-dir <path>     Log output directory\n"
              << "  --discover <cidr>    Scan a range, print candidates, then exit\n"
              << "  --demo               Run one monitoring cycle against a simulated fleet, then exit\n"
              << "  --help, -h           Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--inventory" && i + 1 < argc) {
            args.inventory_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--discover" && i + 1 < argc) {
            args.discover_cidr = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

std::string format_percent(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", value);
    return buf;
}

/**
 * @brief Script a simulated agent for every inventory device.
 */
void seed_demo_fleet(MockProtocolClient& client, const std::vector<DeviceConfig>& devices,
                     const DriverConfig& driver) {
    int64_t step = 0;
    for (const auto& device : devices) {
        const auto& ip = device.address;
        client.open_port(ip, driver.management_port);
        client.set_community(ip, device.credentials.snmp_community);
        client.set_value(ip, oids::SYS_NAME, SnmpValue::string(device.id));
        client.set_value(ip, oids::SYS_LOCATION, SnmpValue::string(device.location));
        client.set_value(ip, oids::SYS_UPTIME, SnmpValue::ticks(8'640'000 + step * 360'000));
        client.set_ssh_output(ip, "Configuration applied\n");

        if (device.family == DeviceFamily::AccessPoint) {
            client.set_value(ip, oids::SYS_DESCR, SnmpValue::string("ArubaOS (MODEL: 505), Version 8.10.0.6 AP"));
            client.set_value(ip, oids::ARUBA_CPU_PERCENT, SnmpValue::gauge(15 + step * 4));
            client.set_value(ip, oids::ARUBA_MEM_PERCENT, SnmpValue::gauge(45 + step * 3));
            client.set_value(ip, oids::ARUBA_CLIENT_COUNT, SnmpValue::gauge(step == 0 ? 12 : 0));

            auto ssid = [&](int index) { return "." + std::to_string(index); };
            client.set_value(ip, std::string(oids::ARUBA_ESSID_NAME) + ssid(1), SnmpValue::string("Corporate"));
            client.set_value(ip, std::string(oids::ARUBA_ESSID_STATUS) + ssid(1), SnmpValue::integer(1));
            client.set_value(ip, std::string(oids::ARUBA_ESSID_CLIENTS) + ssid(1), SnmpValue::gauge(step == 0 ? 12 : 0));
            client.set_value(ip, std::string(oids::ARUBA_ESSID_BAND) + ssid(1), SnmpValue::string("5GHz"));

            client.set_value(ip, std::string(oids::ARUBA_RADIO_BAND) + ".1", SnmpValue::string("2.4GHz"));
            client.set_value(ip, std::string(oids::ARUBA_RADIO_ENABLED) + ".1", SnmpValue::integer(1));
            client.set_value(ip, std::string(oids::ARUBA_RADIO_CHANNEL) + ".1", SnmpValue::integer(6));
            client.set_value(ip, std::string(oids::ARUBA_RADIO_POWER) + ".1", SnmpValue::integer(18));
            client.set_value(ip, std::string(oids::ARUBA_RADIO_BAND) + ".2", SnmpValue::string("5GHz"));
            client.set_value(ip, std::string(oids::ARUBA_RADIO_ENABLED) + ".2", SnmpValue::integer(1));
            client.set_value(ip, std::string(oids::ARUBA_RADIO_CHANNEL) + ".2", SnmpValue::integer(36));
            client.set_value(ip, std::string(oids::ARUBA_RADIO_POWER) + ".2", SnmpValue::integer(20));
        } else {
            client.set_value(ip, oids::SYS_DESCR, SnmpValue::string("3Com Baseline Switch 2928-SFP Plus, Comware Software"));
            client.set_value(ip, oids::COMWARE_CPU_PERCENT, SnmpValue::gauge(8));
            client.set_value(ip, oids::COMWARE_MEM_PERCENT, SnmpValue::gauge(35));
            client.set_value(ip, oids::COMWARE_TEMPERATURE, SnmpValue::integer(42));
            for (int port = 1; port <= 4; ++port) {
                auto idx = "." + std::to_string(port);
                client.set_value(ip, std::string(oids::IF_DESCR) + idx,
                                 SnmpValue::string("GigabitEthernet1/0/" + std::to_string(port)));
                client.set_value(ip, std::string(oids::IF_TYPE) + idx, SnmpValue::integer(oids::IF_TYPE_ETHERNET));
                client.set_value(ip, std::string(oids::IF_SPEED) + idx, SnmpValue::gauge(1'000'000'000));
                client.set_value(ip, std::string(oids::IF_OPER_STATUS) + idx, SnmpValue::integer(port == 4 ? 2 : 1));
                client.set_value(ip, std::string(oids::DOT1Q_PVID) + idx, SnmpValue::gauge(1));
            }
            client.set_value(ip, std::string(oids::DOT1Q_VLAN_NAME) + ".1", SnmpValue::string("default"));
        }
        ++step;
    }
}

/**
 * @brief Run one collection + alert pass against a simulated fleet and
 *        print the resulting dashboard.
 */
int run_demo(const Config& config, Logger& logger) {
    logger.info("=== Demo Mode ===");

    auto devices = default_inventory();
    MockProtocolClient client;
    seed_demo_fleet(client, devices, config.driver);

    InMemoryDeviceStore store(devices);
    MetricsCollector telemetry(std::make_unique<NullSink>());
    MonitorService service(config, client, store, logger, &telemetry);
    if (auto loaded = service.load(); !loaded) {
        logger.error("Loading demo inventory failed: " + loaded.error().message);
        return 1;
    }

    auto now = std::chrono::system_clock::now();
    auto stats = service.poller().collect_once(now);
    auto raised = service.poller().evaluate_alerts_once(now);
    logger.info("Polled " + std::to_string(stats.polled) + " devices, "
                + std::to_string(stats.reachable) + " reachable, "
                + std::to_string(raised.size()) + " alerts raised");

    auto dash = service.get_dashboard();
    std::cout << "Devices:  " << dash.total_devices << " total, " << dash.online_devices
              << " online, " << dash.offline_devices << " offline\n"
              << "CPU avg:  " << format_percent(dash.average_cpu) << "\n"
              << "Mem avg:  " << format_percent(dash.average_memory) << "\n"
              << "Clients:  " << dash.total_wireless_clients << "\n";
    for (const auto& [label, count] : dash.device_types) {
        std::cout << "  " << label << ": " << count << "\n";
    }
    std::cout << "Alerts:   " << dash.total_alerts << " (" << dash.unresolved_alerts << " unresolved)\n";
    for (const auto& alert : dash.recent_alerts) {
        std::cout << "  [" << to_string(alert.severity) << "] " << alert.device_id << ": "
                  << alert.message << "\n";
    }

    logger.info("=== Demo Complete ===");
    return 0;
}

int run_discovery(const Config& config, const std::string& cidr, Logger& logger) {
    SocketProtocolClient client;
    InMemoryDeviceStore store;
    MonitorService service(config, client, store, logger);

    auto candidates = service.discover_devices(cidr);
    if (!candidates) {
        std::cerr << "Discovery failed: " << candidates.error().message << std::endl;
        return 1;
    }
    for (const auto& c : *candidates) {
        std::cout << c.address << "  port " << c.open_port << "  "
                  << (c.family ? std::string(display_label(*c.family)) : std::string("unclassified"))
                  << "  " << (c.sys_name.empty() ? "-" : c.sys_name)
                  << "  " << (c.sys_descr.empty() ? "-" : c.sys_descr) << "\n";
    }
    std::cout << candidates->size() << " device(s) found in " << cidr << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.inventory_path.empty()) config.service.inventory_path = args.inventory_path;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    const uint64_t max_bytes = static_cast<uint64_t>(config.telemetry.max_file_size_mb) * 1024 * 1024;

    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty() && !args.demo_mode) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, config.service.name,
                                                  max_bytes, config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), level);
    logger.info(config.service.name + " starting...");

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── One-shot modes ───────────────────────
    if (args.demo_mode) {
        return run_demo(config, logger);
    }
    if (!args.discover_cidr.empty()) {
        return run_discovery(config, args.discover_cidr, logger);
    }

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> telemetry_sink;
    if (!config.telemetry.log_dir.empty()) {
        telemetry_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir,
                                                        config.service.name + "_events",
                                                        max_bytes, config.telemetry.rotate_count);
    } else {
        telemetry_sink = std::make_unique<NullSink>();
    }
    MetricsCollector telemetry(std::move(telemetry_sink));

    // ── Initialize Service ───────────────────
    SocketProtocolClient client;
    TomlDeviceStore store(config.service.inventory_path);
    MonitorService service(config, client, store, logger, &telemetry);

    if (auto loaded = service.load(); !loaded) {
        logger.error("Cannot load inventory " + config.service.inventory_path.string()
                     + ": " + loaded.error().message);
        return 1;
    }
    service.start();

    // ── Main Loop ────────────────────────────
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status line (every 60 seconds at 100ms intervals)
        if (loop_count % 600 == 0 && loop_count > 0) {
            auto health = service.health();
            auto dash = service.get_dashboard();
            logger.info("Status: " + std::to_string(dash.online_devices) + "/"
                        + std::to_string(health.registered_devices) + " online, cpu avg "
                        + format_percent(dash.average_cpu) + ", "
                        + std::to_string(health.unresolved_alerts) + " unresolved alerts");
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    service.stop();
    telemetry.flush();
    logger.info(config.service.name + " stopped.");
    logger.flush();
    return 0;
}
