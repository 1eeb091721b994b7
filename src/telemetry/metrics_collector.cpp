/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include "alerting/alert_engine.hpp"

#include <chrono>
#include <sstream>

namespace fleetwatch {

namespace {

int64_t epoch_ms(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

}  // namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_poll_tick(size_t devices_polled, size_t reachable, Duration elapsed) {
    std::ostringstream oss;
    oss << R"({"event":"poll_tick")"
        << R"(,"devices":)" << devices_polled
        << R"(,"reachable":)" << reachable
        << R"(,"duration_ms":)" << elapsed.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_alert(const Alert& alert) {
    std::ostringstream oss;
    oss << R"({"event":"alert_raised")"
        << R"(,"id":")" << json_escape(alert.id) << "\""
        << R"(,"device":")" << json_escape(alert.device_id) << "\""
        << R"(,"rule":")" << alert.rule_name << "\""
        << R"(,"severity":")" << to_string(alert.severity) << "\""
        << R"(,"ts_ms":)" << epoch_ms(alert.raised_at)
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_gc_pass(size_t removed, size_t remaining) {
    std::ostringstream oss;
    oss << R"({"event":"gc_pass")"
        << R"(,"removed":)" << removed
        << R"(,"remaining":)" << remaining
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_discovery(std::string_view cidr, size_t hosts,
                                        size_t candidates, Duration elapsed) {
    std::ostringstream oss;
    oss << R"({"event":"discovery_complete")"
        << R"(,"cidr":")" << json_escape(cidr) << "\""
        << R"(,"hosts":)" << hosts
        << R"(,"candidates":)" << candidates
        << R"(,"duration_ms":)" << elapsed.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << json_escape(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
    events_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace fleetwatch
