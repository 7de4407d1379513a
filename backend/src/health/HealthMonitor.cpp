/*
src/health/HealthMonitor.cpp
Periodic device health sampling on a background thread. Every sub-sample
is independent: a failure sets that field to its unknown value and the
tick carries on.
*/
#include "health/HealthMonitor.hpp"
#include "device/ConnectionManager.hpp"
#include "core/DeviceError.hpp"

#include <iostream>

namespace droidlink {

namespace {

constexpr std::chrono::milliseconds kFallbackInterval{1000};

void log_sample_failure(const char* what, const std::exception& e) {
    std::cerr << "HealthMonitor: " << what << " sample failed: " << e.what() << std::endl;
}

HealthSnapshot disconnected_snapshot() {
    HealthSnapshot s;
    s.connected = false;
    s.cpu_usage_pct = kUnknownMetric;
    s.mem_usage_pct = kUnknownMetric;
    s.battery_pct = kUnknownBattery;
    s.battery_temp_c = kUnknownMetric;
    s.command_transport_status = LinkStatus::Disconnected;
    s.ui_transport_status = LinkStatus::Disconnected;
    s.sampled_at = std::chrono::system_clock::now();
    return s;
}

} // namespace

HealthMonitor::HealthMonitor(ConnectionManager& connection, HealthThresholds thresholds)
: connection_(connection),
  thresholds_(thresholds),
  snapshot_(std::make_shared<const HealthSnapshot>()) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start(std::chrono::milliseconds poll_interval) {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (running_) return;
    if (poll_interval.count() <= 0) {
        std::cerr << "HealthMonitor: interval " << poll_interval.count() << " ms is not positive, using "
                  << kFallbackInterval.count() << " ms" << std::endl;
        poll_interval = kFallbackInterval;
    }
    if (worker_.joinable()) worker_.join();
    stop_requested_ = false;
    running_ = true;
    worker_ = std::thread([this, poll_interval]() { run_loop(poll_interval); });
    std::cout << "HealthMonitor: started, interval " << poll_interval.count() << " ms" << std::endl;
}

void HealthMonitor::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (!running_ && !worker_.joinable()) return;
    {
        std::lock_guard<std::mutex> wl(wake_mu_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
    running_ = false;
    std::cout << "HealthMonitor: stopped after " << ticks_ << " ticks" << std::endl;
}

void HealthMonitor::run_loop(std::chrono::milliseconds poll_interval) {
    while (!cancelled()) {
        {
            std::lock_guard<std::mutex> tick(tick_mu_);
            HealthSnapshot s = sample();
            // a tick interrupted by stop() is dropped
            if (!cancelled()) publish(s);
        }
        std::unique_lock<std::mutex> lk(wake_mu_);
        wake_.wait_for(lk, poll_interval, [this]() { return stop_requested_.load(); });
    }
}

HealthSnapshot HealthMonitor::sample_once() {
    std::lock_guard<std::mutex> tick(tick_mu_);
    HealthSnapshot s = sample();
    publish(s);
    return s;
}

HealthSnapshot HealthMonitor::sample() {
    if (!connection_.connected()) return disconnected_snapshot();

    std::shared_ptr<CommandClient> command;
    try {
        command = connection_.command_client();
    } catch (const NotConnectedError&) {
        return disconnected_snapshot();
    }

    HealthSnapshot s;
    s.connected = true;
    s.cpu_usage_pct = kUnknownMetric;
    s.mem_usage_pct = kUnknownMetric;
    s.battery_pct = kUnknownBattery;
    s.battery_temp_c = kUnknownMetric;

    try {
        s.command_transport_status = command->get_state() == "device" ? LinkStatus::Connected : LinkStatus::Disconnected;
    } catch (const std::exception& e) {
        log_sample_failure("transport state", e);
        s.command_transport_status = LinkStatus::Disconnected;
    }
    if (cancelled()) return s;

    try {
        auto cpu = parse_cpu_usage(command->shell(metric_commands::kCpu));
        if (cpu) s.cpu_usage_pct = *cpu;
    } catch (const std::exception& e) {
        log_sample_failure("cpu", e);
    }
    if (cancelled()) return s;

    try {
        auto mem = parse_memory_usage(command->shell(metric_commands::kMemory));
        if (mem) s.mem_usage_pct = *mem;
    } catch (const std::exception& e) {
        log_sample_failure("memory", e);
    }
    if (cancelled()) return s;

    try {
        auto battery = parse_battery(command->shell(metric_commands::kBattery));
        if (battery.level_pct) s.battery_pct = *battery.level_pct;
        if (battery.temperature_c) s.battery_temp_c = *battery.temperature_c;
    } catch (const std::exception& e) {
        log_sample_failure("battery", e);
    }
    if (cancelled()) return s;

    try {
        s.network_status = parse_network_status(command->shell(metric_commands::kNetwork));
    } catch (const std::exception& e) {
        log_sample_failure("network", e);
    }
    if (cancelled()) return s;

    // only an existing UI handle is checked; creating one is left to callers
    if (auto ui = connection_.cached_ui_client()) {
        try {
            s.ui_transport_status = ui->ping() ? LinkStatus::Connected : LinkStatus::Disconnected;
        } catch (const std::exception& e) {
            log_sample_failure("ui ping", e);
            s.ui_transport_status = LinkStatus::Disconnected;
        }
    }

    s.sampled_at = std::chrono::system_clock::now();
    return s;
}

void HealthMonitor::publish(HealthSnapshot snapshot) {
    auto next = std::make_shared<const HealthSnapshot>(std::move(snapshot));
    {
        std::lock_guard<std::mutex> lk(snapshot_mu_);
        snapshot_ = std::move(next);
    }
    ++ticks_;
}

HealthSnapshot HealthMonitor::get_status() const {
    std::shared_ptr<const HealthSnapshot> current;
    {
        std::lock_guard<std::mutex> lk(snapshot_mu_);
        current = snapshot_;
    }
    return *current;
}

bool HealthMonitor::is_healthy() const {
    return is_healthy(get_status(), thresholds_);
}

bool HealthMonitor::is_healthy(const HealthSnapshot& s, const HealthThresholds& t) {
    if (!s.connected) return false;
    if (s.cpu_usage_pct < 0.0 || s.cpu_usage_pct >= t.max_cpu_pct) return false;
    if (s.mem_usage_pct < 0.0 || s.mem_usage_pct >= t.max_mem_pct) return false;
    if (s.battery_pct < 0 || s.battery_pct <= t.min_battery_pct) return false;
    if (s.battery_temp_c == kUnknownMetric || s.battery_temp_c >= t.max_battery_temp_c) return false;
    return true;
}

} // namespace droidlink
