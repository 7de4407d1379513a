#pragma once
#include "health/MetricParsers.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace droidlink {

class ConnectionManager;

// Value stored in a numeric field whose sample failed.
inline constexpr double kUnknownMetric = -1.0;
inline constexpr int kUnknownBattery = -1;

/**
 * @brief One sampling cycle. Replaced wholesale, never mutated after
 * publication. The default value is what get_status() returns before
 * the first tick.
 */
struct HealthSnapshot {
    bool connected = false;
    double cpu_usage_pct = 0.0;
    double mem_usage_pct = 0.0;
    int battery_pct = 0;
    double battery_temp_c = 0.0;
    LinkStatus network_status = LinkStatus::Unknown;
    LinkStatus command_transport_status = LinkStatus::Unknown;
    LinkStatus ui_transport_status = LinkStatus::Unknown;
    std::chrono::system_clock::time_point sampled_at{};
};

struct HealthThresholds {
    double max_cpu_pct = 90.0;
    double max_mem_pct = 90.0;
    int min_battery_pct = 10;
    double max_battery_temp_c = 45.0;
};

/**
 * @brief Background sampler of the active device's health.
 *
 * Holds a non-owning reference to the ConnectionManager and only uses its
 * read path. One tick runs at a time; a failed sample marks its field as
 * unknown and never ends the loop.
 */
class HealthMonitor {
public:
    explicit HealthMonitor(ConnectionManager& connection, HealthThresholds thresholds = {});
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // No-op when already running.
    void start(std::chrono::milliseconds poll_interval);
    // Returns once the loop has exited. No-op when stopped.
    void stop();
    bool running() const { return running_; }

    HealthSnapshot get_status() const;
    bool is_healthy() const;
    static bool is_healthy(const HealthSnapshot& s, const HealthThresholds& t);

    // Runs one tick on the calling thread and publishes its result.
    HealthSnapshot sample_once();

    const HealthThresholds& thresholds() const { return thresholds_; }
    uint64_t ticks() const { return ticks_; }

private:
    void run_loop(std::chrono::milliseconds poll_interval);
    HealthSnapshot sample();
    void publish(HealthSnapshot snapshot);
    bool cancelled() const { return stop_requested_; }

    ConnectionManager& connection_;
    HealthThresholds thresholds_;

    std::mutex lifecycle_mu_;   // serializes start/stop
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex wake_mu_;
    std::condition_variable wake_;

    mutable std::mutex snapshot_mu_;
    std::shared_ptr<const HealthSnapshot> snapshot_;
    std::mutex tick_mu_;        // single in-flight tick
    std::atomic<uint64_t> ticks_{0};
};

} // namespace droidlink
