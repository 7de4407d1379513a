#pragma once
#include "device/ConnectionManager.hpp"
#include "health/HealthMonitor.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace droidlink {

struct DaemonConfig {
    static constexpr int kMaxPort = 65535;

    std::string address;                 // empty: wait for a connect command
    int status_port = 9002;
    int poll_interval_ms = 5000;
    std::string adb_host = "127.0.0.1";
    int adb_port = 5037;
    std::string package = "auto";
    PackageConfig packages;
    HealthThresholds health;
    int connect_retries = 0;
    int retry_delay_ms = 0;
    bool sim = false;

    ConnectOptions connect_options() const;
    ConnectionPolicy connection_policy() const;

    static bool valid_port(int port);

    // Keys missing from `j` keep their current value; out-of-range numbers
    // (ports outside 1..65535, a non-positive poll interval, negative retry
    // settings) are logged and ignored.
    void merge(const nlohmann::json& j);
    nlohmann::json to_json() const;

    /**
     * @brief Defaults, then the file named by `path` (or $DROIDLINK_CONFIG
     * when `path` is empty), then $ANDROID_ADB_SERVER_PORT.
     * An unreadable or malformed file is reported and skipped.
     */
    static DaemonConfig load(const std::string& path = "");
};

} // namespace droidlink
