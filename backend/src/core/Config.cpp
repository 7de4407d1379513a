#include "core/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

using nlohmann::json;

namespace droidlink {

namespace {

template <typename T>
void read_key(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) out = j[key].get<T>();
}

void read_set(const json& j, const char* key, std::set<std::string>& out) {
    if (!j.contains(key) || !j[key].is_array()) return;
    out.clear();
    for (const auto& v : j[key]) out.insert(v.get<std::string>());
}

// Like read_key, but a value outside [lo, hi] is reported and ignored.
void read_bounded(const json& j, const char* key, int lo, int hi, int& out) {
    if (!j.contains(key) || j[key].is_null()) return;
    int v = j[key].get<int>();
    if (v < lo || v > hi) {
        std::cerr << "Config: ignoring " << key << "=" << v << " (expected " << lo << ".." << hi << ")" << std::endl;
        return;
    }
    out = v;
}

bool is_number(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

bool DaemonConfig::valid_port(int port) {
    return port >= 1 && port <= kMaxPort;
}

ConnectOptions DaemonConfig::connect_options() const {
    ConnectOptions o;
    o.packages = packages;
    o.package = package;
    return o;
}

ConnectionPolicy DaemonConfig::connection_policy() const {
    ConnectionPolicy p;
    p.connect_retries = connect_retries;
    p.retry_delay = std::chrono::milliseconds(retry_delay_ms);
    return p;
}

void DaemonConfig::merge(const json& j) {
    read_key(j, "address", address);
    read_bounded(j, "status_port", 1, kMaxPort, status_port);
    read_bounded(j, "poll_interval_ms", 1, std::numeric_limits<int>::max(), poll_interval_ms);
    read_key(j, "adb_host", adb_host);
    read_bounded(j, "adb_port", 1, kMaxPort, adb_port);
    read_key(j, "package", package);
    read_key(j, "cloud_game", packages.cloud_game);
    read_bounded(j, "connect_retries", 0, std::numeric_limits<int>::max(), connect_retries);
    read_bounded(j, "retry_delay_ms", 0, std::numeric_limits<int>::max(), retry_delay_ms);
    read_key(j, "sim", sim);
    if (j.contains("packages") && j["packages"].is_object()) {
        read_set(j["packages"], "known", packages.known);
        read_set(j["packages"], "cloud", packages.cloud);
    }
    if (j.contains("health") && j["health"].is_object()) {
        const auto& h = j["health"];
        read_key(h, "max_cpu_pct", health.max_cpu_pct);
        read_key(h, "max_mem_pct", health.max_mem_pct);
        read_key(h, "min_battery_pct", health.min_battery_pct);
        read_key(h, "max_battery_temp_c", health.max_battery_temp_c);
    }
}

json DaemonConfig::to_json() const {
    json j;
    j["address"] = address;
    j["status_port"] = status_port;
    j["poll_interval_ms"] = poll_interval_ms;
    j["adb_host"] = adb_host;
    j["adb_port"] = adb_port;
    j["package"] = package;
    j["packages"] = { {"known", packages.known}, {"cloud", packages.cloud} };
    j["cloud_game"] = packages.cloud_game;
    j["health"] = {
        {"max_cpu_pct", health.max_cpu_pct},
        {"max_mem_pct", health.max_mem_pct},
        {"min_battery_pct", health.min_battery_pct},
        {"max_battery_temp_c", health.max_battery_temp_c}
    };
    j["connect_retries"] = connect_retries;
    j["retry_delay_ms"] = retry_delay_ms;
    j["sim"] = sim;
    return j;
}

DaemonConfig DaemonConfig::load(const std::string& path) {
    DaemonConfig cfg;

    std::string file = path;
    if (file.empty()) {
        const char* env = std::getenv("DROIDLINK_CONFIG");
        if (env && *env) file = env;
    }
    if (!file.empty()) {
        std::ifstream f(file);
        if (!f) {
            std::cerr << "Config: unable to open " << file << ", using defaults" << std::endl;
        } else {
            try {
                cfg.merge(json::parse(f));
                std::cout << "Config: loaded " << file << std::endl;
            } catch (const json::exception& e) {
                std::cerr << "Config: failed to parse " << file << ": " << e.what() << std::endl;
                cfg = DaemonConfig();
            }
        }
    }

    const char* adb_port = std::getenv("ANDROID_ADB_SERVER_PORT");
    if (adb_port && *adb_port) {
        int port = 0;
        bool ok = false;
        if (is_number(adb_port)) {
            try {
                port = std::stoi(adb_port);
                ok = valid_port(port);
            } catch (const std::exception&) {
                ok = false;
            }
        }
        if (ok) cfg.adb_port = port;
        else std::cerr << "Config: ignoring ANDROID_ADB_SERVER_PORT=" << adb_port << std::endl;
    }
    return cfg;
}

} // namespace droidlink
