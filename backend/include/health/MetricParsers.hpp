#pragma once
#include <optional>
#include <string>

namespace droidlink {

enum class LinkStatus {
    Unknown,
    Connected,
    Disconnected
};

std::string to_string(LinkStatus status);

// Shell commands whose output the parsers below understand.
namespace metric_commands {
inline constexpr const char* kCpu = "top -n 1 | head -n 8";
inline constexpr const char* kMemory = "cat /proc/meminfo";
inline constexpr const char* kBattery = "dumpsys battery";
inline constexpr const char* kNetwork = "dumpsys connectivity";
} // namespace metric_commands

/**
 * @brief Total CPU usage in percent from `top` output.
 *
 * Understands the toybox header ("800%cpu ... 700%idle"), the older
 * "User 5%, System 3%" summary, and otherwise takes the first "N%" figure.
 */
std::optional<double> parse_cpu_usage(const std::string& top_output);

// (MemTotal - MemAvailable) / MemTotal, MemFree when MemAvailable is absent.
std::optional<double> parse_memory_usage(const std::string& meminfo);

struct BatteryReading {
    std::optional<int> level_pct;
    std::optional<double> temperature_c;  // dumpsys reports tenths of a degree
};

BatteryReading parse_battery(const std::string& dumpsys_battery);

LinkStatus parse_network_status(const std::string& dumpsys_connectivity);

} // namespace droidlink
