#include "health/MetricParsers.hpp"

#include <regex>

namespace droidlink {

namespace {

std::optional<double> search_number(const std::string& text, const std::regex& re) {
    std::smatch m;
    if (!std::regex_search(text, m, re)) return std::nullopt;
    try {
        return std::stod(m[1].str());
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

double clamp_pct(double v) {
    if (v < 0.0) return 0.0;
    if (v > 100.0) return 100.0;
    return v;
}

} // namespace

std::string to_string(LinkStatus status) {
    switch (status) {
        case LinkStatus::Unknown: return "unknown";
        case LinkStatus::Connected: return "connected";
        case LinkStatus::Disconnected: return "disconnected";
    }
    return "unknown";
}

std::optional<double> parse_cpu_usage(const std::string& top_output) {
    static const std::regex total_re(R"((\d+(?:\.\d+)?)%cpu)");
    static const std::regex idle_re(R"((\d+(?:\.\d+)?)%idle)");
    static const std::regex user_re(R"(User (\d+(?:\.\d+)?)%)");
    static const std::regex system_re(R"(System (\d+(?:\.\d+)?)%)");
    static const std::regex any_re(R"((\d+(?:\.\d+)?)%)");

    auto total = search_number(top_output, total_re);
    auto idle = search_number(top_output, idle_re);
    if (total && idle && *total > 0.0) {
        return clamp_pct((*total - *idle) / *total * 100.0);
    }

    auto user = search_number(top_output, user_re);
    auto system = search_number(top_output, system_re);
    if (user || system) {
        return clamp_pct(user.value_or(0.0) + system.value_or(0.0));
    }

    auto first = search_number(top_output, any_re);
    if (first) return clamp_pct(*first);
    return std::nullopt;
}

std::optional<double> parse_memory_usage(const std::string& meminfo) {
    static const std::regex total_re(R"(MemTotal:\s+(\d+))");
    static const std::regex available_re(R"(MemAvailable:\s+(\d+))");
    static const std::regex free_re(R"(MemFree:\s+(\d+))");

    auto total = search_number(meminfo, total_re);
    if (!total || *total <= 0.0) return std::nullopt;
    auto available = search_number(meminfo, available_re);
    if (!available) available = search_number(meminfo, free_re);
    if (!available) return std::nullopt;
    return clamp_pct((*total - *available) / *total * 100.0);
}

BatteryReading parse_battery(const std::string& dumpsys_battery) {
    static const std::regex level_re(R"(level:\s*(\d+))");
    static const std::regex temp_re(R"(temperature:\s*(-?\d+))");

    BatteryReading r;
    if (auto level = search_number(dumpsys_battery, level_re)) r.level_pct = static_cast<int>(*level);
    if (auto temp = search_number(dumpsys_battery, temp_re)) r.temperature_c = *temp / 10.0;
    return r;
}

LinkStatus parse_network_status(const std::string& dumpsys_connectivity) {
    static const std::regex connected_re(R"(\bCONNECTED\b)");
    static const std::regex disconnected_re(R"(\bDISCONNECTED\b)");

    if (std::regex_search(dumpsys_connectivity, connected_re)) return LinkStatus::Connected;
    if (std::regex_search(dumpsys_connectivity, disconnected_re)) return LinkStatus::Disconnected;
    return LinkStatus::Unknown;
}

} // namespace droidlink
