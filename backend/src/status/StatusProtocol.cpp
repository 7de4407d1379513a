#include "status/StatusProtocol.hpp"
#include "core/DeviceError.hpp"

#include <chrono>
#include <iostream>

using nlohmann::json;

namespace droidlink {

namespace {

int64_t epoch_ms(std::chrono::system_clock::time_point t) {
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count());
}

} // namespace

void to_json(json& j, const DeviceInfo& info) {
    j = {
        {"state", to_string(info.state)},
        {"is_emulator", info.is_emulator},
        {"is_network_device", info.is_network_device},
        {"is_local_network_device", info.is_local_network_device},
        {"is_over_http", info.is_over_http},
        {"device_type", info.device_type},
        {"package", info.package}
    };
    if (info.identity) {
        const auto& id = *info.identity;
        j["serial"] = id.serial;
        j["address"] = id.raw_address;
        j["transport"] = to_string(id.transport_kind);
        j["emulator_family"] = id.emulator_family ? json(to_string(*id.emulator_family)) : json(nullptr);
        j["port"] = id.port ? json(*id.port) : json(nullptr);
    } else {
        j["serial"] = nullptr;
    }
}

void to_json(json& j, const HealthSnapshot& s) {
    j = {
        {"connected", s.connected},
        {"cpu_usage_pct", s.cpu_usage_pct},
        {"mem_usage_pct", s.mem_usage_pct},
        {"battery_pct", s.battery_pct},
        {"battery_temp_c", s.battery_temp_c},
        {"network_status", to_string(s.network_status)},
        {"command_transport_status", to_string(s.command_transport_status)},
        {"ui_transport_status", to_string(s.ui_transport_status)},
        {"ts", epoch_ms(s.sampled_at)}
    };
}

void to_json(json& j, const PortMapping& m) {
    j = {
        {"direction", m.direction == ForwardDirection::Forward ? "forward" : "reverse"},
        {"local", m.local},
        {"remote", m.remote}
    };
}

StatusProtocol::StatusProtocol(ConnectionManager& conn, HealthMonitor& mon, ConnectOptions opts)
: connection(conn), monitor(mon), defaults(std::move(opts)) {}

json StatusProtocol::build_status_message() {
    auto snapshot = monitor.get_status();
    return {
        {"type", "device_status"},
        {"device", connection.get_device_info()},
        {"health", snapshot},
        {"healthy", HealthMonitor::is_healthy(snapshot, monitor.thresholds())},
        {"forwards", connection.list_forwards()}
    };
}

json StatusProtocol::error_reply(const std::string& cmd, int code, const std::string& message) {
    return {
        {"type", "reply"},
        {"cmd", cmd},
        {"ok", false},
        {"code", code},
        {"error", message}
    };
}

json StatusProtocol::handle_command(const json& msg) {
    std::string cmd;
    try {
        if (msg.is_object() && msg.contains("cmd")) cmd = msg["cmd"].get<std::string>();
        if (cmd == "status") {
            return build_status_message();
        }
        if (cmd == "connect") {
            std::string address = msg.value("address", "");
            ConnectOptions opts = defaults;
            if (msg.contains("package") && msg["package"].is_string()) opts.package = msg["package"].get<std::string>();
            connection.connect(address, opts);
            return { {"type", "reply"}, {"cmd", cmd}, {"ok", true}, {"device", connection.get_device_info()} };
        }
        if (cmd == "disconnect") {
            connection.disconnect();
            return { {"type", "reply"}, {"cmd", cmd}, {"ok", true} };
        }
    } catch (const DeviceError& e) {
        std::cerr << "StatusProtocol: " << cmd << " failed: " << e.what() << std::endl;
        return error_reply(cmd, e.code(), e.what());
    } catch (const json::exception& e) {
        return error_reply(cmd, 0, e.what());
    }
    return error_reply(cmd, 0, "unknown command '" + cmd + "'");
}

} // namespace droidlink
