#pragma once
#include "device/ConnectionManager.hpp"
#include "health/HealthMonitor.hpp"

#include <nlohmann/json.hpp>

namespace droidlink {

void to_json(nlohmann::json& j, const DeviceInfo& info);
void to_json(nlohmann::json& j, const HealthSnapshot& s);
void to_json(nlohmann::json& j, const PortMapping& m);

class StatusProtocol {
public:
    StatusProtocol(ConnectionManager& connection, HealthMonitor& monitor, ConnectOptions defaults = {});

    // {"type":"device_status","device":{...},"health":{...},"healthy":bool,"forwards":[...]}
    nlohmann::json build_status_message();

    /**
     * Executes one control message and returns the reply.
     * Supported: {"cmd":"connect","address":...[,"package":...]},
     * {"cmd":"disconnect"}, {"cmd":"status"}.
     * Failures are reported in the reply, never thrown.
     */
    nlohmann::json handle_command(const nlohmann::json& msg);

private:
    nlohmann::json error_reply(const std::string& cmd, int code, const std::string& message);

    ConnectionManager& connection;
    HealthMonitor& monitor;
    ConnectOptions defaults;
};

} // namespace droidlink
