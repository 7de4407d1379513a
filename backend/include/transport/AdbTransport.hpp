#pragma once
#include "transport/CommandTransport.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace droidlink {

/**
 * @brief Client of a running adb server (host smart-socket protocol).
 *
 * Every request opens a fresh TCP connection to the server, as the adb
 * command line client does. `http://` identities are handed to the
 * uiautomator2 agent's shell endpoint instead.
 */
class AdbTransport : public CommandTransport, public std::enable_shared_from_this<AdbTransport> {
public:
    explicit AdbTransport(std::string server_host = "127.0.0.1", uint16_t server_port = 5037,
                          std::chrono::milliseconds io_timeout = std::chrono::seconds(10));

    std::shared_ptr<CommandClient> connect(const DeviceIdentity& id) override;

    // host:* service returning a length-prefixed string
    std::string query(const std::string& service);
    // host:* service answering OKAY with no payload
    void command(const std::string& service);
    // transport to `serial`, run `service`, read until EOF
    std::string device_service(const std::string& serial, const std::string& service);
    // transport to `serial`, run a service acknowledged by OKAY
    void device_command(const std::string& serial, const std::string& service);

    std::vector<std::pair<std::string, std::string>> devices();

    const std::string& server_host() const { return host_; }
    uint16_t server_port() const { return port_; }

private:
    std::string host_;
    uint16_t port_;
    std::chrono::milliseconds timeout_;
};

class AdbDevice : public CommandClient {
public:
    AdbDevice(std::shared_ptr<AdbTransport> transport, std::string serial);

    std::string serial() const override { return serial_; }
    std::string get_state() override;
    std::string shell(const std::string& cmd) override;
    uint16_t forward(const std::string& remote) override;
    void reverse(const std::string& remote, const std::string& local) override;
    void remove_forward(const PortMapping& mapping) override;
    std::set<std::string> list_packages() override;

private:
    std::shared_ptr<AdbTransport> transport_;
    std::string serial_;
};

} // namespace droidlink
