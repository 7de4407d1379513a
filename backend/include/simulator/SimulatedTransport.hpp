#pragma once
#include "transport/CommandTransport.hpp"
#include "transport/UiTransport.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace droidlink {

/**
 * @brief In-process stand-in for the adb server and the on-device agent.
 *
 * Implements both transport contracts so one instance can back a
 * ConnectionManager. Devices, shell replies and failures are scripted;
 * every call that touches a device is appended to an event log.
 */
class SimulatedTransport : public CommandTransport,
                           public UiTransport,
                           public std::enable_shared_from_this<SimulatedTransport> {
public:
    // seed 0 seeds from the clock
    explicit SimulatedTransport(uint64_t seed = 0);

    std::shared_ptr<CommandClient> connect(const DeviceIdentity& id) override;
    std::shared_ptr<UiClient> connect(const DeviceIdentity& id, const UiEndpoint& endpoint) override;

    // ---- scripting ----
    void add_device(const std::string& serial, std::set<std::string> packages = {});
    void set_reachable(const std::string& serial, bool reachable);
    void set_shell_response(const std::string& cmd, const std::string& output);
    void fail_shell(const std::string& cmd, bool fail = true);
    void fail_remove_forward(bool fail) { std::lock_guard<std::mutex> lk(mu_); fail_remove_ = fail; }
    void set_ui_available(bool available) { std::lock_guard<std::mutex> lk(mu_); ui_available_ = available; }

    // ---- introspection ----
    std::vector<std::string> events() const;
    // Number of events starting with `prefix`.
    size_t count(const std::string& prefix) const;
    std::vector<PortMapping> live_mappings() const;
    std::string current_app(const std::string& serial) const;

private:
    friend class SimulatedCommandClient;
    friend class SimulatedUiClient;

    struct DeviceState {
        bool reachable = true;
        std::set<std::string> packages;
        std::string current_app;
    };

    void record(const std::string& event);
    DeviceState& require_device(const std::string& serial);
    std::string run_shell(const std::string& serial, const std::string& cmd);
    std::string default_response(const std::string& serial, const std::string& cmd);
    uint16_t add_forward(const std::string& serial, const std::string& remote);
    void add_reverse(const std::string& serial, const std::string& remote, const std::string& local);
    void remove_mapping(const std::string& serial, const PortMapping& mapping);
    void require_ui();

    mutable std::mutex mu_;
    std::mt19937_64 rng_;
    std::map<std::string, DeviceState> devices_;
    std::map<std::string, std::string> shell_responses_;
    std::set<std::string> failing_shell_;
    std::map<std::string, std::vector<PortMapping>> mappings_;
    std::vector<std::string> events_;
    uint16_t next_forward_port_ = 10000;
    bool ui_available_ = true;
    bool fail_remove_ = false;
};

class SimulatedCommandClient : public CommandClient {
public:
    SimulatedCommandClient(std::shared_ptr<SimulatedTransport> sim, std::string serial);

    std::string serial() const override { return serial_; }
    std::string get_state() override;
    std::string shell(const std::string& cmd) override;
    uint16_t forward(const std::string& remote) override;
    void reverse(const std::string& remote, const std::string& local) override;
    void remove_forward(const PortMapping& mapping) override;
    std::set<std::string> list_packages() override;

private:
    std::shared_ptr<SimulatedTransport> sim_;
    std::string serial_;
};

class SimulatedUiClient : public UiClient {
public:
    SimulatedUiClient(std::shared_ptr<SimulatedTransport> sim, std::string serial);

    bool ping() override;
    std::string dump_hierarchy() override;
    void app_start(const std::string& package) override;
    void app_stop(const std::string& package) override;
    std::string app_current() override;
    void click(int x, int y) override;

private:
    std::shared_ptr<SimulatedTransport> sim_;
    std::string serial_;
};

} // namespace droidlink
