#pragma once
#include "core/DeviceError.hpp"
#include "device/DeviceIdentity.hpp"
#include "device/PortForwardTable.hpp"
#include "device/ResourceRegistry.hpp"
#include "transport/CommandTransport.hpp"
#include "transport/UiTransport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace droidlink {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting
};

std::string to_string(ConnectionState state);

/** @brief Package names supplied by configuration, consumed read-only. */
struct PackageConfig {
    std::set<std::string> known;
    std::set<std::string> cloud;
    bool cloud_game = false;
};

struct ConnectOptions {
    PackageConfig packages;
    // "auto" runs detect_package() after connecting; anything else is used as is.
    std::string package = "auto";
};

// No retry by default: one attempt per candidate port.
struct ConnectionPolicy {
    int connect_retries = 0;
    std::chrono::milliseconds retry_delay{0};
};

struct DeviceInfo {
    std::optional<DeviceIdentity> identity;
    ConnectionState state = ConnectionState::Disconnected;
    bool is_emulator = false;
    bool is_network_device = false;
    bool is_local_network_device = false;
    bool is_over_http = false;
    std::string device_type;
    std::string package;
};

/**
 * @brief Owns the single active device session.
 *
 * connect() tears down any existing session before setting up the new one;
 * callers never observe two sessions or the transient Connecting/Disconnecting
 * states. All session-mutating calls serialize on one mutex. Transport
 * handles are created lazily and dropped on disconnect.
 */
class ConnectionManager {
public:
    ConnectionManager(std::shared_ptr<CommandTransport> command_transport,
                      std::shared_ptr<UiTransport> ui_transport,
                      ConnectionPolicy policy = {});
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Connect to `address`, replacing any current session.
     * @throws ConnectError (InvalidAddress, TransportUnreachable, NoPortFound)
     */
    void connect(const std::string& address, const ConnectOptions& options = {});

    /** @brief Release every session resource. No-op when already disconnected. */
    void disconnect();

    ConnectionState state() const;
    bool connected() const { return state() == ConnectionState::Connected; }
    DeviceInfo get_device_info() const;
    // Incremented on every successful connect.
    uint64_t session_generation() const;

    std::shared_ptr<CommandClient> command_client();
    std::shared_ptr<UiClient> ui_client();
    // The UI handle if one was already created; never creates it.
    std::shared_ptr<UiClient> cached_ui_client() const;

    /**
     * @brief Restart the on-device agent and replace the cached UI handle.
     * The agent of an http device cannot be restarted from here; only the
     * handle is replaced.
     */
    std::shared_ptr<UiClient> restart_ui_agent();

    uint16_t forward(const std::string& remote);
    void reverse(const std::string& remote, const std::string& local);
    std::vector<PortMapping> list_forwards() const;

    ResourceId register_resource(std::string name, std::function<void()> release);
    void release_resource(ResourceId id);

    std::set<std::string> list_packages();
    std::optional<std::string> detect_package(const PackageConfig& packages);

    std::string shell(const std::string& cmd);
    std::string getprop(const std::string& name);

    std::string package() const;
    void set_package(const std::string& package);
    std::string app_current();
    bool app_is_running();
    void app_start();
    void app_stop();
    std::string dump_hierarchy();
    void click(int x, int y);

private:
    struct Session {
        DeviceIdentity identity;
        std::shared_ptr<CommandClient> command;
        std::shared_ptr<UiClient> ui;
        ResourceRegistry resources;
        std::unique_ptr<PortForwardTable> forwards;
        std::string package;
    };

    std::shared_ptr<CommandClient> open_command(const DeviceIdentity& id);
    std::shared_ptr<CommandClient> open_with_retries(const DeviceIdentity& id);
    void teardown_locked();
    Session& require_session_locked();
    UiEndpoint ui_endpoint_locked(Session& s);
    std::shared_ptr<UiClient> ui_client_locked();
    std::optional<std::string> detect_package_locked(Session& s, const PackageConfig& packages);

    std::shared_ptr<CommandTransport> command_transport_;
    std::shared_ptr<UiTransport> ui_transport_;
    ConnectionPolicy policy_;

    mutable std::mutex mu_;
    std::unique_ptr<Session> session_;
    ConnectionState state_ = ConnectionState::Disconnected;
    uint64_t generation_ = 0;
};

} // namespace droidlink
