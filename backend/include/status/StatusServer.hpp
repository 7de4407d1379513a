#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

namespace droidlink {

class StatusProtocol;

/**
 * @brief WebSocket surface of the daemon.
 *
 * Broadcasts a device_status message to every client each interval and
 * answers control messages on the connection they arrived on.
 */
class StatusServer {
public:
    StatusServer(int port, StatusProtocol& protocol,
                 std::chrono::milliseconds broadcast_interval = std::chrono::milliseconds(1000));
    ~StatusServer();

    void start();
    void stop();
    // Control message from websocket or stdin; returns the reply.
    nlohmann::json handle_control(const nlohmann::json& msg);

    int port() const { return port_; }

private:
    struct Impl;

    void run_event_loop();
    void broadcast_status_loop();

    int port_;
    std::chrono::milliseconds interval_;
    std::atomic<bool> running;
    std::thread event_thread;
    std::thread broadcast_thread;

    StatusProtocol& protocol;
    std::shared_ptr<Impl> impl;
};

} // namespace droidlink
