#pragma once
#include "transport/CommandTransport.hpp"
#include "transport/UiTransport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace droidlink {

// HTTP plumbing shared by the agent clients.
struct HttpResult {
    long code = 0;
    std::string body;
    std::string error;

    bool ok() const { return error.empty() && code >= 200 && code < 300; }
};

class AgentHttp {
public:
    AgentHttp(const UiEndpoint& endpoint, std::chrono::milliseconds timeout);

    HttpResult get(const std::string& path) const;
    HttpResult post_json(const std::string& path, const std::string& payload) const;
    std::string escape(const std::string& text) const;

    std::string base_url() const { return base_; }

private:
    std::string base_;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Shell-only command handle for `http://` devices.
 *
 * Talks to the agent's /shell endpoint. Port redirections do not exist over
 * http: forward() and reverse() throw TransportError.
 */
class AtxShellClient : public CommandClient {
public:
    AtxShellClient(std::string serial, const UiEndpoint& agent,
                   std::chrono::milliseconds timeout = std::chrono::seconds(60));

    std::string serial() const override { return serial_; }
    std::string get_state() override;
    std::string shell(const std::string& cmd) override;
    uint16_t forward(const std::string& remote) override;
    void reverse(const std::string& remote, const std::string& local) override;
    void remove_forward(const PortMapping& mapping) override;
    std::set<std::string> list_packages() override;

private:
    std::string serial_;
    AgentHttp http_;
};

/**
 * @brief uiautomator2 agent client: JSON-RPC for the UI, agent shell for
 * launching and stopping apps.
 */
class UiAutomatorClient : public UiClient {
public:
    UiAutomatorClient(const UiEndpoint& endpoint, std::chrono::milliseconds timeout);

    bool ping() override;
    std::string dump_hierarchy() override;
    void app_start(const std::string& package) override;
    void app_stop(const std::string& package) override;
    std::string app_current() override;
    void click(int x, int y) override;

private:
    std::string shell(const std::string& cmd);
    nlohmann::json jsonrpc(const std::string& method, const nlohmann::json& params);

    AgentHttp http_;
    std::atomic<int> next_id_{1};
};

class UiAutomatorTransport : public UiTransport {
public:
    explicit UiAutomatorTransport(std::chrono::milliseconds timeout = std::chrono::seconds(20));

    std::shared_ptr<UiClient> connect(const DeviceIdentity& id, const UiEndpoint& endpoint) override;

private:
    std::chrono::milliseconds timeout_;
};

} // namespace droidlink
