/*
src/device/ConnectionManager.cpp
Lifecycle of the single device session: identity parsing, port probing for
emulators, lazy transport handles, and ordered teardown of everything the
session acquired.
*/
#include "device/ConnectionManager.hpp"
#include "transport/ShellParsers.hpp"

#include <iostream>
#include <thread>

namespace droidlink {

namespace {

constexpr uint16_t kAgentDevicePort = 7912;
const char* kAgentBinary = "/data/local/tmp/atx-agent";
const char* kFocusQuery = "dumpsys window windows | grep mCurrentFocus";

void log_failures(const char* what, const std::vector<ReleaseFailure>& failures) {
    for (const auto& f : failures) {
        std::cerr << "ConnectionManager: " << what << " failed for '" << f.name << "': " << f.message << std::endl;
    }
}

} // namespace

std::string to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Disconnecting: return "disconnecting";
    }
    return "unknown";
}

ConnectionManager::ConnectionManager(std::shared_ptr<CommandTransport> command_transport,
                                     std::shared_ptr<UiTransport> ui_transport,
                                     ConnectionPolicy policy)
: command_transport_(std::move(command_transport)),
  ui_transport_(std::move(ui_transport)),
  policy_(policy) {}

ConnectionManager::~ConnectionManager() {
    disconnect();
}

void ConnectionManager::connect(const std::string& address, const ConnectOptions& options) {
    std::lock_guard<std::mutex> lk(mu_);

    DeviceIdentity identity;
    try {
        identity = parse_address(address);
    } catch (const ParseError& e) {
        std::cerr << "ConnectionManager: " << e.what() << std::endl;
        throw ConnectError(ConnectError::Kind::InvalidAddress, address);
    }

    // teardown-then-setup: the old session is gone whatever happens below
    if (session_) teardown_locked();

    state_ = ConnectionState::Connecting;
    auto session = std::make_unique<Session>();
    try {
        if (!identity.port && identity.emulator_family) {
            for (uint16_t port : common_ports_for(*identity.emulator_family)) {
                DeviceIdentity candidate = identity.with_port(port);
                try {
                    session->command = open_with_retries(candidate);
                    identity = candidate;
                    break;
                } catch (const TransportError& e) {
                    std::cerr << "ConnectionManager: candidate " << candidate.serial << " failed: " << e.what() << std::endl;
                }
            }
            if (!session->command) {
                throw ConnectError(ConnectError::Kind::NoPortFound, address);
            }
        } else {
            try {
                session->command = open_with_retries(identity);
            } catch (const TransportError& e) {
                throw ConnectError(ConnectError::Kind::TransportUnreachable, identity.serial + " (" + e.what() + ")");
            }
        }
        session->identity = identity;
        session->forwards = std::make_unique<PortForwardTable>(session->command, session->resources);
    } catch (...) {
        log_failures("release", session->resources.release_all());
        if (session->forwards) log_failures("remove forward", session->forwards->remove_all());
        state_ = ConnectionState::Disconnected;
        throw;
    }

    if (options.package.empty() || options.package == "auto") {
        const auto& p = options.packages;
        if (!p.known.empty() || !p.cloud.empty()) {
            try {
                auto detected = detect_package_locked(*session, p);
                if (detected) session->package = *detected;
            } catch (const DeviceError& e) {
                std::cerr << "ConnectionManager: package detection failed: " << e.what() << std::endl;
            }
        }
    } else {
        session->package = options.package;
    }

    session_ = std::move(session);
    ++generation_;
    state_ = ConnectionState::Connected;
    std::cout << "ConnectionManager: connected to " << session_->identity.serial
              << " (" << device_type(session_->identity) << ", " << to_string(session_->identity.transport_kind) << ")"
              << std::endl;
    if (!session_->package.empty()) {
        std::cout << "ConnectionManager: package " << session_->package << std::endl;
    }
}

void ConnectionManager::disconnect() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!session_) return;
    teardown_locked();
}

void ConnectionManager::teardown_locked() {
    if (!session_) {
        state_ = ConnectionState::Disconnected;
        return;
    }
    state_ = ConnectionState::Disconnecting;
    Session& s = *session_;
    std::cout << "ConnectionManager: disconnecting " << s.identity.serial << std::endl;

    log_failures("release", s.resources.release_all());
    if (s.forwards) log_failures("remove forward", s.forwards->remove_all());

    s.ui.reset();
    s.command.reset();
    session_.reset();
    state_ = ConnectionState::Disconnected;
    std::cout << "ConnectionManager: disconnected" << std::endl;
}

std::shared_ptr<CommandClient> ConnectionManager::open_command(const DeviceIdentity& id) {
    auto client = command_transport_->connect(id);
    if (!client) throw TransportError("no handle for " + id.serial);
    return client;
}

std::shared_ptr<CommandClient> ConnectionManager::open_with_retries(const DeviceIdentity& id) {
    for (int attempt = 0;; ++attempt) {
        try {
            return open_command(id);
        } catch (const TransportError& e) {
            if (attempt >= policy_.connect_retries) throw;
            std::cerr << "ConnectionManager: connect " << id.serial << " attempt " << (attempt + 1)
                      << " failed, retrying: " << e.what() << std::endl;
            if (policy_.retry_delay.count() > 0) std::this_thread::sleep_for(policy_.retry_delay);
        }
    }
}

ConnectionManager::Session& ConnectionManager::require_session_locked() {
    if (!session_ || state_ != ConnectionState::Connected) throw NotConnectedError();
    return *session_;
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

uint64_t ConnectionManager::session_generation() const {
    std::lock_guard<std::mutex> lk(mu_);
    return generation_;
}

DeviceInfo ConnectionManager::get_device_info() const {
    std::lock_guard<std::mutex> lk(mu_);
    DeviceInfo info;
    info.state = state_;
    if (session_) {
        const auto& id = session_->identity;
        info.identity = id;
        info.is_emulator = is_emulator(id);
        info.is_network_device = is_network_device(id);
        info.is_local_network_device = is_local_network_device(id);
        info.is_over_http = is_over_http(id);
        info.device_type = device_type(id);
        info.package = session_->package;
    }
    return info;
}

std::shared_ptr<CommandClient> ConnectionManager::command_client() {
    std::lock_guard<std::mutex> lk(mu_);
    return require_session_locked().command;
}

UiEndpoint ConnectionManager::ui_endpoint_locked(Session& s) {
    switch (s.identity.transport_kind) {
        case TransportKind::Http:
            return { s.identity.host(), s.identity.port.value_or(kAgentDevicePort), s.identity.scheme() };
        case TransportKind::Network:
            return { s.identity.host(), kAgentDevicePort };
        case TransportKind::Local:
            break;
    }
    uint16_t local = s.forwards->forward("tcp:" + std::to_string(kAgentDevicePort));
    return { "127.0.0.1", local };
}

std::shared_ptr<UiClient> ConnectionManager::ui_client_locked() {
    Session& s = require_session_locked();
    if (s.ui) return s.ui;
    if (!ui_transport_) throw TransportError("no ui transport configured");

    UiEndpoint endpoint = ui_endpoint_locked(s);
    auto client = ui_transport_->connect(s.identity, endpoint);
    if (!client) throw TransportError("no ui handle for " + s.identity.serial);
    std::cout << "ConnectionManager: ui agent at " << endpoint.host << ":" << endpoint.port << std::endl;
    s.ui = client;
    return s.ui;
}

std::shared_ptr<UiClient> ConnectionManager::ui_client() {
    std::lock_guard<std::mutex> lk(mu_);
    return ui_client_locked();
}

std::shared_ptr<UiClient> ConnectionManager::cached_ui_client() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (!session_) return nullptr;
    return session_->ui;
}

std::shared_ptr<UiClient> ConnectionManager::restart_ui_agent() {
    std::lock_guard<std::mutex> lk(mu_);
    Session& s = require_session_locked();
    if (is_over_http(s.identity)) {
        std::cerr << "ConnectionManager: " << s.identity.serial
                  << " is reached over http, restart its agent manually" << std::endl;
    } else {
        std::cout << "ConnectionManager: restarting ui agent on " << s.identity.serial << std::endl;
        s.command->shell(std::string(kAgentBinary) + " server --stop");
        s.command->shell(std::string(kAgentBinary) + " server --nouia -d --addr 127.0.0.1:" +
                         std::to_string(kAgentDevicePort));
    }
    s.ui.reset();
    return ui_client_locked();
}

uint16_t ConnectionManager::forward(const std::string& remote) {
    std::lock_guard<std::mutex> lk(mu_);
    return require_session_locked().forwards->forward(remote);
}

void ConnectionManager::reverse(const std::string& remote, const std::string& local) {
    std::lock_guard<std::mutex> lk(mu_);
    require_session_locked().forwards->reverse(remote, local);
}

std::vector<PortMapping> ConnectionManager::list_forwards() const {
    std::lock_guard<std::mutex> lk(mu_);
    if (!session_ || !session_->forwards) return {};
    return session_->forwards->list();
}

ResourceId ConnectionManager::register_resource(std::string name, std::function<void()> release) {
    std::lock_guard<std::mutex> lk(mu_);
    return require_session_locked().resources.register_resource(std::move(name), std::move(release));
}

void ConnectionManager::release_resource(ResourceId id) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!session_) return;
    session_->resources.release(id);
}

std::set<std::string> ConnectionManager::list_packages() {
    std::lock_guard<std::mutex> lk(mu_);
    return require_session_locked().command->list_packages();
}

std::optional<std::string> ConnectionManager::detect_package(const PackageConfig& packages) {
    std::lock_guard<std::mutex> lk(mu_);
    Session& s = require_session_locked();
    auto detected = detect_package_locked(s, packages);
    if (detected) s.package = *detected;
    return detected;
}

std::optional<std::string> ConnectionManager::detect_package_locked(Session& s, const PackageConfig& packages) {
    auto installed = s.command->list_packages();

    std::vector<std::string> candidates;
    for (const auto& p : installed) {
        if (packages.known.count(p) || packages.cloud.count(p)) candidates.push_back(p);
    }

    if (candidates.empty()) {
        std::cerr << "ConnectionManager: no known package installed on " << s.command->serial() << std::endl;
        return std::nullopt;
    }
    for (const auto& p : candidates) std::cout << "ConnectionManager: available package " << p << std::endl;
    if (candidates.size() == 1) return candidates.front();

    const auto& preferred = packages.cloud_game ? packages.cloud : packages.known;
    std::vector<std::string> narrowed;
    for (const auto& p : candidates) {
        if (preferred.count(p)) narrowed.push_back(p);
    }
    if (narrowed.size() == 1) return narrowed.front();

    std::cerr << "ConnectionManager: " << candidates.size()
              << " packages found, cannot decide which one to use; set the package explicitly" << std::endl;
    return std::nullopt;
}

std::string ConnectionManager::shell(const std::string& cmd) {
    // handle is taken under the lock, the query itself runs without it
    return command_client()->shell(cmd);
}

std::string ConnectionManager::getprop(const std::string& name) {
    return trim(shell("getprop " + name));
}

std::string ConnectionManager::package() const {
    std::lock_guard<std::mutex> lk(mu_);
    return session_ ? session_->package : std::string();
}

void ConnectionManager::set_package(const std::string& package) {
    std::lock_guard<std::mutex> lk(mu_);
    require_session_locked().package = package;
}

std::string ConnectionManager::app_current() {
    bool wsa = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        wsa = is_wsa(require_session_locked().identity);
    }
    // the WSA agent does not report the foreground app
    if (wsa) return parse_focused_package(shell(kFocusQuery));

    std::shared_ptr<UiClient> ui;
    try {
        ui = ui_client();
    } catch (const TransportError& e) {
        std::cerr << "ConnectionManager: ui agent unavailable, using dumpsys: " << e.what() << std::endl;
        return parse_focused_package(shell(kFocusQuery));
    }
    return trim(ui->app_current());
}

bool ConnectionManager::app_is_running() {
    std::string pkg = package();
    if (pkg.empty()) throw PackageError();
    return app_current() == pkg;
}

void ConnectionManager::app_start() {
    auto ui = ui_client();
    std::string pkg = package();
    if (pkg.empty()) throw PackageError();
    std::cout << "ConnectionManager: app start " << pkg << std::endl;
    ui->app_start(pkg);
}

void ConnectionManager::app_stop() {
    auto ui = ui_client();
    std::string pkg = package();
    if (pkg.empty()) throw PackageError();
    std::cout << "ConnectionManager: app stop " << pkg << std::endl;
    ui->app_stop(pkg);
}

std::string ConnectionManager::dump_hierarchy() {
    return ui_client()->dump_hierarchy();
}

void ConnectionManager::click(int x, int y) {
    ui_client()->click(x, y);
}

} // namespace droidlink
