#include "simulator/SimulatedTransport.hpp"
#include "device/DeviceIdentity.hpp"
#include "core/DeviceError.hpp"
#include "health/MetricParsers.hpp"
#include "transport/ShellParsers.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>

namespace droidlink {

namespace {

double sample_normal(std::mt19937_64& rng, double mean, double rel) {
    std::normal_distribution<double> d(mean, std::abs(mean) * rel);
    return d(rng);
}

} // namespace

SimulatedTransport::SimulatedTransport(uint64_t seed) {
    if (seed == 0) {
        rng_.seed(static_cast<uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count()));
    } else {
        rng_.seed(seed);
    }
}

void SimulatedTransport::record(const std::string& event) {
    events_.push_back(event);
}

void SimulatedTransport::add_device(const std::string& serial, std::set<std::string> packages) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& d = devices_[serial];
    d.reachable = true;
    d.packages = std::move(packages);
}

void SimulatedTransport::set_reachable(const std::string& serial, bool reachable) {
    std::lock_guard<std::mutex> lk(mu_);
    devices_[serial].reachable = reachable;
}

void SimulatedTransport::set_shell_response(const std::string& cmd, const std::string& output) {
    std::lock_guard<std::mutex> lk(mu_);
    shell_responses_[cmd] = output;
}

void SimulatedTransport::fail_shell(const std::string& cmd, bool fail) {
    std::lock_guard<std::mutex> lk(mu_);
    if (fail) failing_shell_.insert(cmd);
    else failing_shell_.erase(cmd);
}

std::vector<std::string> SimulatedTransport::events() const {
    std::lock_guard<std::mutex> lk(mu_);
    return events_;
}

size_t SimulatedTransport::count(const std::string& prefix) const {
    std::lock_guard<std::mutex> lk(mu_);
    return std::count_if(events_.begin(), events_.end(),
                         [&](const std::string& e) { return e.rfind(prefix, 0) == 0; });
}

std::vector<PortMapping> SimulatedTransport::live_mappings() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<PortMapping> out;
    for (const auto& kv : mappings_) out.insert(out.end(), kv.second.begin(), kv.second.end());
    return out;
}

std::string SimulatedTransport::current_app(const std::string& serial) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = devices_.find(serial);
    return it == devices_.end() ? std::string() : it->second.current_app;
}

SimulatedTransport::DeviceState& SimulatedTransport::require_device(const std::string& serial) {
    auto it = devices_.find(serial);
    if (it == devices_.end() || !it->second.reachable) {
        throw TransportError("device '" + serial + "' not found");
    }
    return it->second;
}

std::shared_ptr<CommandClient> SimulatedTransport::connect(const DeviceIdentity& id) {
    std::lock_guard<std::mutex> lk(mu_);
    record("connect " + id.serial);
    require_device(id.serial);
    return std::make_shared<SimulatedCommandClient>(shared_from_this(), id.serial);
}

std::shared_ptr<UiClient> SimulatedTransport::connect(const DeviceIdentity& id, const UiEndpoint& endpoint) {
    std::lock_guard<std::mutex> lk(mu_);
    record("ui_connect " + endpoint.host + ":" + std::to_string(endpoint.port));
    require_device(id.serial);
    require_ui();
    return std::make_shared<SimulatedUiClient>(shared_from_this(), id.serial);
}

void SimulatedTransport::require_ui() {
    if (!ui_available_) throw TransportError("ui agent not answering");
}

std::string SimulatedTransport::run_shell(const std::string& serial, const std::string& cmd) {
    std::lock_guard<std::mutex> lk(mu_);
    record("shell " + cmd);
    require_device(serial);
    if (failing_shell_.count(cmd)) throw TransportError("shell '" + cmd + "' failed");
    auto it = shell_responses_.find(cmd);
    if (it != shell_responses_.end()) return it->second;
    return default_response(serial, cmd);
}

std::string SimulatedTransport::default_response(const std::string& serial, const std::string& cmd) {
    DeviceState& d = devices_[serial];
    std::ostringstream out;
    if (cmd == metric_commands::kCpu) {
        int busy = std::clamp(static_cast<int>(std::round(sample_normal(rng_, 120.0, 0.2))), 0, 800);
        out << "Tasks: 512 total,   1 running, 511 sleeping\n"
            << "800%cpu " << busy << "%user   0%nice  10%sys " << (800 - busy) << "%idle   0%iow   0%irq\n";
    } else if (cmd == metric_commands::kMemory) {
        long total = 4000000;
        long avail = static_cast<long>(sample_normal(rng_, 2000000.0, 0.05));
        out << "MemTotal:        " << total << " kB\n"
            << "MemFree:          300000 kB\n"
            << "MemAvailable:    " << avail << " kB\n";
    } else if (cmd == metric_commands::kBattery) {
        out << "Current Battery Service state:\n"
            << "  AC powered: true\n"
            << "  level: 80\n"
            << "  temperature: 300\n";
    } else if (cmd == metric_commands::kNetwork) {
        out << "NetworkAgentInfo{ ni{[type: WIFI[], state: CONNECTED/CONNECTED]} }\n";
    } else if (cmd.rfind("dumpsys package", 0) == 0) {
        for (const auto& p : d.packages) out << "  Package [" << p << "] (1a2b3c):\n";
    } else if (cmd == "pm list packages") {
        for (const auto& p : d.packages) out << "package:" << p << "\n";
    } else if (cmd.rfind("dumpsys window", 0) == 0) {
        if (!d.current_app.empty()) {
            out << "  mCurrentFocus=Window{7d1c u0 " << d.current_app << "/" << d.current_app << ".MainActivity}\n";
        }
    } else if (cmd.rfind("getprop ", 0) == 0) {
        std::string name = cmd.substr(8);
        if (name == "ro.product.model") out << "Simulated Device\n";
        else if (name == "ro.build.version.sdk") out << "32\n";
        else out << "\n";
    }
    return out.str();
}

uint16_t SimulatedTransport::add_forward(const std::string& serial, const std::string& remote) {
    std::lock_guard<std::mutex> lk(mu_);
    require_device(serial);
    uint16_t port = next_forward_port_++;
    PortMapping m{ ForwardDirection::Forward, "tcp:" + std::to_string(port), remote };
    mappings_[serial].push_back(m);
    record("forward " + m.local + " " + remote);
    return port;
}

void SimulatedTransport::add_reverse(const std::string& serial, const std::string& remote, const std::string& local) {
    std::lock_guard<std::mutex> lk(mu_);
    require_device(serial);
    mappings_[serial].push_back(PortMapping{ ForwardDirection::Reverse, local, remote });
    record("reverse " + remote + " " + local);
}

void SimulatedTransport::remove_mapping(const std::string& serial, const PortMapping& mapping) {
    std::lock_guard<std::mutex> lk(mu_);
    record("remove_forward " + mapping.local + " " + mapping.remote);
    if (fail_remove_) throw TransportError("remove_forward " + mapping.remote + " failed");
    auto& list = mappings_[serial];
    list.erase(std::remove(list.begin(), list.end(), mapping), list.end());
}

// ---- SimulatedCommandClient ----

SimulatedCommandClient::SimulatedCommandClient(std::shared_ptr<SimulatedTransport> sim, std::string serial)
: sim_(std::move(sim)), serial_(std::move(serial)) {}

std::string SimulatedCommandClient::get_state() {
    std::lock_guard<std::mutex> lk(sim_->mu_);
    auto it = sim_->devices_.find(serial_);
    if (it == sim_->devices_.end()) return "unknown";
    return it->second.reachable ? "device" : "offline";
}

std::string SimulatedCommandClient::shell(const std::string& cmd) {
    return sim_->run_shell(serial_, cmd);
}

uint16_t SimulatedCommandClient::forward(const std::string& remote) {
    return sim_->add_forward(serial_, remote);
}

void SimulatedCommandClient::reverse(const std::string& remote, const std::string& local) {
    sim_->add_reverse(serial_, remote, local);
}

void SimulatedCommandClient::remove_forward(const PortMapping& mapping) {
    sim_->remove_mapping(serial_, mapping);
}

std::set<std::string> SimulatedCommandClient::list_packages() {
    auto packages = parse_package_list(shell("dumpsys package | grep \"Package \\[\""));
    if (packages.empty()) packages = parse_package_list(shell("pm list packages"));
    return packages;
}

// ---- SimulatedUiClient ----

SimulatedUiClient::SimulatedUiClient(std::shared_ptr<SimulatedTransport> sim, std::string serial)
: sim_(std::move(sim)), serial_(std::move(serial)) {}

bool SimulatedUiClient::ping() {
    std::lock_guard<std::mutex> lk(sim_->mu_);
    return sim_->ui_available_;
}

std::string SimulatedUiClient::dump_hierarchy() {
    std::lock_guard<std::mutex> lk(sim_->mu_);
    sim_->require_ui();
    sim_->record("dump_hierarchy");
    const auto& app = sim_->require_device(serial_).current_app;
    return "<?xml version='1.0' encoding='UTF-8' standalone='yes' ?>"
           "<hierarchy rotation=\"0\"><node index=\"0\" package=\"" + app +
           "\" class=\"android.widget.FrameLayout\" bounds=\"[0,0][1280,720]\" /></hierarchy>";
}

void SimulatedUiClient::app_start(const std::string& package) {
    std::lock_guard<std::mutex> lk(sim_->mu_);
    sim_->require_ui();
    sim_->record("app_start " + package);
    auto& d = sim_->require_device(serial_);
    if (!d.packages.count(package)) throw TransportError("package " + package + " not installed");
    d.current_app = package;
}

void SimulatedUiClient::app_stop(const std::string& package) {
    std::lock_guard<std::mutex> lk(sim_->mu_);
    sim_->require_ui();
    sim_->record("app_stop " + package);
    auto& d = sim_->require_device(serial_);
    if (d.current_app == package) d.current_app = "com.android.launcher3";
}

std::string SimulatedUiClient::app_current() {
    std::lock_guard<std::mutex> lk(sim_->mu_);
    sim_->require_ui();
    return sim_->require_device(serial_).current_app;
}

void SimulatedUiClient::click(int x, int y) {
    std::lock_guard<std::mutex> lk(sim_->mu_);
    sim_->require_ui();
    sim_->record("click " + std::to_string(x) + " " + std::to_string(y));
}

} // namespace droidlink
