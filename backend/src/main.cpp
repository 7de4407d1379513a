#include "core/BuildInfo.hpp"
#include "core/Config.hpp"
#include "core/DeviceError.hpp"
#include "device/ConnectionManager.hpp"
#include "health/HealthMonitor.hpp"
#include "simulator/SimulatedTransport.hpp"
#include "status/StatusProtocol.hpp"
#include "status/StatusServer.hpp"
#include "transport/AdbTransport.hpp"
#include "transport/UiAutomatorTransport.hpp"
#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace droidlink;

namespace {

std::atomic<bool> g_quit{false};

void on_signal(int) { g_quit = true; }

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -h, --help            Show this help message and exit\n"
              << "  -s, --sim             Use the in-process simulated device\n"
              << "  -p, --port PORT       Status WebSocket port (default 9002)\n"
              << "  -c, --config PATH     JSON config file (default $DROIDLINK_CONFIG)\n"
              << "  -a, --address ADDR    Device to connect at startup\n"
              << "  -i, --interval MS     Health poll interval in milliseconds\n"
              << std::flush;
}

bool parse_int(const std::string& s, int& out) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Value of `--flag VALUE` or `--flag=VALUE`; advances i past a separate value.
bool flag_value(int argc, char** argv, int& i, const char* shortf, const char* longf, std::string& out) {
    std::string a(argv[i]);
    if ((a == shortf || a == longf) && i + 1 < argc) {
        out = argv[++i];
        return true;
    }
    std::string prefix = std::string(longf) + "=";
    if (a.rfind(prefix, 0) == 0) {
        out = a.substr(prefix.size());
        return true;
    }
    return false;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        std::string v;
        if (flag_value(argc, argv, i, "-c", "--config", v)) config_path = v;
    }

    DaemonConfig cfg = DaemonConfig::load(config_path);

    // command line overrides the file
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        std::string v;
        if (a == "--sim" || a == "-s") {
            cfg.sim = true;
        } else if (flag_value(argc, argv, i, "-p", "--port", v)) {
            int port = 0;
            if (parse_int(v, port) && DaemonConfig::valid_port(port)) cfg.status_port = port;
            else std::cerr << "ignoring bad port '" << v << "'" << std::endl;
        } else if (flag_value(argc, argv, i, "-a", "--address", v)) {
            cfg.address = v;
        } else if (flag_value(argc, argv, i, "-i", "--interval", v)) {
            int interval = 0;
            if (parse_int(v, interval) && interval > 0) cfg.poll_interval_ms = interval;
            else std::cerr << "ignoring bad interval '" << v << "'" << std::endl;
        } else if (flag_value(argc, argv, i, "-c", "--config", v)) {
            // already handled
        }
    }

    std::cout << "droidlinkd " << buildinfo::version() << " (" << buildinfo::git_commit() << ", built "
              << buildinfo::build_time_utc_approx() << ")" << std::endl;

    std::shared_ptr<CommandTransport> command_transport;
    std::shared_ptr<UiTransport> ui_transport;
    if (cfg.sim) {
        auto sim = std::make_shared<SimulatedTransport>(/*seed=*/0);
        const std::set<std::string> sim_packages = { "com.example.game", "com.android.settings" };
        sim->add_device("127.0.0.1:16384", sim_packages);
        sim->add_device("emulator-5554", sim_packages);
        command_transport = sim;
        ui_transport = sim;
        if (cfg.address.empty()) cfg.address = "127.0.0.1:16384";
        if (cfg.packages.known.empty()) cfg.packages.known = { "com.example.game" };
        std::cout << "Simulator mode: devices 127.0.0.1:16384, emulator-5554" << std::endl;
    } else {
        command_transport = std::make_shared<AdbTransport>(cfg.adb_host, static_cast<uint16_t>(cfg.adb_port));
        ui_transport = std::make_shared<UiAutomatorTransport>();
    }

    ConnectionManager connection(command_transport, ui_transport, cfg.connection_policy());
    HealthMonitor monitor(connection, cfg.health);
    StatusProtocol protocol(connection, monitor, cfg.connect_options());

    if (!cfg.address.empty()) {
        try {
            connection.connect(cfg.address, cfg.connect_options());
        } catch (const DeviceError& e) {
            // stay up; a connect command can retry later
            std::cerr << e.what() << std::endl;
        }
    }

    monitor.start(std::chrono::milliseconds(cfg.poll_interval_ms));

    StatusServer server(cfg.status_port, protocol);
    server.start();

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::cout << "droidlinkd running, status on port " << cfg.status_port << "..." << std::endl;

    // Development control channel: JSON lines on stdin, only when stdin is a TTY
    // so detached runs (nohup, systemd) never block on it.
    bool interactive_stdin = isatty(fileno(stdin));
    if (interactive_stdin) {
        std::thread([&server]() {
            std::string line;
            while (std::getline(std::cin, line)) {
                if (line.empty()) continue;
                try {
                    auto reply = server.handle_control(nlohmann::json::parse(line));
                    std::cout << reply.dump() << std::endl;
                } catch (const nlohmann::json::exception& e) {
                    std::cerr << "control: failed to parse input: " << e.what() << std::endl;
                }
            }
        }).detach();
    } else {
        std::cerr << "stdin not a TTY; skipping stdin control thread (detached/background mode)" << std::endl;
    }

    while (!g_quit) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    std::cout << "droidlinkd shutting down" << std::endl;
    server.stop();
    monitor.stop();
    connection.disconnect();
    return 0;
}
