#include <iostream>
#include "core/Config.hpp"
#include "device/ConnectionManager.hpp"
#include "health/HealthMonitor.hpp"
#include "simulator/SimulatedTransport.hpp"
#include "status/StatusProtocol.hpp"
#include <chrono>
#include <thread>
#include <nlohmann/json.hpp>

using namespace droidlink;
using nlohmann::json;

int main() {
    std::cout << "Simulated daemon CI-less tests starting...\n";
    try {
        DaemonConfig cfg;
        cfg.merge({ {"packages", { {"known", json::array({"com.example.game"})} }}, {"poll_interval_ms", 20} });

        auto sim = std::make_shared<SimulatedTransport>(42);
        sim->add_device("127.0.0.1:16384", { "com.example.game", "com.android.settings" });

        ConnectionManager connection(sim, sim, cfg.connection_policy());
        HealthMonitor monitor(connection, cfg.health);
        StatusProtocol protocol(connection, monitor, cfg.connect_options());

        auto reply = protocol.handle_command({ {"cmd", "connect"}, {"address", "mumu"} });
        if (!reply.value("ok", false)) { std::cerr << "connect failed: " << reply.dump() << "\n"; return 2; }
        if (connection.package() != "com.example.game") { std::cerr << "package not detected\n"; return 3; }

        connection.app_start();
        if (!connection.app_is_running()) { std::cerr << "app not running after start\n"; return 4; }

        monitor.start(std::chrono::milliseconds(cfg.poll_interval_ms));
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (monitor.ticks() == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        monitor.stop();

        auto status = protocol.build_status_message();
        std::cout << "Status: " << status.dump() << std::endl;
        if (!status["health"].value("connected", false)) { std::cerr << "health not sampled\n"; return 5; }
        if (status["forwards"].size() != 1) { std::cerr << "expected the ui agent forward\n"; return 6; }

        protocol.handle_command({ {"cmd", "disconnect"} });
        if (!sim->live_mappings().empty()) { std::cerr << "forwards leaked after disconnect\n"; return 7; }

        std::cout << "Simulated daemon CI-less tests passed\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "exception: " << e.what() << std::endl;
        return 1;
    }
}
