#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <cstdlib>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

struct WsUrl {
    std::string host;
    std::string port;
    std::string target;
};

static bool parse_ws_url(const std::string& url, WsUrl& out) {
    // Minimal parser for ws://host:port/path
    std::string s = url;
    const std::string prefix = "ws://";
    if (s.rfind(prefix, 0) != 0) return false;
    s = s.substr(prefix.size());

    std::string hostport;
    auto slash = s.find('/');
    if (slash == std::string::npos) {
        hostport = s;
        out.target = "/";
    } else {
        hostport = s.substr(0, slash);
        out.target = s.substr(slash);
    }

    auto colon = hostport.find(':');
    if (colon == std::string::npos) {
        out.host = hostport;
        out.port = "9002";
    } else {
        out.host = hostport.substr(0, colon);
        out.port = hostport.substr(colon + 1);
        if (out.port.empty()) out.port = "9002";
    }

    return !out.host.empty();
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " ws://host:port/ [status|connect|disconnect] [address]\n";
        std::cerr << "Example:\n";
        std::cerr << "  " << argv[0] << " ws://localhost:9002/\n";
        std::cerr << "  " << argv[0] << " ws://localhost:9002/ connect 127.0.0.1:16384\n";
        return 2;
    }

    const std::string ws_url = argv[1];
    const std::string cmd = argc >= 3 ? argv[2] : "status";

    json req = { {"cmd", cmd} };
    if (cmd == "connect") {
        if (argc < 4) {
            std::cerr << "connect needs an address\n";
            return 2;
        }
        req["address"] = argv[3];
    } else if (cmd != "status" && cmd != "disconnect") {
        std::cerr << "Unknown command: " << cmd << "\n";
        return 2;
    }

    WsUrl u;
    if (!parse_ws_url(ws_url, u)) {
        std::cerr << "Invalid ws url (expected ws://host:port/path): " << ws_url << "\n";
        return 2;
    }

    try {
        net::io_context ioc;
        tcp::resolver resolver{ioc};
        websocket::stream<tcp::socket> ws{ioc};

        auto const results = resolver.resolve(u.host, u.port);
        net::connect(ws.next_layer(), results);
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.handshake(u.host + ":" + u.port, u.target);

        // the server greets with a device_status before answering
        ws.write(net::buffer(req.dump()));

        const std::string wanted = cmd == "status" ? "device_status" : "reply";
        int exit_code = 0;
        beast::flat_buffer buffer;
        for (;;) {
            buffer.clear();
            ws.read(buffer);
            std::string data = beast::buffers_to_string(buffer.data());
            json msg;
            try {
                msg = json::parse(data);
            } catch (const json::exception&) {
                std::cerr << "skipping non-JSON message\n";
                continue;
            }

            std::string type = msg.value("type", std::string{});
            bool is_answer = type == wanted && (type != "reply" || msg.value("cmd", std::string{}) == cmd);
            if (is_answer) {
                std::cout << msg.dump(2) << std::endl;
                if (type == "reply" && !msg.value("ok", false)) exit_code = 3;
                break;
            }
        }

        beast::error_code ec;
        ws.close(websocket::close_code::normal, ec);
        return exit_code;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
