/*
src/transport/AdbTransport.cpp
adb server client over Boost.Asio. Requests are "%04x" length-prefixed
service strings; the server answers OKAY or FAIL followed by a
length-prefixed reason.
*/
#include "transport/AdbTransport.hpp"
#include "transport/ShellParsers.hpp"
#include "transport/UiAutomatorTransport.hpp"
#include "core/DeviceError.hpp"
#include "core/ErrorCatalog.hpp"
#include "device/DeviceIdentity.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <cstdio>
#include <iostream>
#include <random>
#include <sstream>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace droidlink {

namespace {

constexpr uint16_t kForwardPortMin = 10000;
constexpr uint16_t kForwardPortMax = 20000;
constexpr int kForwardAttempts = 3;

uint16_t random_forward_port() {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(kForwardPortMin, kForwardPortMax - 1);
    return static_cast<uint16_t>(dist(rng));
}

// One connection to the adb server, closed on destruction. Every operation
// runs asynchronously on a private io_context bounded by `timeout`, so a
// server that stops answering surfaces as TransportError instead of a hang.
class AdbSocket {
public:
    AdbSocket(const std::string& host, uint16_t port, std::chrono::milliseconds timeout)
    : sock_(ioc_), timeout_(timeout) {
        const std::string where = host + ":" + std::to_string(port);
        boost::system::error_code ec;
        tcp::resolver resolver(ioc_);
        auto results = resolver.resolve(host, std::to_string(port), ec);
        if (!ec) {
            asio::async_connect(sock_, results,
                [&ec](const boost::system::error_code& e, const tcp::endpoint&) { ec = e; });
            await("connect " + where);
        }
        if (ec) {
            throw TransportError("cannot connect to adb server at " + where + ": " + ec.message());
        }
    }

    ~AdbSocket() {
        boost::system::error_code ec;
        sock_.shutdown(tcp::socket::shutdown_both, ec);
        sock_.close(ec);
    }

    void send(const std::string& service) {
        char prefix[5];
        std::snprintf(prefix, sizeof(prefix), "%04x", static_cast<unsigned>(service.size()));
        std::string frame = std::string(prefix, 4) + service;
        boost::system::error_code ec;
        asio::async_write(sock_, asio::buffer(frame),
            [&ec](const boost::system::error_code& e, std::size_t) { ec = e; });
        await("write '" + service + "'");
        if (ec) throw TransportError("write failure during '" + service + "': " + ec.message());
    }

    // Returns false on a clean EOF before any status bytes.
    bool read_status(bool eof_ok = false) {
        std::string status = read_exact(4, eof_ok);
        if (status.empty()) return false;
        if (status == "OKAY") return true;
        if (status == "FAIL") throw TransportError(read_protocol_string());
        throw TransportError("protocol fault (status " + status + ")");
    }

    std::string read_protocol_string() {
        std::string len_hex = read_exact(4, false);
        unsigned long len = 0;
        try {
            len = std::stoul(len_hex, nullptr, 16);
        } catch (const std::exception&) {
            throw TransportError("protocol fault (bad length '" + len_hex + "')");
        }
        return read_exact(len, false);
    }

    std::string read_all() {
        std::string out;
        char buf[4096];
        for (;;) {
            boost::system::error_code ec;
            std::size_t n = 0;
            sock_.async_read_some(asio::buffer(buf),
                [&ec, &n](const boost::system::error_code& e, std::size_t got) { ec = e; n = got; });
            await("read");
            out.append(buf, n);
            if (ec == asio::error::eof) break;
            if (ec) throw TransportError("read failure: " + ec.message());
        }
        return out;
    }

private:
    std::string read_exact(std::size_t n, bool eof_ok) {
        std::string out(n, '\0');
        if (n == 0) return out;
        boost::system::error_code ec;
        std::size_t got = 0;
        asio::async_read(sock_, asio::buffer(&out[0], n),
            [&ec, &got](const boost::system::error_code& e, std::size_t count) { ec = e; got = count; });
        await("read");
        if (ec == asio::error::eof && got == 0 && eof_ok) return "";
        if (ec) throw TransportError("read failure: " + ec.message());
        return out;
    }

    // Run the pending operation to completion or until the deadline passes.
    void await(const std::string& what) {
        ioc_.restart();
        ioc_.run_for(timeout_);
        if (ioc_.stopped()) return;

        // deadline hit: cancel, then drain the aborted handler before unwinding
        boost::system::error_code ignored;
        sock_.close(ignored);
        ioc_.run();
        throw TransportError(errors::with_detail(errors::D1400_TIMEOUT,
                             what + " after " + std::to_string(timeout_.count()) + "ms"));
    }

    asio::io_context ioc_;
    tcp::socket sock_;
    std::chrono::milliseconds timeout_;
};

bool mentions(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

AdbTransport::AdbTransport(std::string server_host, uint16_t server_port, std::chrono::milliseconds io_timeout)
: host_(std::move(server_host)), port_(server_port), timeout_(io_timeout) {}

std::string AdbTransport::query(const std::string& service) {
    AdbSocket s(host_, port_, timeout_);
    s.send(service);
    s.read_status();
    return s.read_protocol_string();
}

void AdbTransport::command(const std::string& service) {
    AdbSocket s(host_, port_, timeout_);
    s.send(service);
    s.read_status();
    // forward:* answers a second OKAY once the listener is installed
    s.read_status(true);
}

std::string AdbTransport::device_service(const std::string& serial, const std::string& service) {
    AdbSocket s(host_, port_, timeout_);
    s.send("host:transport:" + serial);
    s.read_status();
    s.send(service);
    s.read_status();
    return s.read_all();
}

void AdbTransport::device_command(const std::string& serial, const std::string& service) {
    AdbSocket s(host_, port_, timeout_);
    s.send("host:transport:" + serial);
    s.read_status();
    s.send(service);
    s.read_status();
    s.read_status(true);
}

std::vector<std::pair<std::string, std::string>> AdbTransport::devices() {
    std::vector<std::pair<std::string, std::string>> out;
    std::istringstream in(query("host:devices"));
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string serial, state;
        if (fields >> serial >> state) out.emplace_back(serial, state);
    }
    return out;
}

std::shared_ptr<CommandClient> AdbTransport::connect(const DeviceIdentity& id) {
    if (id.transport_kind == TransportKind::Http) {
        UiEndpoint agent{ id.host(), id.port.value_or(7912), id.scheme() };
        auto client = std::make_shared<AtxShellClient>(id.serial, agent);
        std::string state = client->get_state();
        if (state != "device") {
            throw TransportError("agent at " + id.serial + " is " + state);
        }
        return client;
    }

    // tcp serials need `adb connect` before the server knows them
    if (id.serial.find(':') != std::string::npos) {
        std::string reply = query("host:connect:" + id.serial);
        std::cout << "AdbTransport: " << trim(reply) << std::endl;
        if (mentions(reply, "cannot") || mentions(reply, "failed") || mentions(reply, "unable")) {
            throw TransportError(trim(reply));
        }
    }

    auto device = std::make_shared<AdbDevice>(shared_from_this(), id.serial);
    std::string state = device->get_state();
    if (state != "device") {
        throw TransportError(id.serial + " is " + (state.empty() ? "unknown" : state));
    }
    return device;
}

AdbDevice::AdbDevice(std::shared_ptr<AdbTransport> transport, std::string serial)
: transport_(std::move(transport)), serial_(std::move(serial)) {}

std::string AdbDevice::get_state() {
    return trim(transport_->query("host-serial:" + serial_ + ":get-state"));
}

std::string AdbDevice::shell(const std::string& cmd) {
    return strip_shell_warnings(transport_->device_service(serial_, "shell:" + cmd));
}

uint16_t AdbDevice::forward(const std::string& remote) {
    for (int attempt = 1;; ++attempt) {
        uint16_t port = random_forward_port();
        try {
            transport_->command("host-serial:" + serial_ + ":forward:tcp:" + std::to_string(port) + ";" + remote);
            return port;
        } catch (const TransportError& e) {
            // local port taken by someone else, pick another
            if (attempt >= kForwardAttempts || !mentions(e.what(), "cannot bind")) throw;
            std::cerr << "AdbDevice: tcp:" << port << " busy, retrying" << std::endl;
        }
    }
}

void AdbDevice::reverse(const std::string& remote, const std::string& local) {
    transport_->device_command(serial_, "reverse:forward:" + remote + ";" + local);
}

void AdbDevice::remove_forward(const PortMapping& mapping) {
    try {
        if (mapping.direction == ForwardDirection::Forward) {
            transport_->command("host-serial:" + serial_ + ":killforward:" + mapping.local);
        } else {
            transport_->device_command(serial_, "reverse:killforward:" + mapping.remote);
        }
    } catch (const TransportError& e) {
        if (!mentions(e.what(), "not found")) throw;
        std::cerr << "AdbDevice: " << errors::with_detail(errors::D1400_LISTENER_NOT_FOUND, mapping.remote) << std::endl;
    }
}

std::set<std::string> AdbDevice::list_packages() {
    auto packages = parse_package_list(shell("dumpsys package | grep \"Package \\[\""));
    if (packages.empty()) packages = parse_package_list(shell("pm list packages"));
    return packages;
}

} // namespace droidlink
