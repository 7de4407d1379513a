#include <gtest/gtest.h>
#include "transport/AdbTransport.hpp"
#include "transport/UiAutomatorTransport.hpp"
#include "device/ConnectionManager.hpp"
#include "device/DeviceIdentity.hpp"
#include "core/DeviceError.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;
using nlohmann::json;
using namespace droidlink;

namespace {

const auto kLoopback = asio::ip::make_address("127.0.0.1");

std::string hex4(std::size_t n) {
    char buf[5];
    std::snprintf(buf, sizeof(buf), "%04x", static_cast<unsigned>(n));
    return std::string(buf, 4);
}

// A port nothing listens on.
uint16_t closed_port() {
    asio::io_context ioc;
    tcp::acceptor a(ioc, tcp::endpoint(kLoopback, 0));
    uint16_t port = a.local_endpoint().port();
    a.close();
    return port;
}

// Unblocks a server thread parked in accept().
void poke(uint16_t port) {
    asio::io_context ioc;
    tcp::socket s(ioc);
    boost::system::error_code ec;
    s.connect(tcp::endpoint(kLoopback, port), ec);
}

struct AdbReply {
    std::string bytes;
    bool close = true;
    bool hang = false;
};

AdbReply okay(const std::string& payload) { return { "OKAY" + hex4(payload.size()) + payload }; }
AdbReply fail(const std::string& why) { return { "FAIL" + hex4(why.size()) + why }; }
// host:transport acknowledgement, the connection stays open for the next request
AdbReply ack() { return { "OKAY", false }; }
// forward / killforward / reverse: OKAY for the request, OKAY once installed
AdbReply installed() { return { "OKAYOKAY" }; }
// shell output streamed until the server closes
AdbReply stream(const std::string& data) { return { "OKAY" + data }; }
AdbReply silence() { AdbReply r; r.hang = true; return r; }

// adb server on a loopback port answering every framed request through a script.
class FakeAdbServer {
public:
    using Script = std::function<AdbReply(const std::string& service)>;

    explicit FakeAdbServer(Script script)
    : script_(std::move(script)), acceptor_(ioc_, tcp::endpoint(kLoopback, 0)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this]() { serve(); });
    }

    ~FakeAdbServer() {
        stopping_ = true;
        poke(port_);
        thread_.join();
    }

    uint16_t port() const { return port_; }

    std::vector<std::string> services() const {
        std::lock_guard<std::mutex> lk(mu_);
        return services_;
    }

    size_t count(const std::string& prefix) const {
        std::lock_guard<std::mutex> lk(mu_);
        return std::count_if(services_.begin(), services_.end(),
                             [&](const std::string& s) { return s.rfind(prefix, 0) == 0; });
    }

private:
    void serve() {
        while (!stopping_) {
            tcp::socket sock(ioc_);
            boost::system::error_code ec;
            acceptor_.accept(sock, ec);
            if (ec || stopping_) break;
            handle(sock);
        }
    }

    void handle(tcp::socket& sock) {
        for (;;) {
            boost::system::error_code ec;
            std::string len_hex(4, '\0');
            asio::read(sock, asio::buffer(&len_hex[0], 4), ec);
            if (ec) return;
            std::string service(std::stoul(len_hex, nullptr, 16), '\0');
            if (!service.empty()) asio::read(sock, asio::buffer(&service[0], service.size()), ec);
            if (ec) return;
            {
                std::lock_guard<std::mutex> lk(mu_);
                services_.push_back(service);
            }
            AdbReply reply = script_(service);
            if (reply.hang) {
                held_.push_back(std::move(sock));
                return;
            }
            asio::write(sock, asio::buffer(reply.bytes), ec);
            if (ec || reply.close) return;
        }
    }

    Script script_;
    asio::io_context ioc_;
    tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
    std::vector<tcp::socket> held_;
    mutable std::mutex mu_;
    std::vector<std::string> services_;
};

struct AgentReply {
    unsigned status = 200;
    std::string body;
};

// uiautomator2 agent stand-in: one HTTP request per connection.
class FakeAgent {
public:
    using Handler = std::function<AgentReply(const std::string& target, const std::string& body)>;

    explicit FakeAgent(Handler handler)
    : handler_(std::move(handler)), acceptor_(ioc_, tcp::endpoint(kLoopback, 0)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this]() { serve(); });
    }

    ~FakeAgent() {
        stopping_ = true;
        poke(port_);
        thread_.join();
    }

    uint16_t port() const { return port_; }

    std::vector<std::string> targets() const {
        std::lock_guard<std::mutex> lk(mu_);
        return targets_;
    }

    std::string last_body() const {
        std::lock_guard<std::mutex> lk(mu_);
        return last_body_;
    }

private:
    void serve() {
        while (!stopping_) {
            tcp::socket sock(ioc_);
            boost::system::error_code ec;
            acceptor_.accept(sock, ec);
            if (ec || stopping_) break;

            beast::flat_buffer buffer;
            http::request<http::string_body> req;
            http::read(sock, buffer, req, ec);
            if (ec) continue;

            std::string target(req.target());
            {
                std::lock_guard<std::mutex> lk(mu_);
                targets_.push_back(target);
                last_body_ = req.body();
            }
            AgentReply reply = handler_(target, req.body());

            http::response<http::string_body> res{static_cast<http::status>(reply.status), req.version()};
            res.set(http::field::content_type, "application/json");
            res.keep_alive(false);
            res.body() = reply.body;
            res.prepare_payload();
            http::write(sock, res, ec);
            sock.shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    Handler handler_;
    asio::io_context ioc_;
    tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
    mutable std::mutex mu_;
    std::vector<std::string> targets_;
    std::string last_body_;
};

AgentReply pong_or(const std::string& target, AgentReply other) {
    if (target == "/ping") return { 200, "pong" };
    return other;
}

std::shared_ptr<AdbTransport> adb_at(uint16_t port, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
    return std::make_shared<AdbTransport>("127.0.0.1", port, timeout);
}

} // namespace

// ---- adb host protocol ----

TEST(AdbTransport, QueryFramesServiceAndReadsPayload) {
    FakeAdbServer adb([](const std::string& s) {
        if (s == "host:version") return okay("0029");
        if (s == "host:devices") return okay("emulator-5554\tdevice\n127.0.0.1:16384\toffline\n");
        return fail("unknown host service");
    });
    auto t = adb_at(adb.port());

    EXPECT_EQ(t->query("host:version"), "0029");
    auto devices = t->devices();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0], std::make_pair(std::string("emulator-5554"), std::string("device")));
    EXPECT_EQ(devices[1].second, "offline");
    EXPECT_EQ(adb.services(), (std::vector<std::string>{ "host:version", "host:devices" }));
}

TEST(AdbTransport, FailStatusCarriesReason) {
    FakeAdbServer adb([](const std::string&) { return fail("unknown host service"); });
    try {
        adb_at(adb.port())->query("host:bogus");
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_NE(std::string(e.what()).find("unknown host service"), std::string::npos);
    }
}

TEST(AdbTransport, ServerDownIsTransportError) {
    EXPECT_THROW(adb_at(closed_port())->query("host:version"), TransportError);
}

TEST(AdbTransport, SilentServerTimesOut) {
    FakeAdbServer adb([](const std::string&) { return silence(); });
    auto t = adb_at(adb.port(), std::chrono::milliseconds(300));

    auto begin = std::chrono::steady_clock::now();
    try {
        t->query("host:version");
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(3));
}

TEST(AdbTransport, SilentShellTimesOut) {
    FakeAdbServer adb([](const std::string& s) {
        if (s.rfind("host:transport:", 0) == 0) return ack();
        return silence();
    });
    AdbDevice dev(adb_at(adb.port(), std::chrono::milliseconds(300)), "emulator-5554");
    auto begin = std::chrono::steady_clock::now();
    EXPECT_THROW(dev.shell("top -n 1"), TransportError);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(3));
}

TEST(AdbTransport, ConnectNetworkSerialAndRunShell) {
    FakeAdbServer adb([](const std::string& s) {
        if (s == "host:connect:192.168.1.20:5555") return okay("connected to 192.168.1.20:5555");
        if (s == "host-serial:192.168.1.20:5555:get-state") return okay("device");
        if (s == "host:transport:192.168.1.20:5555") return ack();
        if (s == "shell:getprop ro.product.model") return stream("WARNING: linker: libfoo.so\nPixel 7\n");
        return fail("unexpected " + s);
    });
    auto client = adb_at(adb.port())->connect(parse_address("192.168.1.20"));
    ASSERT_NE(client, nullptr);
    EXPECT_EQ(client->serial(), "192.168.1.20:5555");
    EXPECT_EQ(client->shell("getprop ro.product.model"), "Pixel 7");
}

TEST(AdbTransport, ConnectRefusedOrOfflineDevice) {
    FakeAdbServer adb([](const std::string& s) {
        if (s.rfind("host:connect:", 0) == 0) return okay("failed to connect to '10.0.0.9:5555': Connection refused");
        if (s == "host-serial:R58M12ABCDE:get-state") return okay("offline");
        return fail("unexpected " + s);
    });
    auto t = adb_at(adb.port());
    EXPECT_THROW(t->connect(parse_address("10.0.0.9:5555")), TransportError);
    EXPECT_THROW(t->connect(parse_address("R58M12ABCDE")), TransportError);
    // usb serials go straight to get-state
    EXPECT_EQ(adb.count("host:connect:R58M12ABCDE"), 0u);
}

TEST(AdbTransport, ForwardRetriesBusyPort) {
    int attempts = 0;
    FakeAdbServer adb([&attempts](const std::string& s) {
        if (s.find(":forward:tcp:") == std::string::npos) return fail("unexpected " + s);
        if (++attempts == 1) return fail("cannot bind listener: Address already in use");
        return installed();
    });
    AdbDevice dev(adb_at(adb.port()), "emulator-5554");

    uint16_t port = dev.forward("tcp:7912");
    EXPECT_GE(port, 10000);
    EXPECT_LT(port, 20000);
    auto services = adb.services();
    ASSERT_EQ(services.size(), 2u);
    EXPECT_EQ(services[1], "host-serial:emulator-5554:forward:tcp:" + std::to_string(port) + ";tcp:7912");
}

TEST(AdbTransport, ForwardStopsOnOtherErrorsAndAfterThreeBusyPorts) {
    FakeAdbServer offline([](const std::string&) { return fail("device offline"); });
    AdbDevice a(adb_at(offline.port()), "emulator-5554");
    EXPECT_THROW(a.forward("tcp:7912"), TransportError);
    EXPECT_EQ(offline.services().size(), 1u);

    FakeAdbServer busy([](const std::string&) { return fail("cannot bind listener: Address already in use"); });
    AdbDevice b(adb_at(busy.port()), "emulator-5554");
    EXPECT_THROW(b.forward("tcp:7912"), TransportError);
    EXPECT_EQ(busy.services().size(), 3u);
}

TEST(AdbTransport, ReverseGoesThroughDeviceTransport) {
    FakeAdbServer adb([](const std::string& s) {
        if (s == "host:transport:emulator-5554") return ack();
        if (s == "reverse:forward:tcp:7912;tcp:7912") return installed();
        return fail("unexpected " + s);
    });
    AdbDevice dev(adb_at(adb.port()), "emulator-5554");
    EXPECT_NO_THROW(dev.reverse("tcp:7912", "tcp:7912"));
    EXPECT_EQ(adb.services(), (std::vector<std::string>{ "host:transport:emulator-5554",
                                                          "reverse:forward:tcp:7912;tcp:7912" }));
}

TEST(AdbTransport, RemovingMissingListenerIsNotAnError) {
    FakeAdbServer adb([](const std::string& s) {
        if (s == "host:transport:emulator-5554") return ack();
        if (s == "host-serial:emulator-5554:killforward:tcp:12345") return fail("listener 'tcp:12345' not found");
        if (s == "reverse:killforward:tcp:7912") return fail("listener 'tcp:7912' not found");
        return fail("device offline");
    });
    AdbDevice dev(adb_at(adb.port()), "emulator-5554");

    EXPECT_NO_THROW(dev.remove_forward({ ForwardDirection::Forward, "tcp:12345", "tcp:7912" }));
    EXPECT_NO_THROW(dev.remove_forward({ ForwardDirection::Reverse, "tcp:7912", "tcp:7912" }));
    EXPECT_THROW(dev.remove_forward({ ForwardDirection::Forward, "tcp:15000", "tcp:7912" }), TransportError);
}

TEST(AdbTransport, PackageListFallsBackToPm) {
    FakeAdbServer adb([](const std::string& s) {
        if (s.rfind("host:transport:", 0) == 0) return ack();
        if (s.rfind("shell:dumpsys package", 0) == 0) return stream("");
        if (s == "shell:pm list packages") return stream("package:com.example.game\npackage:com.android.settings\n");
        return fail("unexpected " + s);
    });
    AdbDevice dev(adb_at(adb.port()), "emulator-5554");
    EXPECT_EQ(dev.list_packages(), (std::set<std::string>{ "com.android.settings", "com.example.game" }));
    EXPECT_EQ(adb.count("shell:pm list packages"), 1u);
}

// ---- uiautomator2 agent over http ----

TEST(AgentTransport, DeadHttpAgentIsUnreachable) {
    uint16_t port = closed_port();
    ConnectionManager cm(adb_at(closed_port()), nullptr);
    try {
        cm.connect("http://127.0.0.1:" + std::to_string(port));
        FAIL() << "expected ConnectError";
    } catch (const ConnectError& e) {
        EXPECT_EQ(e.kind(), ConnectError::Kind::TransportUnreachable);
    }
    EXPECT_EQ(cm.state(), ConnectionState::Disconnected);
    EXPECT_FALSE(cm.get_device_info().identity.has_value());
}

TEST(AgentTransport, AgentWithoutPongIsUnreachable) {
    FakeAgent agent([](const std::string&, const std::string&) { return AgentReply{ 200, "starting" }; });
    ConnectionManager cm(adb_at(closed_port()), nullptr);
    EXPECT_THROW(cm.connect("http://127.0.0.1:" + std::to_string(agent.port())), ConnectError);
    EXPECT_EQ(cm.state(), ConnectionState::Disconnected);
}

TEST(AgentTransport, HttpDeviceRunsShellAndUiThroughAgent) {
    FakeAgent agent([](const std::string& target, const std::string&) {
        if (target.rfind("/shell", 0) == 0) return AgentReply{ 200, R"({"output": "hello\n", "exitCode": 0})" };
        if (target == "/jsonrpc/0") return AgentReply{ 200, R"({"jsonrpc": "2.0", "id": 1, "result": "<hierarchy/>"})" };
        return pong_or(target, AgentReply{ 404, "" });
    });
    ConnectionManager cm(adb_at(closed_port()), std::make_shared<UiAutomatorTransport>(std::chrono::seconds(2)));
    cm.connect("http://127.0.0.1:" + std::to_string(agent.port()));

    EXPECT_TRUE(cm.get_device_info().is_over_http);
    EXPECT_EQ(cm.shell("echo hello"), "hello\n");
    EXPECT_THROW(cm.forward("tcp:7912"), TransportError);
    EXPECT_EQ(cm.dump_hierarchy(), "<hierarchy/>");

    auto targets = agent.targets();
    EXPECT_NE(std::find(targets.begin(), targets.end(), "/shell?command=echo%20hello&timeout=60"), targets.end());
    EXPECT_EQ(json::parse(agent.last_body()).value("method", ""), "dumpWindowHierarchy");
}

TEST(AgentTransport, JsonRpcErrorBecomesTransportError) {
    FakeAgent agent([](const std::string& target, const std::string&) {
        return pong_or(target, AgentReply{ 200,
            R"({"jsonrpc": "2.0", "id": 1, "error": {"code": -32002, "message": "UiObjectNotFoundException"}})" });
    });
    UiAutomatorClient client(UiEndpoint{ "127.0.0.1", agent.port() }, std::chrono::seconds(2));
    try {
        client.click(10, 20);
        FAIL() << "expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_NE(std::string(e.what()).find("UiObjectNotFoundException"), std::string::npos);
    }
    auto request = json::parse(agent.last_body());
    EXPECT_EQ(request["method"], "click");
    EXPECT_EQ(request["params"], json::array({ 10, 20 }));
}

TEST(AgentTransport, HttpErrorStatusBecomesTransportError) {
    FakeAgent agent([](const std::string& target, const std::string&) {
        return pong_or(target, AgentReply{ 502, "" });
    });
    UiAutomatorClient client(UiEndpoint{ "127.0.0.1", agent.port() }, std::chrono::seconds(2));
    EXPECT_TRUE(client.ping());
    EXPECT_THROW(client.dump_hierarchy(), TransportError);
    EXPECT_THROW(client.app_current(), TransportError);
}

TEST(AgentTransport, UiConnectRequiresPong) {
    FakeAgent agent([](const std::string&, const std::string&) { return AgentReply{ 500, "" }; });
    UiAutomatorTransport ui(std::chrono::seconds(2));
    EXPECT_THROW(ui.connect(parse_address("127.0.0.1:5555"), UiEndpoint{ "127.0.0.1", agent.port() }),
                 TransportError);
}

TEST(AgentTransport, EndpointSchemeIsKept) {
    AgentHttp tls(UiEndpoint{ "agent.example.com", 8443, "https" }, std::chrono::seconds(1));
    EXPECT_EQ(tls.base_url(), "https://agent.example.com:8443");
    AgentHttp plain(UiEndpoint{ "192.168.1.30", 7912 }, std::chrono::seconds(1));
    EXPECT_EQ(plain.base_url(), "http://192.168.1.30:7912");
}
