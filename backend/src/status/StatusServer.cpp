#include "status/StatusServer.hpp"
#include "status/StatusProtocol.hpp"
#include <iostream>
#include <chrono>
#include <functional>
// Boost.Beast / Asio for WebSocket
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <mutex>
#include <set>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace droidlink {

using WsStream = websocket::stream<tcp::socket>;

// Implementation details hidden behind PIMPL
struct StatusServer::Impl {
    asio::io_context ioc;
    tcp::acceptor acceptor;
    std::mutex sessions_m;
    std::set<std::shared_ptr<WsStream>> sessions;
    bool listening = false;

    Impl(int port): ioc(), acceptor(ioc) {
        boost::system::error_code ec;
        acceptor.open(tcp::v4(), ec);
        if (ec) {
            std::cerr << "StatusServer: acceptor.open failed: " << ec.message() << std::endl;
            return;
        }
        acceptor.set_option(asio::socket_base::reuse_address(true), ec);
        acceptor.bind(tcp::endpoint(tcp::v4(), port), ec);
        if (ec) {
            std::cerr << "StatusServer: bind to port " << port << " failed: " << ec.message() << std::endl;
            return;
        }
        acceptor.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) {
            std::cerr << "StatusServer: listen failed: " << ec.message() << std::endl;
            return;
        }
        listening = true;
    }

    void add_session(std::shared_ptr<WsStream> s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        sessions.insert(s);
        std::cout << "StatusServer: client connected (count=" << sessions.size() << ")" << std::endl;
    }
    void remove_session(std::shared_ptr<WsStream> s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        sessions.erase(s);
        std::cout << "StatusServer: client disconnected (count=" << sessions.size() << ")" << std::endl;
    }
    template<typename Fn>
    void for_each_session(Fn&& fn) {
        std::lock_guard<std::mutex> lk(sessions_m);
        for (auto &s : sessions) fn(s);
    }

    static void send(std::shared_ptr<WsStream> s, std::string payload) {
        asio::post(s->get_executor(), [s, payload]() {
            boost::system::error_code ec;
            s->text(true);
            s->write(asio::buffer(payload), ec);
            // a failed write is cleaned up by the session read loop
        });
    }
};

StatusServer::StatusServer(int p, StatusProtocol& proto, std::chrono::milliseconds broadcast_interval)
: port_(p), interval_(broadcast_interval), running(false), protocol(proto) {}

StatusServer::~StatusServer() {
    stop();
}

void StatusServer::start() {
    if (running) return;
    impl = std::make_shared<Impl>(port_);
    if (!impl->listening) {
        impl.reset();
        return;
    }
    running = true;
    event_thread = std::thread([this](){ run_event_loop(); });
    broadcast_thread = std::thread([this](){ broadcast_status_loop(); });
    std::cout << "StatusServer: listening on port " << port_ << std::endl;
}

void StatusServer::stop() {
    running = false;
    if (event_thread.joinable()) event_thread.join();
    if (broadcast_thread.joinable()) broadcast_thread.join();
}

void StatusServer::run_event_loop() {
    try {
        auto& ioc = impl->ioc;
        auto& acceptor = impl->acceptor;

        std::function<void()> do_accept;
        do_accept = [&]() {
            auto socket = std::make_shared<tcp::socket>(ioc);
            acceptor.async_accept(*socket, [this, socket, &do_accept](boost::system::error_code ec) {
                if (ec) {
                    if (running) std::cerr << "StatusServer: accept error: " << ec.message() << std::endl;
                } else {
                    auto ws = std::make_shared<WsStream>(std::move(*socket));
                    ws->async_accept([this, ws](boost::system::error_code ec) {
                        if (ec) {
                            std::cerr << "StatusServer: websocket accept failed: " << ec.message() << std::endl;
                            return;
                        }
                        impl->add_session(ws);
                        Impl::send(ws, protocol.build_status_message().dump());

                        // read loop: keeps the connection alive and receives control messages
                        auto buffer = std::make_shared<beast::flat_buffer>();
                        auto do_read = std::make_shared<std::function<void()>>();
                        *do_read = [this, ws, buffer, do_read]() {
                            ws->async_read(*buffer, [this, ws, buffer, do_read](boost::system::error_code ec, std::size_t) {
                                if (ec) {
                                    impl->remove_session(ws);
                                    *do_read = nullptr;
                                    return;
                                }
                                auto data = beast::buffers_to_string(buffer->data());
                                buffer->consume(buffer->size());
                                nlohmann::json reply;
                                try {
                                    reply = handle_control(nlohmann::json::parse(data));
                                } catch (const nlohmann::json::exception& e) {
                                    reply = { {"type", "reply"}, {"ok", false}, {"error", std::string("bad message: ") + e.what()} };
                                }
                                Impl::send(ws, reply.dump());
                                (*do_read)();
                            });
                        };
                        (*do_read)();
                    });
                }
                if (running) do_accept();
            });
        };

        do_accept();

        // non-blocking poll loop so stop() is observed
        while (running) {
            try {
                impl->ioc.poll();
            } catch (const std::exception& e) {
                std::cerr << "StatusServer: I/O context error: " << e.what() << std::endl;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }

        impl->for_each_session([&](std::shared_ptr<WsStream> s){
            boost::system::error_code ec;
            s->close(websocket::close_code::normal, ec);
        });
        boost::system::error_code ec;
        acceptor.close(ec);
    } catch (const std::exception& e) {
        std::cerr << "StatusServer: run_event_loop exception: " << e.what() << std::endl;
    }
}

nlohmann::json StatusServer::handle_control(const nlohmann::json& msg) {
    auto reply = protocol.handle_command(msg);
    std::cout << "StatusServer: control " << msg.value("cmd", std::string("?"))
              << " -> " << (reply.value("ok", true) ? "ok" : "failed") << std::endl;
    return reply;
}

void StatusServer::broadcast_status_loop() {
    auto next = std::chrono::steady_clock::now();
    while (running) {
        if (std::chrono::steady_clock::now() >= next) {
            try {
                auto payload = protocol.build_status_message().dump();
                if (impl) {
                    impl->for_each_session([&](std::shared_ptr<WsStream> s){
                        Impl::send(s, payload);
                    });
                }
            } catch (const std::exception& e) {
                std::cerr << "StatusServer: broadcast error: " << e.what() << std::endl;
            }
            next += interval_;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

} // namespace droidlink
