/**
 * VoiceServer.cpp - Boost.Beast acceptor with one thread per connection
 *
 * The acceptor runs asynchronously on its own io_context thread. Each
 * accepted socket is handed to a WebSocketChannel and served from a
 * TaskGroup thread: the first HTTP request either upgrades to a WebSocket
 * on /ws or gets a plain reply. All stream I/O happens on the channel's
 * thread, so the session's sender and the reading loop never race.
 */

#include "emv/server/VoiceServer.hpp"
#include "emv/core/TaskGroup.hpp"
#include "emv/io/WebSocketChannel.hpp"
#include "emv/protocol/Messages.hpp"

#include <atomic>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <random>
#include <set>
#include <sstream>
#include <thread>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace emv::server {

namespace {

class WebSocketTransport : public session::Transport {
public:
    explicit WebSocketTransport(io::WebSocketChannel& channel) : channel_(channel) {}

    void sendText(const std::string& text) override {
        channel_.writeText(text);  // throws beast::system_error
    }

private:
    io::WebSocketChannel& channel_;
};

http::response<http::string_body> makeResponse(const http::request<http::string_body>& req,
                                               http::status status, const json& body) {
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::server, "EchoMind Voice");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

} // anonymous namespace

struct VoiceServer::Impl {
    Config config;
    session::Collaborators collaborators;

    net::io_context ioc;
    tcp::acceptor acceptor{ioc};
    std::thread accept_thread;
    std::atomic<bool> running{false};
    unsigned short bound_port = 0;

    core::TaskGroup connections;
    std::mutex channels_mutex;
    std::set<std::shared_ptr<io::WebSocketChannel>> channels;
    std::atomic<size_t> active_sessions{0};

    Impl(const Config& cfg, session::Collaborators c)
        : config(cfg), collaborators(std::move(c)) {}

    void doAccept() {
        acceptor.async_accept([this](beast::error_code ec, tcp::socket socket) {
            if (ec) {
                if (running) {
                    std::cerr << "[VoiceServer] Accept failed: " << ec.message() << std::endl;
                }
            } else {
                spawnConnection(std::move(socket));
            }
            if (running && acceptor.is_open()) doAccept();
        });
    }

    void spawnConnection(tcp::socket socket) {
        auto channel = std::make_shared<io::WebSocketChannel>();
        {
            std::lock_guard<std::mutex> lock(channels_mutex);
            channels.insert(channel);
        }

        // std::function needs a copyable callable
        auto shared_socket = std::make_shared<tcp::socket>(std::move(socket));
        connections.spawn("connection", [this, channel, shared_socket](const core::TaskHandle&) {
            try {
                serve(*channel, std::move(*shared_socket));
            } catch (const std::exception& e) {
                std::cerr << "[VoiceServer] Connection failed: " << e.what() << std::endl;
            }
            std::lock_guard<std::mutex> lock(channels_mutex);
            channels.erase(channel);
        });
    }

    void serve(io::WebSocketChannel& channel, tcp::socket socket) {
        if (channel.adopt(std::move(socket))) return;

        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        beast::error_code ec = channel.await([&buffer, &req](io::WebSocket& ws, io::Completion done) {
            http::async_read(ws.next_layer(), buffer, req,
                             [done](beast::error_code e, std::size_t) { done(e); });
        });
        if (ec) return;

        if (websocket::is_upgrade(req) && req.target() == "/ws") {
            serveSession(channel, req);
            return;
        }

        http::response<http::string_body> res;
        if (req.method() == http::verb::get && req.target() == "/health") {
            res = makeResponse(req, http::status::ok, {{"status", "ok"}});
        } else {
            res = makeResponse(req, http::status::not_found, {{"error", "not found"}});
        }
        ec = channel.await([&res](io::WebSocket& ws, io::Completion done) {
            http::async_write(ws.next_layer(), res, [done](beast::error_code e, std::size_t) { done(e); });
        });
        if (ec && running) {
            std::cerr << "[VoiceServer] Response write failed: " << ec.message() << std::endl;
        }
        channel.shutdown();
    }

    void serveSession(io::WebSocketChannel& channel, const http::request<http::string_body>& req) {
        beast::error_code ec = channel.await([&req](io::WebSocket& ws, io::Completion done) {
            ws.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
                res.set(http::field::server, "EchoMind Voice");
            }));
            ws.async_accept(req, [done](beast::error_code e) { done(e); });
        });
        if (ec) {
            std::cerr << "[VoiceServer] WebSocket handshake failed: " << ec.message() << std::endl;
            return;
        }

        auto transport = std::make_shared<WebSocketTransport>(channel);
        session::VoiceSession session(VoiceServer::newSessionId(), config, collaborators, transport);
        ++active_sessions;
        std::cout << "[VoiceServer] Session opened: " << session.id() << std::endl;

        try {
            session.start();

            while (running) {
                std::string data;
                bool is_text = false;
                ec = channel.read(data, is_text);
                if (ec) {
                    if (ec != websocket::error::closed && ec != net::error::eof &&
                        ec != net::error::operation_aborted && running) {
                        std::cerr << "[VoiceServer] Read failed: " << ec.message() << std::endl;
                    }
                    break;
                }

                if (is_text) {
                    session.onText(data);
                } else {
                    session.onBinary(data);
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[VoiceServer] Session " << session.id() << " failed: " << e.what() << std::endl;
            try {
                transport->sendText(protocol::encode(protocol::out::Error{"session", e.what(), std::nullopt}));
            } catch (const std::exception& send_error) {
                std::cerr << "[VoiceServer] Could not report error: " << send_error.what() << std::endl;
            }
        }

        // Stops the sender before the close handshake takes the stream
        session.close();
        --active_sessions;
        std::cout << "[VoiceServer] Session closed: " << session.id() << std::endl;

        ec = channel.close();
        if (ec && running) {
            std::cerr << "[VoiceServer] Close handshake failed: " << ec.message() << std::endl;
        }
        channel.shutdown();
    }

    void shutdownChannels() {
        std::lock_guard<std::mutex> lock(channels_mutex);
        for (const auto& channel : channels) channel->shutdown();
    }
};

VoiceServer::VoiceServer(const Config& config, session::Collaborators collaborators)
    : impl_(std::make_unique<Impl>(config, std::move(collaborators))) {
}

VoiceServer::~VoiceServer() {
    stop();
}

void VoiceServer::start() {
    if (impl_->running) return;

    const tcp::endpoint endpoint{net::ip::make_address(impl_->config.host),
                                 static_cast<unsigned short>(impl_->config.port)};
    impl_->acceptor.open(endpoint.protocol());
    impl_->acceptor.set_option(net::socket_base::reuse_address(true));
    impl_->acceptor.bind(endpoint);
    impl_->acceptor.listen(net::socket_base::max_listen_connections);
    impl_->bound_port = impl_->acceptor.local_endpoint().port();

    impl_->running = true;
    impl_->doAccept();
    impl_->accept_thread = std::thread([this]() { impl_->ioc.run(); });

    std::cout << "[VoiceServer] Listening on " << impl_->config.host << ":" << impl_->bound_port
              << " (ws path /ws, health /health)" << std::endl;
}

void VoiceServer::stop() {
    if (!impl_->running.exchange(false)) return;

    net::post(impl_->ioc, [this]() {
        beast::error_code ec;
        impl_->acceptor.close(ec);
    });
    if (impl_->accept_thread.joinable()) impl_->accept_thread.join();

    impl_->shutdownChannels();
    impl_->connections.joinAll();
    std::cout << "[VoiceServer] Stopped" << std::endl;
}

bool VoiceServer::isRunning() const {
    return impl_->running;
}

size_t VoiceServer::activeSessions() const {
    return impl_->active_sessions;
}

unsigned short VoiceServer::port() const {
    return impl_->bound_port;
}

std::string VoiceServer::newSessionId() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

    std::ostringstream out;
    out << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return out.str();
}

} // namespace emv::server
