/**
 * WebSocketChannel.cpp - Posted Beast operations on a single I/O thread
 */

#include "emv/io/WebSocketChannel.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/connect.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/role.hpp>
#include <boost/beast/websocket.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace emv::io {

WebSocketChannel::WebSocketChannel()
    : work_(net::make_work_guard(ioc_)),
      ws_(ioc_) {
    thread_ = std::thread([this]() { ioc_.run(); });
}

WebSocketChannel::~WebSocketChannel() {
    shutdown();
    work_.reset();
    if (thread_.joinable()) thread_.join();
}

beast::error_code WebSocketChannel::adopt(tcp::socket socket) {
    const auto protocol = socket.local_endpoint().protocol();
    beast::error_code ec;
    const auto handle = socket.release(ec);
    if (ec) return ec;

    return await([this, protocol, handle](WebSocket& ws, Completion done) {
        beast::error_code assign_ec;
        ws.next_layer().assign(protocol, handle, assign_ec);
        if (!assign_ec && closed_) {
            ws.next_layer().close(assign_ec);
            assign_ec = net::error::operation_aborted;
        }
        done(assign_ec);
    });
}

void WebSocketChannel::connect(const std::string& host, const std::string& port, const std::string& path) {
    tcp::resolver resolver(ioc_);
    const auto results = resolver.resolve(host, port);  // throws

    beast::error_code ec = await([&results](WebSocket& ws, Completion done) {
        net::async_connect(ws.next_layer(), results,
                           [done](beast::error_code e, const tcp::endpoint&) { done(e); });
    });
    if (ec) throw beast::system_error(ec);

    const std::string target_host = host + ":" + port;
    ec = await([&target_host, &path](WebSocket& ws, Completion done) {
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.async_handshake(target_host, path, [done](beast::error_code e) { done(e); });
    });
    if (ec) throw beast::system_error(ec);
}

beast::error_code WebSocketChannel::read(std::string& data, bool& is_text) {
    beast::flat_buffer buffer;
    bool text = false;
    beast::error_code ec = await([&buffer, &text](WebSocket& ws, Completion done) {
        ws.async_read(buffer, [&ws, &text, done](beast::error_code e, std::size_t) {
            if (!e) text = ws.got_text();
            done(e);
        });
    });
    if (!ec) {
        data = beast::buffers_to_string(buffer.data());
        is_text = text;
    }
    return ec;
}

void WebSocketChannel::writeText(const std::string& text) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    beast::error_code ec = await([&text](WebSocket& ws, Completion done) {
        ws.text(true);
        ws.async_write(net::buffer(text), [done](beast::error_code e, std::size_t) { done(e); });
    });
    if (ec) throw beast::system_error(ec);
}

beast::error_code WebSocketChannel::close() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return await([](WebSocket& ws, Completion done) {
        if (!ws.is_open()) {
            done({});
            return;
        }
        ws.async_close(websocket::close_code::normal, [done](beast::error_code e) { done(e); });
    });
}

void WebSocketChannel::shutdown() {
    net::post(ioc_, [this]() {
        closed_ = true;
        beast::error_code ec;
        ws_.next_layer().shutdown(tcp::socket::shutdown_both, ec);
        ws_.next_layer().close(ec);
    });
}

} // namespace emv::io
