/**
 * WebSocketChannel.hpp - One Beast WebSocket stream owned by its own I/O thread
 *
 * Every operation on the stream (HTTP upgrade, reads, writes, close, socket
 * teardown) runs on the channel's io_context thread. Callers on other
 * threads post the operation and block on its completion, so a reader and a
 * writer never touch the stream concurrently.
 */

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/websocket/stream.hpp>

namespace emv::io {

using WebSocket = boost::beast::websocket::stream<boost::asio::ip::tcp::socket>;
using Completion = std::function<void(boost::beast::error_code)>;

class WebSocketChannel {
public:
    WebSocketChannel();
    ~WebSocketChannel();

    WebSocketChannel(const WebSocketChannel&) = delete;
    WebSocketChannel& operator=(const WebSocketChannel&) = delete;

    /**
     * Run `initiate(stream, done)` on the I/O thread and wait until it
     * calls `done(ec)`. The initiator must start exactly one asynchronous
     * operation (or call `done` directly).
     */
    template <typename Initiate>
    boost::beast::error_code await(Initiate initiate) {
        auto done = std::make_shared<std::promise<boost::beast::error_code>>();
        auto result = done->get_future();
        boost::asio::post(ioc_, [this, done, initiate = std::move(initiate)]() mutable {
            initiate(ws_, [done](boost::beast::error_code ec) { done->set_value(ec); });
        });
        return result.get();
    }

    /// Take over an accepted socket. Fails if shutdown() already ran.
    boost::beast::error_code adopt(boost::asio::ip::tcp::socket socket);

    /// Resolve, connect and perform the client handshake. Throws beast::system_error.
    void connect(const std::string& host, const std::string& port, const std::string& path);

    /// Next complete message. `is_text` tells text from binary frames.
    boost::beast::error_code read(std::string& data, bool& is_text);

    /// Serialized with other writes and close(). Throws beast::system_error.
    void writeText(const std::string& text);

    /// Close handshake; a no-op once the stream is no longer open.
    boost::beast::error_code close();

    /// Tear the socket down from any thread without waiting; pending reads fail.
    void shutdown();

private:
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    WebSocket ws_;
    bool closed_ = false;  // I/O thread only
    std::mutex write_mutex_;
    std::thread thread_;
};

} // namespace emv::io
