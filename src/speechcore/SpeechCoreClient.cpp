/**
 * SpeechCoreClient.cpp - Boost.Beast WebSocket client for the speech core
 *
 * Stream I/O runs on a WebSocketChannel; a reader thread relays audio_out
 * frames. Malformed frames are dropped, never fatal.
 */

#include "emv/speechcore/SpeechCoreClient.hpp"
#include "emv/audio/PlaybackEncoder.hpp"
#include "emv/io/WebSocketChannel.hpp"
#include "emv/protocol/Base64.hpp"

#include <atomic>
#include <iostream>
#include <thread>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using json = nlohmann::json;

namespace emv::speechcore {

struct SpeechCoreClient::Impl {
    std::string host;
    std::string port = "80";
    std::string path = "/";

    io::WebSocketChannel channel;
    std::thread reader;
    std::atomic<bool> open{false};
    AudioHandler on_audio;

    explicit Impl(const std::string& url) {
        std::string rest = url;
        const auto scheme = rest.find("://");
        if (scheme != std::string::npos) rest = rest.substr(scheme + 3);

        const auto slash = rest.find('/');
        if (slash != std::string::npos) {
            path = rest.substr(slash);
            rest = rest.substr(0, slash);
        }
        const auto colon = rest.rfind(':');
        if (colon != std::string::npos) {
            port = rest.substr(colon + 1);
            rest = rest.substr(0, colon);
        }
        host = rest;
    }

    bool send(const json& msg) {
        if (!open) return false;
        try {
            channel.writeText(msg.dump());
        } catch (const std::exception& e) {
            std::cerr << "[SpeechCore] Send failed: " << e.what() << std::endl;
            open = false;
            return false;
        }
        return true;
    }

    void readLoop() {
        try {
            while (open) {
                std::string data;
                bool is_text = false;
                const beast::error_code ec = channel.read(data, is_text);
                if (ec) {
                    if (ec != websocket::error::closed && open) {
                        std::cerr << "[SpeechCore] Read failed: " << ec.message() << std::endl;
                    }
                    break;
                }
                if (is_text) handleText(data);
            }
        } catch (const std::exception& e) {
            std::cerr << "[SpeechCore] Reader stopped: " << e.what() << std::endl;
        }
        open = false;
    }

    void handleText(const std::string& text) {
        json msg = json::parse(text, nullptr, false);
        if (msg.is_discarded() || !msg.is_object()) return;

        auto type = msg.find("type");
        if (type == msg.end() || !type->is_string() || type->get<std::string>() != "audio_out") return;

        auto b64 = msg.find("pcm16_b64");
        if (b64 == msg.end() || !b64->is_string() || b64->get<std::string>().empty()) {
            std::cerr << "[SpeechCore] Dropping audio_out without pcm16_b64" << std::endl;
            return;
        }
        auto pcm = protocol::base64Decode(b64->get<std::string>());
        if (!pcm) {
            std::cerr << "[SpeechCore] Dropping audio_out with invalid base64" << std::endl;
            return;
        }

        std::optional<uint64_t> generation;
        auto gen = msg.find("generation_id");
        if (gen != msg.end() && gen->is_number_unsigned()) generation = gen->get<uint64_t>();

        int sample_rate = 24000;
        auto rate = msg.find("sample_rate");
        if (rate != msg.end() && rate->is_number_integer()) {
            const auto value = rate->get<int64_t>();
            if (value <= 0 || value > audio::PlaybackEncoder::MAX_SAMPLE_RATE) {
                std::cerr << "[SpeechCore] Dropping audio_out with sample_rate " << value << std::endl;
                return;
            }
            sample_rate = static_cast<int>(value);
        }

        if (on_audio) on_audio(generation, sample_rate, std::move(*pcm));
    }
};

SpeechCoreClient::SpeechCoreClient(const std::string& url)
    : impl_(std::make_unique<Impl>(url)) {
}

SpeechCoreClient::~SpeechCoreClient() {
    close();
}

bool SpeechCoreClient::connect(AudioHandler on_audio) {
    impl_->on_audio = std::move(on_audio);
    try {
        impl_->channel.connect(impl_->host, impl_->port, impl_->path);
    } catch (const boost::system::system_error& e) {
        std::cerr << "[SpeechCore] Connect to " << impl_->host << ":" << impl_->port << impl_->path
                  << " failed: " << e.what() << std::endl;
        return false;
    }

    impl_->open = true;
    impl_->reader = std::thread([this]() { impl_->readLoop(); });
    std::cout << "[SpeechCore] Connected to " << impl_->host << ":" << impl_->port << impl_->path << std::endl;
    return true;
}

void SpeechCoreClient::close() {
    const bool was_open = impl_->open.exchange(false);
    if (was_open) {
        const beast::error_code ec = impl_->channel.close();
        if (ec && ec != websocket::error::closed) {
            std::cerr << "[SpeechCore] Close handshake failed: " << ec.message() << std::endl;
        }
    }
    impl_->channel.shutdown();
    if (impl_->reader.joinable()) {
        impl_->reader.join();
    }
}

bool SpeechCoreClient::isOpen() const {
    return impl_->open;
}

void SpeechCoreClient::sendAudio(const std::string& pcm16, int sample_rate) {
    impl_->send({{"type", "audio"}, {"sample_rate", sample_rate}, {"pcm16_b64", protocol::base64Encode(pcm16)}});
}

void SpeechCoreClient::textInject(const std::string& text, uint64_t generation) {
    impl_->send({{"type", "text_inject"}, {"text", text}, {"generation_id", generation}});
}

void SpeechCoreClient::cancel(uint64_t generation) {
    impl_->send({{"type", "cancel"}, {"generation_id", generation}});
}

} // namespace emv::speechcore
