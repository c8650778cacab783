/**
 * test_voice_server.cpp - Health endpoint, routing and a WebSocket session end to end
 */

#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <regex>
#include <set>
#include <thread>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "emv/audio/Pcm.hpp"
#include "emv/server/VoiceServer.hpp"

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

class AlwaysSpeech : public emv::audio::FrameClassifier {
public:
    bool isSpeech(const emv::audio::Frame&) override { return true; }
};

class EchoTranscriber : public emv::stt::Transcriber {
public:
    std::string transcribe(const std::vector<float>&) override { return "how are you"; }
};

class CannedChatModel : public emv::llm::ChatModel {
public:
    void streamTokens(const std::vector<emv::llm::Message>&, const emv::llm::TokenCallback& on_token) override {
        for (const char* t : {"I am", " fine", "."}) {
            if (!on_token(t)) return;
        }
    }
    std::string complete(const std::vector<emv::llm::Message>&) override { return "I am fine."; }
};

class SilentSynthesizer : public emv::tts::Synthesizer {
public:
    explicit SilentSynthesizer(size_t samples = 4800) : samples_(samples) {}

    emv::tts::Synthesis synthesize(const std::string&) override {
        return {std::vector<float>(samples_, 0.0f), 24000};
    }

private:
    size_t samples_;
};

emv::session::Collaborators fakes(size_t tts_samples = 4800) {
    emv::session::Collaborators c;
    c.stt = std::make_shared<EchoTranscriber>();
    c.llm = std::make_shared<CannedChatModel>();
    c.tts = std::make_shared<SilentSynthesizer>(tts_samples);
    c.make_classifier = []() { return std::make_unique<AlwaysSpeech>(); };
    return c;
}

emv::Config testConfig() {
    emv::Config config;
    config.host = "127.0.0.1";
    config.port = 0;
    config.intro_phrase = "";
    config.endpoint_silence_ms = 100;
    config.min_speech_ms = 100;
    return config;
}

json readJson(websocket::stream<tcp::socket>& ws) {
    beast::flat_buffer buffer;
    ws.read(buffer);
    assert(ws.got_text());
    return json::parse(beast::buffers_to_string(buffer.data()));
}

bool eventually(const std::function<bool()>& condition) {
    for (int i = 0; i < 500; ++i) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

void connect(websocket::stream<tcp::socket>& ws, unsigned short port) {
    ws.next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    ws.handshake("127.0.0.1", "/ws");
}

} // anonymous namespace

void test_session_ids() {
    std::cout << "\n--- Test: Session ids ---" << std::endl;
    const std::regex uuid4("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        const std::string id = emv::server::VoiceServer::newSessionId();
        assert(std::regex_match(id, uuid4));
        seen.insert(id);
    }
    assert(seen.size() == 100);

    std::cout << "[PASS] Random version 4 UUIDs" << std::endl;
}

void test_health_and_routing() {
    std::cout << "\n--- Test: Health endpoint ---" << std::endl;
    emv::server::VoiceServer server(testConfig(), fakes());
    server.start();
    assert(server.isRunning());
    assert(server.port() != 0);

    httplib::Client client("127.0.0.1", server.port());
    auto res = client.Get("/health");
    assert(res && res->status == 200);
    assert(json::parse(res->body)["status"] == "ok");

    res = client.Get("/nowhere");
    assert(res && res->status == 404);

    server.stop();
    assert(!server.isRunning());

    std::cout << "[PASS] /health ok, unknown paths 404" << std::endl;
}

void test_websocket_session() {
    std::cout << "\n--- Test: WebSocket session ---" << std::endl;
    const emv::Config config = testConfig();
    emv::server::VoiceServer server(config, fakes());
    server.start();

    net::io_context ioc;
    websocket::stream<tcp::socket> ws(ioc);
    ws.next_layer().connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), server.port()));
    ws.handshake("127.0.0.1", "/ws");

    json hello = readJson(ws);
    assert(hello["type"] == "hello");
    assert(hello["session_id"].get<std::string>().size() == 36);
    assert(readJson(ws)["type"] == "context_ack");
    assert(readJson(ws)["type"] == "profile_update");
    assert(server.activeSessions() == 1);

    ws.text(true);
    ws.write(net::buffer(std::string("not json")));
    json err = readJson(ws);
    assert(err["type"] == "error" && err["where"] == "protocol");

    // 20 speech frames then silence, as binary PCM16
    ws.binary(true);
    const std::string loud = emv::audio::floatToPcm16(std::vector<float>(config.frameSamples(), 0.3f));
    const std::string quiet = emv::audio::floatToPcm16(std::vector<float>(config.frameSamples(), 0.0f));
    for (int i = 0; i < 20; ++i) ws.write(net::buffer(loud));
    for (int i = 0; i < 8; ++i) ws.write(net::buffer(quiet));

    std::string transcript;
    std::string reply;
    bool back_to_listening = false;
    while (!back_to_listening) {
        json msg = readJson(ws);
        if (msg["type"] == "asr_final") transcript = msg["text"];
        if (msg["type"] == "assistant_text") reply = msg["text"];
        if (msg["type"] == "event" && msg["event"] == "BACK_TO_LISTENING") back_to_listening = true;
    }
    assert(transcript == "how are you");
    assert(reply == "I am fine.");

    ws.close(websocket::close_code::normal);
    server.stop();
    assert(server.activeSessions() == 0);

    std::cout << "[PASS] Handshake, protocol error and a full turn over /ws" << std::endl;
}

void test_client_drops_during_playback() {
    std::cout << "\n--- Test: Client vanishes mid-playback ---" << std::endl;
    emv::Config config = testConfig();
    config.intro_phrase = "Hello, I am listening.";
    // A minute of audio keeps the sender writing when the socket goes away
    emv::server::VoiceServer server(config, fakes(24000 * 60));
    server.start();

    for (int round = 0; round < 3; ++round) {
        net::io_context ioc;
        websocket::stream<tcp::socket> ws(ioc);
        connect(ws, server.port());

        bool audio_seen = false;
        while (!audio_seen) {
            json msg = readJson(ws);
            audio_seen = msg["type"] == "audio_out";
        }

        // No close handshake
        beast::error_code ec;
        ws.next_layer().shutdown(tcp::socket::shutdown_both, ec);
        ws.next_layer().close(ec);
        assert(eventually([&]() { return server.activeSessions() == 0; }));
    }

    server.stop();
    assert(!server.isRunning());
    std::cout << "[PASS] Session torn down while its sender was writing" << std::endl;
}

void test_stop_with_live_sessions() {
    std::cout << "\n--- Test: Stop with live sessions ---" << std::endl;
    emv::Config config = testConfig();
    config.intro_phrase = "Hello, I am listening.";
    emv::server::VoiceServer server(config, fakes(24000 * 60));
    server.start();

    net::io_context ioc;
    websocket::stream<tcp::socket> streaming(ioc);
    websocket::stream<tcp::socket> idle(ioc);
    connect(streaming, server.port());
    connect(idle, server.port());
    assert(readJson(idle)["type"] == "hello");
    assert(readJson(streaming)["type"] == "hello");
    assert(eventually([&]() { return server.activeSessions() == 2; }));

    // A plain HTTP connection that never sends its request
    tcp::socket silent(ioc);
    silent.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), server.port()));

    server.stop();
    assert(server.activeSessions() == 0);

    // Both peers eventually see the connection end
    for (auto* ws : {&streaming, &idle}) {
        beast::error_code ec;
        while (!ec) {
            beast::flat_buffer buffer;
            ws->read(buffer, ec);
        }
    }
    std::cout << "[PASS] stop() unblocks readers, writers and pending upgrades" << std::endl;
}

int main() {
    std::cout << "=== Voice Server Tests ===" << std::endl;

    test_session_ids();
    test_health_and_routing();
    test_websocket_session();
    test_client_drops_during_playback();
    test_stop_with_live_sessions();

    std::cout << "\nAll voice server tests passed!" << std::endl;
    return 0;
}
