/**
 * EchoMind Voice - Main Entry Point
 *
 * Realtime voice assistant service: browser clients stream microphone PCM
 * over a WebSocket and get transcripts, streamed replies and TTS audio back.
 */

#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>

#include "emv/Config.hpp"
#include "emv/audio/VADProcessor.hpp"
#include "emv/llm/LLMClient.hpp"
#include "emv/rag/BackendClient.hpp"
#include "emv/server/VoiceServer.hpp"
#include "emv/speechcore/SpeechCoreClient.hpp"
#include "emv/stt/STTEngine.hpp"
#include "emv/tts/TTSEngine.hpp"

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

int main() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << R"(
    ╔═══════════════════════════════════════════════╗
    ║           ECHOMIND VOICE v0.2.0               ║
    ║   Realtime voice sessions over WebSockets     ║
    ╚═══════════════════════════════════════════════╝
    )" << std::endl;

    const emv::Config config = emv::Config::fromEnvironment();

    std::cout << "[EMV] Initializing..." << std::endl;

    // Adapters are process-wide; sessions share them
    emv::session::Collaborators collaborators;

    auto stt = std::make_shared<emv::stt::STTEngine>(
        config.whisper_model, config.whisper_language, config.whisper_threads);
    if (!stt->isReady()) {
        std::cerr << "[EMV] STT model unavailable, transcription requests will fail" << std::endl;
    }
    collaborators.stt = stt;

    emv::llm::LLMOptions llm_options;
    llm_options.model = config.llm_model;
    llm_options.temperature = config.llm_temperature;
    llm_options.max_tokens = config.llm_max_tokens;
    llm_options.timeout_ms = config.llm_timeout_ms;
    llm_options.stream_timeout_ms = config.llm_stream_timeout_ms;
    auto llm = std::make_shared<emv::llm::LLMClient>(config.llm_url, llm_options);
    if (!llm->isHealthy()) {
        std::cerr << "[EMV] LLM endpoint not reachable yet: " << config.llm_url << std::endl;
    }
    collaborators.llm = llm;

    auto tts = std::make_shared<emv::tts::TTSEngine>(config.tts_url);
    if (!tts->isHealthy()) {
        std::cerr << "[EMV] TTS server not reachable yet: " << config.tts_url << std::endl;
    }
    collaborators.tts = tts;

    if (!config.backend_chat_url.empty()) {
        collaborators.knowledge_base =
            std::make_shared<emv::rag::BackendClient>(config.backend_chat_url, config.backend_timeout_ms);
        std::cout << "[EMV] Knowledge base: " << config.backend_chat_url << std::endl;
    }

    collaborators.make_classifier = [config]() -> std::unique_ptr<emv::audio::FrameClassifier> {
        return std::make_unique<emv::audio::VADProcessor>(
            config.sample_rate,
            static_cast<emv::audio::VADMode>(config.vad_aggressiveness),
            config.frame_ms);
    };

    if (config.use_speech_core) {
        collaborators.make_speech_core = [url = config.speech_core_url]() -> std::unique_ptr<emv::speechcore::SpeechCore> {
            return std::make_unique<emv::speechcore::SpeechCoreClient>(url);
        };
        std::cout << "[EMV] Speech core: " << config.speech_core_url << std::endl;
    }

    emv::server::VoiceServer server(config, std::move(collaborators));
    try {
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "[EMV] Failed to start server: " << e.what() << std::endl;
        return 1;
    }

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[EMV] Shutting down..." << std::endl;
    server.stop();

    std::cout << "[EMV] Goodbye!" << std::endl;
    return 0;
}
