/**
 * Config.hpp - Service settings (environment driven)
 */

#pragma once

#include <string>

namespace emv {

struct Config {
    // Server
    std::string host = "0.0.0.0";
    int port = 8000;

    // Audio framing
    int sample_rate = 16000;
    int frame_ms = 20;

    // VAD / endpointing
    int vad_aggressiveness = 2;
    float vad_energy_floor = 0.004f;
    int endpoint_silence_ms = 450;
    int min_speech_ms = 250;
    int end_tail_ms = 120;
    int max_utterance_ms = 15000;

    // Barge-in: consecutive speech frames before a user turn starts
    int barge_in_lead_idle = 2;
    int barge_in_lead_active = 6;

    // Queues
    int inbound_queue_frames = 500;
    int outbound_queue_messages = 1800;

    // STT (whisper.cpp)
    std::string whisper_model = "models/whisper/ggml-base.en.bin";
    std::string whisper_language = "en";
    int whisper_threads = 4;

    // LLM (OpenAI-compatible chat completions)
    std::string llm_url = "http://127.0.0.1:11434/v1/chat/completions";
    std::string llm_model = "qwen2.5:7b-instruct";
    float llm_temperature = 0.7f;
    int llm_max_tokens = 220;
    int llm_timeout_ms = 90000;
    int llm_stream_timeout_ms = 120000;

    // Phrase commit
    int phrase_min_chars = 28;
    int phrase_max_chars = 120;
    int phrase_commit_pause_ms = 180;

    // TTS
    std::string tts_url = "http://127.0.0.1:5050";
    float tts_chunk_seconds = 0.35f;
    float tts_fade_ms = 4.0f;
    bool emotion_mode = true;

    std::string intro_phrase = "Hi! I'm here. What would you like to talk about?";

    // Backend RAG (disabled when empty)
    std::string backend_chat_url;
    int backend_timeout_ms = 60000;

    // Conversation memory
    double memory_window_minutes = 30.0;

    // External full-duplex speech core
    std::string speech_core_url = "ws://127.0.0.1:8080/ws";
    bool use_speech_core = false;
    bool speech_core_text_inject = false;

    // Profile defaults
    std::string default_assistant_name = "EchoMind";
    std::string default_user_name;
    std::string default_timezone = "America/New_York";
    std::string default_location;

    bool echo_debug = false;

    // Derived values
    int frameSamples() const { return sample_rate * frame_ms / 1000; }
    int frameBytes() const { return frameSamples() * 2; }
    int endpointSilenceFrames() const;
    int minSpeechFrames() const;
    int tailFrames() const;
    int maxUtteranceFrames() const;
    int leadIdle() const;
    int leadActive() const;

    /**
     * Build settings from the process environment.
     * Unset or unparsable variables keep their defaults.
     */
    static Config fromEnvironment();
};

} // namespace emv
