/**
 * Config.cpp - Environment parsing for service settings
 */

#include "emv/Config.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

namespace emv {

namespace {

const char* lookup(const char* key) {
    const char* value = std::getenv(key);
    if (!value || !*value) return nullptr;
    return value;
}

void readString(const char* key, std::string& out) {
    if (const char* v = lookup(key)) out = v;
}

void readInt(const char* key, int& out) {
    const char* v = lookup(key);
    if (!v) return;
    try {
        out = std::stoi(v);
    } catch (const std::exception&) {
        std::cerr << "[Config] Ignoring invalid integer " << key << "=" << v << std::endl;
    }
}

void readFloat(const char* key, float& out) {
    const char* v = lookup(key);
    if (!v) return;
    try {
        out = std::stof(v);
    } catch (const std::exception&) {
        std::cerr << "[Config] Ignoring invalid number " << key << "=" << v << std::endl;
    }
}

void readDouble(const char* key, double& out) {
    const char* v = lookup(key);
    if (!v) return;
    try {
        out = std::stod(v);
    } catch (const std::exception&) {
        std::cerr << "[Config] Ignoring invalid number " << key << "=" << v << std::endl;
    }
}

void readFlag(const char* key, bool& out) {
    if (const char* v = lookup(key)) out = std::string(v) == "1";
}

} // anonymous namespace

int Config::endpointSilenceFrames() const {
    return std::max(1, endpoint_silence_ms / frame_ms);
}

int Config::minSpeechFrames() const {
    return std::max(1, min_speech_ms / frame_ms);
}

int Config::tailFrames() const {
    return std::max(0, end_tail_ms / frame_ms);
}

int Config::maxUtteranceFrames() const {
    return std::max(1, max_utterance_ms / frame_ms);
}

int Config::leadIdle() const {
    return std::max(1, barge_in_lead_idle);
}

int Config::leadActive() const {
    return std::max(1, barge_in_lead_active);
}

Config Config::fromEnvironment() {
    Config c;

    readString("EMV_HOST", c.host);
    readInt("EMV_PORT", c.port);

    readInt("SR", c.sample_rate);
    readInt("FRAME_MS", c.frame_ms);
    if (c.frame_ms != 10 && c.frame_ms != 20 && c.frame_ms != 30) {
        std::cerr << "[Config] FRAME_MS must be 10, 20 or 30 (got " << c.frame_ms
                  << "), using 20" << std::endl;
        c.frame_ms = 20;
    }

    readInt("VAD_AGGR", c.vad_aggressiveness);
    c.vad_aggressiveness = std::clamp(c.vad_aggressiveness, 0, 3);
    readFloat("VAD_ENERGY_FLOOR", c.vad_energy_floor);
    readInt("ENDPOINT_SILENCE_MS", c.endpoint_silence_ms);
    readInt("MIN_SPEECH_MS", c.min_speech_ms);
    readInt("END_TAIL_MS", c.end_tail_ms);
    readInt("MAX_UTTERANCE_MS", c.max_utterance_ms);
    readInt("BARGE_IN_SPEECH_LEAD_IDLE", c.barge_in_lead_idle);
    readInt("BARGE_IN_SPEECH_LEAD_ACTIVE", c.barge_in_lead_active);

    readInt("INBOUND_QUEUE_FRAMES", c.inbound_queue_frames);
    readInt("OUTBOUND_QUEUE_MESSAGES", c.outbound_queue_messages);

    readString("WHISPER_MODEL", c.whisper_model);
    readString("WHISPER_LANGUAGE", c.whisper_language);
    readInt("WHISPER_THREADS", c.whisper_threads);

    readString("LLM_URL", c.llm_url);
    readString("LLM_MODEL", c.llm_model);
    readFloat("LLM_TEMPERATURE", c.llm_temperature);
    readInt("LLM_MAX_TOKENS", c.llm_max_tokens);
    readInt("LLM_TIMEOUT_MS", c.llm_timeout_ms);
    readInt("LLM_STREAM_TIMEOUT_MS", c.llm_stream_timeout_ms);

    readInt("PHRASE_MIN_CHARS", c.phrase_min_chars);
    readInt("PHRASE_MAX_CHARS", c.phrase_max_chars);
    readInt("PHRASE_COMMIT_PAUSE_MS", c.phrase_commit_pause_ms);

    readString("TTS_URL", c.tts_url);
    readFloat("TTS_CHUNK_SECONDS", c.tts_chunk_seconds);
    readFloat("TTS_FADE_MS", c.tts_fade_ms);
    readFlag("EMOTION_MODE", c.emotion_mode);

    // INTRO_PHRASE may be deliberately set to empty to disable the greeting
    if (const char* intro = std::getenv("INTRO_PHRASE")) c.intro_phrase = intro;

    readString("BACKEND_CHAT_URL", c.backend_chat_url);
    readInt("BACKEND_TIMEOUT_MS", c.backend_timeout_ms);

    readDouble("MEMORY_WINDOW_MINUTES", c.memory_window_minutes);

    readString("SPEECH_CORE_URL", c.speech_core_url);
    readFlag("USE_SPEECH_CORE", c.use_speech_core);
    readFlag("SPEECH_CORE_TEXT_INJECT", c.speech_core_text_inject);

    readString("DEFAULT_ASSISTANT_NAME", c.default_assistant_name);
    readString("DEFAULT_USER_NAME", c.default_user_name);
    readString("DEFAULT_TIMEZONE", c.default_timezone);
    readString("DEFAULT_LOCATION", c.default_location);

    readFlag("ECHO_DEBUG", c.echo_debug);

    return c;
}

} // namespace emv
