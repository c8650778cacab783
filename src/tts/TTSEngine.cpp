/**
 * TTSEngine.cpp - Client for a persistent synthesis server
 *
 * The server keeps its voice model loaded; every request returns a WAV body.
 */

#include "emv/tts/TTSEngine.hpp"
#include "emv/Error.hpp"
#include "emv/audio/PlaybackEncoder.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace emv::tts {

namespace {

template <typename T>
T readLE(const std::string& bytes, size_t offset) {
    T value;
    std::memcpy(&value, bytes.data() + offset, sizeof(T));
    return value;
}

std::string cleanForSpeech(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\n' || c == '\t') out += ' ';
        else if (c >= 0 && c < 32) continue;
        else out += c;
    }
    return out;
}

} // anonymous namespace

struct TTSEngine::Impl {
    std::string server_url;
    int timeout_ms;
    float speed = 1.0f;

    Impl(const std::string& url, int timeout) : server_url(url), timeout_ms(timeout) {
        while (!server_url.empty() && server_url.back() == '/') server_url.pop_back();
    }

    std::unique_ptr<httplib::Client> makeClient() const {
        auto client = std::make_unique<httplib::Client>(server_url);
        client->set_connection_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        client->set_read_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
        return client;
    }
};

TTSEngine::TTSEngine(const std::string& server_url, int timeout_ms)
    : impl_(std::make_unique<Impl>(server_url, timeout_ms)) {
    std::cout << "[TTSEngine] Synthesis server " << impl_->server_url << std::endl;
}

TTSEngine::~TTSEngine() = default;

bool TTSEngine::isHealthy() {
    auto client = impl_->makeClient();
    auto res = client->Get("/health");
    return res && res->status == 200;
}

void TTSEngine::setSpeed(float speed) { impl_->speed = speed; }

Synthesis TTSEngine::synthesize(const std::string& text) {
    const std::string clean = cleanForSpeech(text);
    if (clean.empty()) return {};

    nlohmann::json body = {{"text", clean}};
    if (impl_->speed != 1.0f) body["speed"] = impl_->speed;

    auto client = impl_->makeClient();
    auto res = client->Post("/synthesize", body.dump(), "application/json");

    if (!res) {
        throw ServiceError("tts", "synthesis request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw ServiceError("tts", "HTTP " + std::to_string(res->status) + ": " + res->body.substr(0, 200));
    }

    auto wav = parseWav(res->body);
    if (!wav) {
        throw ServiceError("tts", "server returned an unreadable WAV body");
    }
    return std::move(*wav);
}

std::optional<Synthesis> TTSEngine::parseWav(const std::string& bytes) {
    if (bytes.size() < 44) return std::nullopt;

    if (bytes.compare(0, 4, "RIFF") != 0 || bytes.compare(8, 4, "WAVE") != 0) {
        std::cerr << "[TTSEngine] Invalid WAV: no RIFF header" << std::endl;
        return std::nullopt;
    }

    uint16_t audio_format = 0;
    uint16_t num_channels = 1;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    size_t data_offset = 0;
    size_t data_size = 0;

    // Walk the chunk list; the header may be longer than 44 bytes
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const std::string id = bytes.substr(pos, 4);
        const uint32_t size = readLE<uint32_t>(bytes, pos + 4);
        const size_t body = pos + 8;

        if (id == "fmt " && body + 16 <= bytes.size()) {
            audio_format = readLE<uint16_t>(bytes, body);
            num_channels = readLE<uint16_t>(bytes, body + 2);
            sample_rate = readLE<uint32_t>(bytes, body + 4);
            bits_per_sample = readLE<uint16_t>(bytes, body + 14);
        } else if (id == "data") {
            data_offset = body;
            data_size = std::min<size_t>(size, bytes.size() - body);
            break;
        }
        pos = body + size + (size & 1);
    }

    if (data_offset == 0 || sample_rate == 0 || num_channels == 0) {
        std::cerr << "[TTSEngine] Invalid WAV: missing fmt or data chunk" << std::endl;
        return std::nullopt;
    }
    if (sample_rate > static_cast<uint32_t>(audio::PlaybackEncoder::MAX_SAMPLE_RATE)) {
        std::cerr << "[TTSEngine] Invalid WAV: sample rate " << sample_rate << std::endl;
        return std::nullopt;
    }

    Synthesis out;
    out.sample_rate = static_cast<int>(sample_rate);

    if (bits_per_sample == 16 && audio_format == 1) {
        const size_t frame = 2u * num_channels;
        const size_t frames = data_size / frame;
        out.samples.reserve(frames);
        for (size_t i = 0; i < frames; ++i) {
            out.samples.push_back(readLE<int16_t>(bytes, data_offset + i * frame) / 32768.0f);
        }
    } else if (bits_per_sample == 32 && audio_format == 3) {
        const size_t frame = 4u * num_channels;
        const size_t frames = data_size / frame;
        out.samples.reserve(frames);
        for (size_t i = 0; i < frames; ++i) {
            out.samples.push_back(readLE<float>(bytes, data_offset + i * frame));
        }
    } else {
        std::cerr << "[TTSEngine] Unsupported WAV format: " << bits_per_sample << " bits, format "
                  << audio_format << std::endl;
        return std::nullopt;
    }

    return out;
}

} // namespace emv::tts
