/**
 * PlaybackEncoder.cpp - Chunking, edge fades and emotion playback rate
 */

#include "emv/audio/PlaybackEncoder.hpp"
#include "emv/audio/Pcm.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace emv::audio {

namespace {

const std::array<const char*, 7> POSITIVE_WORDS = {
    "great", "awesome", "perfect", "nice", "congrats", "yay", "happy"
};
const std::array<const char*, 7> NEGATIVE_WORDS = {
    "sorry", "unfortunately", "sad", "issue", "problem", "can't", "cannot"
};
const std::array<const char*, 4> URGENT_WORDS = {
    "warning", "important", "careful", "critical"
};

template <size_t N>
bool containsAny(const std::string& text, const std::array<const char*, N>& words) {
    for (const char* w : words) {
        if (text.find(w) != std::string::npos) return true;
    }
    return false;
}

} // anonymous namespace

PlaybackEncoder::PlaybackEncoder(float chunk_seconds, float fade_ms)
    : chunk_seconds_(chunk_seconds), fade_ms_(fade_ms) {
}

size_t PlaybackEncoder::chunkSamples(int sample_rate) const {
    if (!validSampleRate(sample_rate)) return 0;
    auto n = static_cast<size_t>(sample_rate * chunk_seconds_);
    return std::max(n, MIN_CHUNK_SAMPLES);
}

size_t PlaybackEncoder::encode(const std::vector<float>& audio,
                               int sample_rate,
                               uint64_t generation,
                               float playback_rate,
                               const ChunkSink& sink) const {
    const size_t step = chunkSamples(sample_rate);
    if (step == 0) return 0;
    size_t emitted = 0;

    for (size_t offset = 0; offset < audio.size(); offset += step) {
        const size_t count = std::min(step, audio.size() - offset);
        std::vector<float> part(audio.begin() + offset, audio.begin() + offset + count);
        fadeEdges(part.data(), part.size(), sample_rate, fade_ms_);

        AudioChunk chunk;
        chunk.generation = generation;
        chunk.index = emitted;
        chunk.sample_rate = sample_rate;
        chunk.playback_rate = playback_rate;
        chunk.pcm16 = floatToPcm16(part);

        if (!sink(std::move(chunk))) break;
        emitted++;
    }
    return emitted;
}

void PlaybackEncoder::fadeEdges(float* samples, size_t count, int sample_rate, float fade_ms) {
    if (count == 0) return;
    auto n = static_cast<size_t>(sample_rate * (fade_ms / 1000.0f));
    n = std::min(n, count / 2);
    if (n == 0) return;

    for (size_t i = 0; i < n; ++i) {
        const float gain = static_cast<float>(i + 1) / static_cast<float>(n + 1);
        samples[i] *= gain;
        samples[count - 1 - i] *= gain;
    }
}

float PlaybackEncoder::emotionPlaybackRate(const std::string& text) {
    std::string t = text;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (containsAny(t, POSITIVE_WORDS)) return 1.06f;
    if (containsAny(t, NEGATIVE_WORDS)) return 0.96f;
    if (containsAny(t, URGENT_WORDS)) return 1.02f;
    return 1.0f;
}

} // namespace emv::audio
