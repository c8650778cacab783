/**
 * PlaybackEncoder.hpp - Synthesized audio -> ordered PCM16 playback chunks
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace emv::audio {

struct AudioChunk {
    uint64_t generation = 0;
    size_t index = 0;
    int sample_rate = 0;
    float playback_rate = 1.0f;
    std::string pcm16;
};

/// Return false to stop emitting further chunks.
using ChunkSink = std::function<bool(AudioChunk&&)>;

class PlaybackEncoder {
public:
    static constexpr size_t MIN_CHUNK_SAMPLES = 256;
    static constexpr int MAX_SAMPLE_RATE = 384000;

    PlaybackEncoder(float chunk_seconds = 0.35f, float fade_ms = 4.0f);

    /**
     * Split `audio` into fixed-duration chunks, fade each chunk's edges and
     * hand them to `sink` strictly in order. Stops at the first chunk the
     * sink rejects. Nothing is emitted for an invalid `sample_rate`.
     * @return number of chunks accepted by the sink
     */
    size_t encode(const std::vector<float>& audio,
                  int sample_rate,
                  uint64_t generation,
                  float playback_rate,
                  const ChunkSink& sink) const;

    /// 0 when `sample_rate` is invalid.
    size_t chunkSamples(int sample_rate) const;

    static bool validSampleRate(int sample_rate) {
        return sample_rate > 0 && sample_rate <= MAX_SAMPLE_RATE;
    }

    /// Linear fade-in / fade-out of `fade_ms` at both ends (in place).
    static void fadeEdges(float* samples, size_t count, int sample_rate, float fade_ms);

    /**
     * Keyword heuristic: cheerful wording plays slightly faster, apologetic
     * wording slightly slower, warnings a touch faster.
     */
    static float emotionPlaybackRate(const std::string& text);

private:
    float chunk_seconds_;
    float fade_ms_;
};

} // namespace emv::audio
