/**
 * Pcm.hpp - PCM16 frame type and sample conversions
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace emv::audio {

/**
 * One fixed-size block of little-endian mono PCM16 as received from the
 * socket. Never mutated after construction.
 */
struct Frame {
    double timestamp = 0.0;
    std::string pcm16;  // raw bytes, sample_rate * frame_ms / 1000 * 2 long

    size_t sampleCount() const { return pcm16.size() / 2; }
    const int16_t* samples() const {
        return reinterpret_cast<const int16_t*>(pcm16.data());
    }
};

std::vector<float> pcm16ToFloat(const std::string& pcm16);
std::string floatToPcm16(const float* samples, size_t count);

inline std::string floatToPcm16(const std::vector<float>& samples) {
    return floatToPcm16(samples.data(), samples.size());
}

/// Normalized RMS energy (0..1) of a PCM16 block.
float rmsEnergy(const std::string& pcm16);

} // namespace emv::audio
