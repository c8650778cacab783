/**
 * Pcm.cpp - PCM16 <-> float conversion helpers
 */

#include "emv/audio/Pcm.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace emv::audio {

std::vector<float> pcm16ToFloat(const std::string& pcm16) {
    const size_t count = pcm16.size() / 2;
    std::vector<float> out(count);
    for (size_t i = 0; i < count; ++i) {
        int16_t s;
        std::memcpy(&s, pcm16.data() + i * 2, sizeof(s));
        out[i] = static_cast<float>(s) / 32768.0f;
    }
    return out;
}

std::string floatToPcm16(const float* samples, size_t count) {
    std::string out(count * 2, '\0');
    for (size_t i = 0; i < count; ++i) {
        float sample = std::clamp(samples[i], -1.0f, 1.0f);
        int16_t s = static_cast<int16_t>(sample * 32767.0f);
        std::memcpy(out.data() + i * 2, &s, sizeof(s));
    }
    return out;
}

float rmsEnergy(const std::string& pcm16) {
    const size_t count = pcm16.size() / 2;
    if (count == 0) return 0.0f;

    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        int16_t s;
        std::memcpy(&s, pcm16.data() + i * 2, sizeof(s));
        double x = static_cast<double>(s) / 32768.0;
        sum += x * x;
    }
    return static_cast<float>(std::sqrt(sum / count));
}

} // namespace emv::audio
