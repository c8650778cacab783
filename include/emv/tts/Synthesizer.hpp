/**
 * Synthesizer.hpp - Text-to-speech collaborator interface
 */

#pragma once

#include <string>
#include <vector>

namespace emv::tts {

struct Synthesis {
    std::vector<float> samples;  // mono, -1..1
    int sample_rate = 0;
};

class Synthesizer {
public:
    virtual ~Synthesizer() = default;

    /// Throws emv::ServiceError("tts") on failure.
    virtual Synthesis synthesize(const std::string& text) = 0;
};

} // namespace emv::tts
