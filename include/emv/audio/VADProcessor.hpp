/**
 * VADProcessor.hpp - WebRTC VAD (libfvad) frame classifier
 */

#pragma once

#include "emv/audio/FrameClassifier.hpp"

#include <memory>

namespace emv::audio {

enum class VADMode {
    Quality = 0,
    LowBitrate = 1,
    Aggressive = 2,
    VeryAggressive = 3
};

class VADProcessor : public FrameClassifier {
public:
    /**
     * @param sample_rate 8000, 16000, 32000 or 48000
     * @param mode        libfvad aggressiveness
     * @param frame_ms    10, 20 or 30
     */
    explicit VADProcessor(int sample_rate = 16000,
                          VADMode mode = VADMode::Aggressive,
                          int frame_ms = 20);
    ~VADProcessor() override;

    VADProcessor(const VADProcessor&) = delete;
    VADProcessor& operator=(const VADProcessor&) = delete;

    bool isReady() const;
    bool isSpeech(const Frame& frame) override;
    void reset() override;

    int frameSamples() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace emv::audio
