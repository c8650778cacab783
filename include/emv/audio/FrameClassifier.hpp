/**
 * FrameClassifier.hpp - Per-frame speech/silence decision
 */

#pragma once

#include "emv/audio/Pcm.hpp"

namespace emv::audio {

class FrameClassifier {
public:
    virtual ~FrameClassifier() = default;

    /// True if the frame contains speech. Called once per inbound frame.
    virtual bool isSpeech(const Frame& frame) = 0;

    virtual void reset() {}
};

} // namespace emv::audio
