/**
 * VoiceActivityGate.hpp - Speech start / endpoint detection over frames
 *
 * Energy floor + classifier per frame, a consecutive-frame lead before a
 * user turn starts (stricter while the assistant is talking), and silence
 * endpointing with a minimum speech length.
 */

#pragma once

#include "emv/audio/FrameClassifier.hpp"
#include "emv/audio/UtteranceBuffer.hpp"

#include <memory>

namespace emv::audio {

struct GateConfig {
    float energy_floor = 0.004f;
    int lead_idle = 2;
    int lead_active = 6;
    int endpoint_silence_frames = 22;
    int min_speech_frames = 12;
    int tail_frames = 6;
    size_t max_utterance_frames = 750;
};

enum class GateEvent {
    None,
    SpeechStart,        // lead satisfied; utterance buffer was reset
    SpeechEnd,          // endpoint reached with enough speech; buffer holds the clip
    SpeechEndTooShort   // endpoint reached but below min speech, discard
};

class VoiceActivityGate {
public:
    VoiceActivityGate(GateConfig config, std::unique_ptr<FrameClassifier> classifier);

    /**
     * Feed one frame.
     * @param assistant_active selects lead_active instead of lead_idle
     */
    GateEvent process(const Frame& frame, bool assistant_active);

    /// End the current utterance now (client sent stop/eos).
    GateEvent forceEndpoint();

    /// Full reset of counters, classifier state and the utterance buffer.
    void reset();

    bool inSpeech() const { return in_speech_; }
    int speechLeadCount() const { return speech_lead_count_; }
    int silenceCount() const { return silence_count_; }
    int speechFrames() const { return speech_count_; }

    const UtteranceBuffer& utterance() const { return utterance_; }
    UtteranceBuffer& utterance() { return utterance_; }

private:
    GateEvent endUtterance();

    GateConfig config_;
    std::unique_ptr<FrameClassifier> classifier_;
    UtteranceBuffer utterance_;

    bool in_speech_ = false;
    int speech_lead_count_ = 0;
    int silence_count_ = 0;
    int speech_count_ = 0;
};

} // namespace emv::audio
