/**
 * VoiceActivityGate.cpp - Lead counting and silence endpointing
 */

#include "emv/audio/VoiceActivityGate.hpp"

#include <algorithm>

namespace emv::audio {

VoiceActivityGate::VoiceActivityGate(GateConfig config, std::unique_ptr<FrameClassifier> classifier)
    : config_(config)
    , classifier_(std::move(classifier))
    , utterance_(config.max_utterance_frames) {
    config_.lead_idle = std::max(1, config_.lead_idle);
    config_.lead_active = std::max(1, config_.lead_active);
    config_.endpoint_silence_frames = std::max(1, config_.endpoint_silence_frames);
}

GateEvent VoiceActivityGate::process(const Frame& frame, bool assistant_active) {
    // Below the floor the classifier is not consulted at all
    bool is_speech = false;
    if (rmsEnergy(frame.pcm16) >= config_.energy_floor && classifier_) {
        is_speech = classifier_->isSpeech(frame);
    }

    GateEvent event = GateEvent::None;

    if (is_speech) {
        silence_count_ = 0;
        speech_count_++;
        speech_lead_count_++;

        const int need_lead = assistant_active ? config_.lead_active : config_.lead_idle;
        if (!in_speech_ && speech_lead_count_ >= need_lead) {
            in_speech_ = true;
            // Only the frames of the lead run count towards this utterance
            speech_count_ = speech_lead_count_;
            utterance_.reset();
            event = GateEvent::SpeechStart;
        }

        if (in_speech_) {
            utterance_.push(frame);
        }
        return event;
    }

    speech_lead_count_ = 0;
    if (!in_speech_) {
        speech_count_ = 0;
        return event;
    }

    silence_count_++;
    if (silence_count_ <= config_.tail_frames) {
        utterance_.push(frame);
    }

    if (silence_count_ >= config_.endpoint_silence_frames) {
        event = endUtterance();
    }
    return event;
}

GateEvent VoiceActivityGate::forceEndpoint() {
    if (!in_speech_) return GateEvent::None;
    return endUtterance();
}

GateEvent VoiceActivityGate::endUtterance() {
    in_speech_ = false;
    const bool long_enough = speech_count_ >= config_.min_speech_frames;
    speech_count_ = 0;
    silence_count_ = 0;
    speech_lead_count_ = 0;
    return long_enough ? GateEvent::SpeechEnd : GateEvent::SpeechEndTooShort;
}

void VoiceActivityGate::reset() {
    in_speech_ = false;
    speech_lead_count_ = 0;
    silence_count_ = 0;
    speech_count_ = 0;
    utterance_.reset();
    if (classifier_) classifier_->reset();
}

} // namespace emv::audio
