/**
 * VADProcessor.cpp - Voice Activity Detection via libfvad
 *
 * Classifies fixed-size PCM16 frames as speech or silence.
 * Endpointing and lead counting live in VoiceActivityGate.
 */

#include "emv/audio/VADProcessor.hpp"

#include <fvad.h>
#include <iostream>

namespace emv::audio {

struct VADProcessor::Impl {
    Fvad* vad = nullptr;

    int sample_rate;
    int frame_ms;
    int frame_samples;  // Samples per frame
};

VADProcessor::VADProcessor(int sample_rate, VADMode mode, int frame_ms)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->sample_rate = sample_rate;
    pImpl_->frame_ms = frame_ms;
    pImpl_->frame_samples = (sample_rate * frame_ms) / 1000;

    pImpl_->vad = fvad_new();
    if (!pImpl_->vad) {
        std::cerr << "[VADProcessor] Failed to create fvad instance" << std::endl;
        return;
    }

    if (fvad_set_sample_rate(pImpl_->vad, sample_rate) < 0) {
        std::cerr << "[VADProcessor] Invalid sample rate: " << sample_rate << std::endl;
        fvad_free(pImpl_->vad);
        pImpl_->vad = nullptr;
        return;
    }

    if (fvad_set_mode(pImpl_->vad, static_cast<int>(mode)) < 0) {
        std::cerr << "[VADProcessor] Invalid mode" << std::endl;
    }
}

VADProcessor::~VADProcessor() {
    if (pImpl_->vad) {
        fvad_free(pImpl_->vad);
    }
}

bool VADProcessor::isReady() const {
    return pImpl_->vad != nullptr;
}

int VADProcessor::frameSamples() const {
    return pImpl_->frame_samples;
}

bool VADProcessor::isSpeech(const Frame& frame) {
    if (!pImpl_->vad) return false;
    if (frame.sampleCount() != static_cast<size_t>(pImpl_->frame_samples)) {
        return false;
    }

    int result = fvad_process(pImpl_->vad, frame.samples(), frame.sampleCount());
    if (result < 0) {
        std::cerr << "[VADProcessor] fvad_process failed for "
                  << frame.sampleCount() << " samples" << std::endl;
        return false;
    }
    return result == 1;
}

void VADProcessor::reset() {
    if (pImpl_->vad) {
        fvad_reset(pImpl_->vad);
    }
}

} // namespace emv::audio
