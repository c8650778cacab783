/**
 * UtteranceBuffer.cpp - Bounded frame deque
 */

#include "emv/audio/UtteranceBuffer.hpp"

#include <algorithm>

namespace emv::audio {

UtteranceBuffer::UtteranceBuffer(size_t max_frames)
    : max_frames_(std::max<size_t>(1, max_frames)) {
}

void UtteranceBuffer::push(const Frame& frame) {
    frames_.push_back(frame);
    while (frames_.size() > max_frames_) {
        frames_.pop_front();
    }
}

void UtteranceBuffer::reset() {
    frames_.clear();
}

std::vector<float> UtteranceBuffer::toFloat() const {
    std::vector<float> audio;
    size_t total = 0;
    for (const auto& fr : frames_) total += fr.sampleCount();
    audio.reserve(total);

    for (const auto& fr : frames_) {
        auto samples = pcm16ToFloat(fr.pcm16);
        audio.insert(audio.end(), samples.begin(), samples.end());
    }
    return audio;
}

} // namespace emv::audio
