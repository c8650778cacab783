/**
 * UtteranceBuffer.hpp - Bounded history of recent frames for STT
 */

#pragma once

#include "emv/audio/Pcm.hpp"

#include <deque>
#include <vector>

namespace emv::audio {

/**
 * Keeps at most `max_frames` frames; pushing beyond capacity drops the
 * oldest frame. Owned by a single session.
 */
class UtteranceBuffer {
public:
    explicit UtteranceBuffer(size_t max_frames);

    void push(const Frame& frame);
    void reset();

    size_t size() const { return frames_.size(); }
    size_t capacity() const { return max_frames_; }
    bool empty() const { return frames_.empty(); }

    /// Concatenated audio as float32 in [-1, 1].
    std::vector<float> toFloat() const;

private:
    size_t max_frames_;
    std::deque<Frame> frames_;
};

} // namespace emv::audio
