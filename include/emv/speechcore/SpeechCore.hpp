/**
 * SpeechCore.hpp - Optional external full-duplex speech engine
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace emv::speechcore {

/// Audio produced by the core; generation is absent when the core omits it.
using AudioHandler = std::function<void(std::optional<uint64_t> generation, int sample_rate, std::string pcm16)>;

class SpeechCore {
public:
    virtual ~SpeechCore() = default;

    virtual bool connect(AudioHandler on_audio) = 0;
    virtual void close() = 0;

    virtual void sendAudio(const std::string& pcm16, int sample_rate) = 0;
    virtual void textInject(const std::string& text, uint64_t generation) = 0;
    virtual void cancel(uint64_t generation) = 0;
};

} // namespace emv::speechcore
