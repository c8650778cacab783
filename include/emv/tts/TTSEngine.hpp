/**
 * TTSEngine.hpp - HTTP text-to-speech client (POST /synthesize -> WAV)
 */

#pragma once

#include "emv/tts/Synthesizer.hpp"

#include <memory>
#include <optional>
#include <string>

namespace emv::tts {

class TTSEngine : public Synthesizer {
public:
    explicit TTSEngine(const std::string& server_url, int timeout_ms = 30000);
    ~TTSEngine() override;

    TTSEngine(const TTSEngine&) = delete;
    TTSEngine& operator=(const TTSEngine&) = delete;

    /// GET /health on the synthesis server.
    bool isHealthy();

    Synthesis synthesize(const std::string& text) override;

    void setSpeed(float speed);

    /**
     * Decode a RIFF/WAVE body (16-bit PCM or 32-bit float, first channel).
     * nullopt if the data is not a WAV file this can read.
     */
    static std::optional<Synthesis> parseWav(const std::string& bytes);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace emv::tts
