/**
 * STTEngine.hpp - whisper.cpp speech recognition
 */

#pragma once

#include "emv/stt/Transcriber.hpp"

#include <memory>
#include <string>

namespace emv::stt {

class STTEngine : public Transcriber {
public:
    /**
     * Load the ggml model once; it stays resident for the process lifetime
     * and is shared by every session.
     */
    STTEngine(const std::string& model_path, const std::string& language = "en", int n_threads = 4);
    ~STTEngine() override;

    STTEngine(const STTEngine&) = delete;
    STTEngine& operator=(const STTEngine&) = delete;

    std::string transcribe(const std::vector<float>& audio) override;

    bool isReady() const;
    std::string getModelInfo() const;

    static constexpr int getSampleRate() { return 16000; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace emv::stt
