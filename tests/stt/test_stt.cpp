/**
 * test_stt.cpp - STTEngine tests
 */

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "emv/Config.hpp"
#include "emv/Error.hpp"
#include "emv/stt/STTEngine.hpp"

namespace {

std::string modelPath() {
    return emv::Config::fromEnvironment().whisper_model;
}

} // anonymous namespace

void test_sample_rate() {
    std::cout << "--- Test: Sample Rate ---" << std::endl;
    assert(emv::stt::STTEngine::getSampleRate() == 16000);
    std::cout << "[PASS] Sample rate is 16kHz" << std::endl;
}

void test_missing_model() {
    std::cout << "\n--- Test: Missing model ---" << std::endl;
    emv::stt::STTEngine engine("/nonexistent/ggml-none.bin");
    assert(!engine.isReady());
    assert(engine.getModelInfo() == "Model not loaded");

    bool threw = false;
    try {
        engine.transcribe(std::vector<float>(16000, 0.0f));
    } catch (const emv::ServiceError& e) {
        threw = true;
        assert(e.where() == "stt");
    }
    assert(threw);

    std::cout << "[PASS] Unloaded model raises ServiceError" << std::endl;
}

void test_transcription_with_silence() {
    std::cout << "\n--- Test: Transcription with Silence ---" << std::endl;
    emv::stt::STTEngine engine(modelPath());

    if (!engine.isReady()) {
        std::cout << "[SKIP] Model not available: " << modelPath() << std::endl;
        return;
    }
    std::cout << "  Info: " << engine.getModelInfo() << std::endl;

    assert(engine.transcribe({}).empty());

    std::string result = engine.transcribe(std::vector<float>(16000, 0.0f));
    std::cout << "  Result: \"" << result << "\"" << std::endl;
    std::cout << "[PASS] Transcription of silence works" << std::endl;
}

void test_transcription_with_tone() {
    std::cout << "\n--- Test: Transcription with Tone ---" << std::endl;
    emv::stt::STTEngine engine(modelPath());

    if (!engine.isReady()) {
        std::cout << "[SKIP] Model not available" << std::endl;
        return;
    }

    // 2 seconds of A4
    const int sample_rate = emv::stt::STTEngine::getSampleRate();
    std::vector<float> tone(static_cast<size_t>(sample_rate * 2));
    for (size_t i = 0; i < tone.size(); ++i) {
        tone[i] = 0.3f * std::sin(2.0f * static_cast<float>(M_PI) * 440.0f * i / sample_rate);
    }

    std::string result = engine.transcribe(tone);
    std::cout << "  Result: \"" << result << "\" (" << result.size() << " chars)" << std::endl;
    std::cout << "[PASS] Transcription of tone works" << std::endl;
}

int main() {
    std::cout << "=== STTEngine Tests ===" << std::endl;

    test_sample_rate();
    test_missing_model();
    test_transcription_with_silence();
    test_transcription_with_tone();

    std::cout << "\nTests complete!" << std::endl;
    return 0;
}
