/**
 * SpeechCoreClient.hpp - WebSocket link to an external speech core
 */

#pragma once

#include "emv/speechcore/SpeechCore.hpp"

#include <memory>

namespace emv::speechcore {

class SpeechCoreClient : public SpeechCore {
public:
    /// @param url ws://host:port/path
    explicit SpeechCoreClient(const std::string& url);
    ~SpeechCoreClient() override;

    SpeechCoreClient(const SpeechCoreClient&) = delete;
    SpeechCoreClient& operator=(const SpeechCoreClient&) = delete;

    bool connect(AudioHandler on_audio) override;
    void close() override;

    void sendAudio(const std::string& pcm16, int sample_rate) override;
    void textInject(const std::string& text, uint64_t generation) override;
    void cancel(uint64_t generation) override;

    bool isOpen() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace emv::speechcore
