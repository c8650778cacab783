/**
 * VoiceSession.hpp - Per-connection voice conversation controller
 *
 * Inbound frames -> activity gate -> (endpoint) STT -> command router ->
 * direct reply | LLM stream -> phrases -> TTS -> playback chunks -> client.
 * Every assistant-side task is fenced by the session's generation epoch.
 */

#pragma once

#include "emv/Config.hpp"
#include "emv/audio/FrameClassifier.hpp"
#include "emv/commands/CommandRouter.hpp"
#include "emv/llm/ChatModel.hpp"
#include "emv/protocol/Messages.hpp"
#include "emv/rag/KnowledgeBase.hpp"
#include "emv/session/Profile.hpp"
#include "emv/session/Transport.hpp"
#include "emv/speechcore/SpeechCore.hpp"
#include "emv/stt/Transcriber.hpp"
#include "emv/tts/Synthesizer.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace emv::session {

enum class SessionState {
    IDLE,
    LISTENING,  // user turn in progress
    THINKING,   // transcribing / waiting on a model
    SPEAKING    // assistant output in flight
};

const char* toString(SessionState state);

/**
 * Adapters are constructed once per process and shared by all sessions.
 * Factories build the per-session pieces.
 */
struct Collaborators {
    std::shared_ptr<stt::Transcriber> stt;
    std::shared_ptr<llm::ChatModel> llm;
    std::shared_ptr<tts::Synthesizer> tts;
    std::shared_ptr<rag::KnowledgeBase> knowledge_base;  // optional
    std::shared_ptr<const commands::IntentClassifier> intent_classifier;  // optional, keyword default

    std::function<std::unique_ptr<audio::FrameClassifier>()> make_classifier;
    std::function<std::unique_ptr<speechcore::SpeechCore>()> make_speech_core;  // optional
};

class VoiceSession {
public:
    VoiceSession(std::string session_id,
                 const Config& config,
                 Collaborators collaborators,
                 std::shared_ptr<Transport> transport);
    ~VoiceSession();

    VoiceSession(const VoiceSession&) = delete;
    VoiceSession& operator=(const VoiceSession&) = delete;

    /// Start worker threads, send the handshake and play the intro.
    void start();

    /// Cancel everything and join all threads. Idempotent.
    void close();

    /// Raw PCM16 frame from a binary WebSocket message.
    void onBinary(const std::string& bytes);

    /// JSON control message.
    void onText(const std::string& text);

    void onAudioFrame(double timestamp, std::string pcm16);
    void onControl(const protocol::Inbound& message);

    /**
     * Bump the epoch and stop all assistant output.
     * @param keep_listening keep the user utterance being captured (barge-in)
     * @param send_cancel    emit cancel{generation} to the client
     * @return the new epoch
     */
    uint64_t cancelAssistantPipeline(bool keep_listening, bool send_cancel = true);

    const std::string& id() const;
    uint64_t generation() const;
    SessionState state() const;
    bool assistantActive() const;
    bool listenOnly() const;
    bool paused() const;
    Profile profile() const;
    size_t historySize() const;
    size_t memorySize() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace emv::session
