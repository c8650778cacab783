/**
 * VoiceSession.cpp - Per-connection conversation loop
 *
 * Threads per session:
 *   consumer  - inbound frames -> activity gate, schedules finalize tasks
 *   sender    - single writer draining the outbound queue in order
 *   tasks     - finalize/reply, LLM token producer, intro (TaskGroup)
 */

#include "emv/session/VoiceSession.hpp"
#include "emv/Error.hpp"
#include "emv/audio/PlaybackEncoder.hpp"
#include "emv/audio/VoiceActivityGate.hpp"
#include "emv/core/BoundedQueue.hpp"
#include "emv/core/CancellationController.hpp"
#include "emv/core/Overloaded.hpp"
#include "emv/core/TaskGroup.hpp"
#include "emv/llm/ConversationEngine.hpp"
#include "emv/llm/PhraseSegmenter.hpp"
#include "emv/memory/ConversationMemory.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace emv::session {

namespace out = protocol::out;
using protocol::Outbound;

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "IDLE";
        case SessionState::LISTENING: return "LISTENING";
        case SessionState::THINKING: return "THINKING";
        case SessionState::SPEAKING: return "SPEAKING";
    }
    return "UNKNOWN";
}

namespace {

constexpr const char* HELLO_NOTE =
    "EchoMind: Context + memory + listen-only. Say 'listen to conversation' or use wake word.";

constexpr const char* FACT_CHECK_PROMPT =
    "You are a fact-checking assistant. Based ONLY on the following conversation transcript, "
    "identify any factual claims and assess their accuracy. If you have no external sources, "
    "clearly state uncertainty and give reasoning. Be concise.\n\nTranscript:\n";

constexpr size_t TOKEN_QUEUE_CAPACITY = 4000;
constexpr float INTRO_CHUNK_SECONDS = 0.22f;
constexpr double MIN_FINALIZE_SECONDS = 0.25;

double nowSeconds() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(system_clock::now().time_since_epoch()).count();
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string whereOf(const std::exception& e, const std::string& fallback) {
    if (const auto* service = dynamic_cast<const ServiceError*>(&e)) return service->where();
    return fallback;
}

std::string minutesText(double minutes) {
    return std::to_string(static_cast<long long>(minutes));
}

// Marker pushed by stop/eos so the endpoint is taken in frame order
struct ForceEndpoint {};
using InboundItem = std::variant<audio::Frame, ForceEndpoint>;

/// Token bridge between the blocking LLM stream and the reply task.
struct TokenStream {
    core::BoundedQueue<std::string> tokens{TOKEN_QUEUE_CAPACITY, core::OverflowPolicy::Block};
    std::mutex mutex;
    std::optional<std::string> error;
};

} // anonymous namespace

struct VoiceSession::Impl {
    // A unit of assistant work bound to the epoch it was created under
    struct Turn {
        uint64_t generation = 0;
        core::TaskHandle handle;
    };

    std::string session_id;
    std::string log_tag;
    Config config;
    Collaborators collab;
    std::shared_ptr<Transport> transport;

    core::CancellationController cancellation;
    core::BoundedQueue<InboundItem> inbound;
    core::BoundedQueue<Outbound> outbound;
    core::TaskGroup tasks;

    // Gate is touched by the consumer and by full resets
    mutable std::mutex gate_mutex;
    audio::VoiceActivityGate gate;

    // Task bookkeeping
    mutable std::mutex tasks_mutex;
    core::TaskHandle finalize_task;
    core::TaskHandle intro_task;

    // Conversation state shared between the reader and task threads
    mutable std::mutex state_mutex;
    Profile profile;
    llm::ConversationEngine conversation;
    memory::ConversationMemory memory;
    std::vector<std::string> listen_buffer;
    std::vector<std::string> trigger_phrases;
    bool listen_only = false;
    bool use_knowledge_base = false;
    std::string persona;
    std::string context_window = "all";
    std::string voice_bot_name;
    std::string voice_user_name;
    uint64_t turn_id = 0;

    std::atomic<SessionState> state{SessionState::IDLE};
    std::atomic<bool> paused{false};
    std::atomic<bool> started{false};
    std::atomic<bool> closed{false};
    std::atomic<size_t> rejected_frames{0};

    commands::CommandRouter router;
    audio::PlaybackEncoder encoder;
    audio::PlaybackEncoder intro_encoder;
    std::unique_ptr<speechcore::SpeechCore> speech_core;

    std::thread consumer_thread;
    std::thread sender_thread;

    Impl(std::string id, const Config& cfg, Collaborators c, std::shared_ptr<Transport> t)
        : session_id(std::move(id))
        , log_tag("[VoiceSession " + session_id.substr(0, 8) + "] ")
        , config(cfg)
        , collab(std::move(c))
        , transport(std::move(t))
        , inbound(static_cast<size_t>(std::max(1, cfg.inbound_queue_frames)), core::OverflowPolicy::DropOldest)
        , outbound(static_cast<size_t>(std::max(1, cfg.outbound_queue_messages)), core::OverflowPolicy::Block)
        , gate(gateConfig(cfg), collab.make_classifier ? collab.make_classifier() : nullptr)
        , memory(cfg.memory_window_minutes)
        , router(collab.intent_classifier
                     ? commands::CommandRouter(collab.intent_classifier)
                     : commands::CommandRouter())
        , encoder(cfg.tts_chunk_seconds, cfg.tts_fade_ms)
        , intro_encoder(INTRO_CHUNK_SECONDS, cfg.tts_fade_ms) {
        profile.assistant_name = cfg.default_assistant_name;
        profile.wake_word = cfg.default_assistant_name;
        profile.user_name = cfg.default_user_name;
        profile.timezone = cfg.default_timezone;
        profile.location = cfg.default_location;

        trigger_phrases = {
            "now you can speak", "now you can process", "fact check", "fact check it",
            "process that", "speak now", "you can speak"
        };

        if (config.echo_debug) {
            memory.setDebugLog([tag = log_tag](const std::string& msg) {
                std::cout << tag << msg << std::endl;
            });
        }
    }

    static audio::GateConfig gateConfig(const Config& cfg) {
        audio::GateConfig g;
        g.energy_floor = cfg.vad_energy_floor;
        g.lead_idle = cfg.leadIdle();
        g.lead_active = cfg.leadActive();
        g.endpoint_silence_frames = cfg.endpointSilenceFrames();
        g.min_speech_frames = cfg.minSpeechFrames();
        g.tail_frames = cfg.tailFrames();
        g.max_utterance_frames = static_cast<size_t>(cfg.maxUtteranceFrames());
        return g;
    }

    // ------------------------------------------------------------------
    // Emission
    // ------------------------------------------------------------------

    /// Unfenced: handshake, user speech events, protocol errors.
    void send(Outbound msg) {
        outbound.push(std::move(msg));
    }

    bool live(const Turn& turn) const {
        return !turn.handle.cancelled() && cancellation.isCurrent(turn.generation);
    }

    /// Fenced: dropped unless the turn's epoch is still current.
    bool emit(const Turn& turn, Outbound msg) {
        if (turn.handle.cancelled()) return false;
        return cancellation.emitIfCurrent(turn.generation, [&]() {
            outbound.push(std::move(msg));
        });
    }

    void emitError(const Turn& turn, const std::string& where, const std::string& message) {
        std::cerr << log_tag << "Error [" << where << "]: " << message << std::endl;
        emit(turn, out::Error{where, message, turn.generation});
    }

    void setStateIf(const Turn& turn, SessionState next) {
        cancellation.emitIfCurrent(turn.generation, [&]() { state = next; });
    }

    void finishTurn(const Turn& turn) {
        emit(turn, out::Event{out::EventKind::BackToListening, turn.generation});
        setStateIf(turn, SessionState::IDLE);
    }

    void sendHandshake() {
        std::string system_prompt;
        Profile snapshot;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            system_prompt = conversation.systemPrompt();
            snapshot = profile;
        }
        send(out::Hello{session_id, HELLO_NOTE});
        send(out::ContextAck{system_prompt, std::nullopt});
        send(out::ProfileUpdate{snapshot});
    }

    Profile profileSnapshot() const {
        std::lock_guard<std::mutex> lock(state_mutex);
        return profile;
    }

    // ------------------------------------------------------------------
    // Cancellation
    // ------------------------------------------------------------------

    bool assistantActive() const {
        const SessionState s = state.load();
        if (s == SessionState::THINKING || s == SessionState::SPEAKING) return true;

        std::lock_guard<std::mutex> lock(tasks_mutex);
        const auto running = [](const core::TaskHandle& h) {
            return h.valid() && !h.finished() && !h.cancelled();
        };
        return running(finalize_task) || running(intro_task);
    }

    uint64_t cancelAssistantPipeline(bool keep_listening, bool send_cancel) {
        return cancellation.cancel([&](uint64_t next) {
            {
                std::lock_guard<std::mutex> lock(tasks_mutex);
                finalize_task.cancel();
                finalize_task.reset();
                intro_task.cancel();
                intro_task.reset();
            }
            // Reply, LLM producer and intro threads all live in the group
            tasks.cancelAll();

            if (keep_listening) {
                state = SessionState::LISTENING;
            } else {
                std::lock_guard<std::mutex> lock(gate_mutex);
                gate.reset();
                state = SessionState::IDLE;
            }

            if (send_cancel) {
                outbound.push(out::Cancel{next});
            }
            if (speech_core) {
                speech_core->cancel(next);
            }
        });
    }

    // ------------------------------------------------------------------
    // Inbound loop
    // ------------------------------------------------------------------

    void consumeLoop() {
        while (auto item = inbound.pop()) {
            std::visit(core::Overloaded{
                [&](const audio::Frame& frame) { handleFrame(frame); },
                [&](const ForceEndpoint&) { handleForceEndpoint(); },
            }, *item);
        }
    }

    void handleFrame(const audio::Frame& frame) {
        if (paused) return;
        if (speech_core) {
            speech_core->sendAudio(frame.pcm16, config.sample_rate);
        }

        const bool active = assistantActive();
        audio::GateEvent event;
        {
            std::lock_guard<std::mutex> lock(gate_mutex);
            if (paused) return;
            event = gate.process(frame, active);
        }
        // A pause that landed mid-frame has already reset the gate
        if (paused) return;
        handleGateEvent(event);
    }

    void handleForceEndpoint() {
        audio::GateEvent event;
        {
            std::lock_guard<std::mutex> lock(gate_mutex);
            if (paused) return;
            event = gate.forceEndpoint();
        }
        handleGateEvent(event);
    }

    void handleGateEvent(audio::GateEvent event) {
        switch (event) {
            case audio::GateEvent::None:
                break;

            case audio::GateEvent::SpeechStart: {
                // Barge-in: the just-started utterance is kept
                const uint64_t gen = cancelAssistantPipeline(true, true);
                send(out::Event{out::EventKind::UserSpeechStart, gen});
                break;
            }

            case audio::GateEvent::SpeechEndTooShort:
                send(out::Event{out::EventKind::UserSpeechEnd, cancellation.current()});
                if (config.echo_debug) {
                    std::cout << log_tag << "Utterance below min speech, discarded" << std::endl;
                }
                state = SessionState::IDLE;
                break;

            case audio::GateEvent::SpeechEnd: {
                send(out::Event{out::EventKind::UserSpeechEnd, cancellation.current()});
                std::vector<float> audio;
                {
                    std::lock_guard<std::mutex> lock(gate_mutex);
                    audio = gate.utterance().toFloat();
                }
                scheduleFinalize(std::move(audio));
                break;
            }
        }
    }

    void scheduleFinalize(std::vector<float> audio) {
        std::lock_guard<std::mutex> lock(tasks_mutex);
        finalize_task.cancel();

        const uint64_t gen = cancellation.current();
        state = SessionState::THINKING;
        finalize_task = tasks.spawn("finalize",
            [this, gen, audio = std::move(audio)](const core::TaskHandle& self) {
                finalizeAndReply(Turn{gen, self}, audio);
            });
    }

    // ------------------------------------------------------------------
    // Outbound loop
    // ------------------------------------------------------------------

    void sendLoop() {
        while (auto msg = outbound.pop()) {
            if (protocol::isStale(*msg, cancellation.current())) continue;

            // Cancel{G+1} is queued behind anything emitted under G, so a
            // message of an older epoch never reaches the wire after it
            try {
                transport->sendText(protocol::encode(*msg));
            } catch (const std::exception& e) {
                std::cerr << log_tag << "Send failed: " << e.what() << std::endl;
                closed = true;
                inbound.close();
                outbound.close();
                return;
            }
        }
    }

    // ------------------------------------------------------------------
    // Speech output
    // ------------------------------------------------------------------

    void speak(const Turn& turn, const std::string& text) {
        if (!live(turn)) return;
        const std::string phrase = llm::stripMarkdownForSpeech(text);
        if (phrase.empty()) return;

        setStateIf(turn, SessionState::SPEAKING);
        const float rate = config.emotion_mode ? audio::PlaybackEncoder::emotionPlaybackRate(phrase) : 1.0f;

        tts::Synthesis synthesis;
        try {
            synthesis = collab.tts->synthesize(phrase);
        } catch (const std::exception& e) {
            emitError(turn, whereOf(e, "tts"), e.what());
            return;
        }
        if (!audio::PlaybackEncoder::validSampleRate(synthesis.sample_rate)) {
            emitError(turn, "tts", "invalid sample rate " + std::to_string(synthesis.sample_rate));
            return;
        }

        encoder.encode(synthesis.samples, synthesis.sample_rate, turn.generation, rate,
                       [&](audio::AudioChunk&& chunk) {
                           return emit(turn, out::AudioOut{chunk.generation, chunk.sample_rate,
                                                           chunk.playback_rate, std::move(chunk.pcm16)});
                       });
    }

    void commitPhrase(const Turn& turn, const std::string& phrase) {
        const std::string text = trim(phrase);
        if (text.empty()) return;
        if (!emit(turn, out::AssistantPhrase{turn.generation, text})) return;

        if (speech_core && config.speech_core_text_inject) {
            speech_core->textInject(text, turn.generation);
            return;
        }
        speak(turn, text);
    }

    void playIntro(const Turn& turn, const std::string& phrase) {
        const std::string text = llm::stripMarkdownForSpeech(phrase);
        if (text.empty()) return;

        setStateIf(turn, SessionState::SPEAKING);
        emit(turn, out::Event{out::EventKind::Speaking, turn.generation});

        tts::Synthesis synthesis;
        try {
            synthesis = collab.tts->synthesize(text);
        } catch (const std::exception& e) {
            emitError(turn, "tts_intro", e.what());
            setStateIf(turn, SessionState::IDLE);
            return;
        }

        intro_encoder.encode(synthesis.samples, synthesis.sample_rate, turn.generation, 1.0f,
                             [&](audio::AudioChunk&& chunk) {
                                 return emit(turn, out::AudioOut{chunk.generation, chunk.sample_rate,
                                                                 chunk.playback_rate, std::move(chunk.pcm16)});
                             });
        finishTurn(turn);
    }

    // ------------------------------------------------------------------
    // Turn state machine
    // ------------------------------------------------------------------

    void recordAssistant(const std::string& user_text, const std::string& reply, bool add_history) {
        if (reply.empty()) return;
        std::lock_guard<std::mutex> lock(state_mutex);
        if (add_history) {
            conversation.addTurn(user_text, reply);
        }
        try {
            memory.addText(reply, "assistant");
        } catch (const std::exception& e) {
            // Best effort: the reply has already been delivered
            std::cerr << log_tag << "Memory append failed: " << e.what() << std::endl;
        }
    }

    std::optional<std::string> completeOnce(const Turn& turn, const std::vector<llm::Message>& messages) {
        try {
            return collab.llm->complete(messages);
        } catch (const std::exception& e) {
            emitError(turn, whereOf(e, "llm"), e.what());
            return std::nullopt;
        }
    }

    std::vector<llm::Message> buildMessages(const std::string& user_text,
                                            const std::string& compiled_context = "",
                                            const std::string& system_override = "") {
        std::lock_guard<std::mutex> lock(state_mutex);
        return conversation.buildMessages(user_text, profile, compiled_context, system_override);
    }

    void finalizeAndReply(const Turn& turn, const std::vector<float>& audio) {
        emit(turn, out::Event{out::EventKind::Thinking, turn.generation});

        if (audio.size() < static_cast<size_t>(MIN_FINALIZE_SECONDS * config.sample_rate)) {
            finishTurn(turn);
            return;
        }

        std::string user_text;
        try {
            user_text = collab.stt->transcribe(audio);
        } catch (const std::exception& e) {
            emitError(turn, whereOf(e, "stt"), e.what());
            setStateIf(turn, SessionState::IDLE);
            return;
        }

        user_text = llm::stripMarkdownForSpeech(trim(user_text));
        if (user_text.empty() || !live(turn)) {
            setStateIf(turn, SessionState::IDLE);
            return;
        }
        std::cout << log_tag << "User: " << user_text << std::endl;

        Profile current_profile;
        bool listen_mode = false;
        std::vector<std::string> triggers;
        std::string memory_summary;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            memory_summary = memory.contextFor(5, 500);
            memory.addText(user_text, "user");
            current_profile = profile;
            listen_mode = listen_only;
            triggers = trigger_phrases;
        }

        // Trigger = wake word at the start, or any configured trigger phrase
        const bool wake_triggered = commands::startsWithWakeWord(user_text, current_profile.wake_word);
        const std::string wake_stripped = commands::stripWakeWord(user_text, current_profile.wake_word);
        const std::string user_lower = lower(user_text);
        const bool triggered = wake_triggered ||
            std::any_of(triggers.begin(), triggers.end(),
                        [&](const std::string& t) { return user_lower.find(t) != std::string::npos; });

        const commands::RouteResult route =
            router.route(user_text, current_profile, memory_summary, listen_mode, triggers);

        if (config.echo_debug) {
            std::cout << log_tag << "Route handled=" << route.handled
                      << " triggered=" << triggered << " listen_only=" << listen_mode << std::endl;
        }

        if (!live(turn)) return;
        listen_mode = applyEffects(turn, route.effects);

        // Direct command reply: the LLM is not involved
        if (route.handled && route.response && !route.fact_check && !route.memory_query) {
            emit(turn, out::AsrFinal{turn.generation, nextTurnId(), user_text});
            emit(turn, out::Event{out::EventKind::Speaking, turn.generation});
            emit(turn, out::AssistantText{turn.generation, *route.response});
            speak(turn, *route.response);
            recordAssistant(user_text, *route.response, false);
            finishTurn(turn);
            return;
        }

        // Listen-only without a trigger: capture and keep listening
        if (listen_mode && !triggered) {
            size_t items = 0;
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                listen_buffer.push_back(user_text);
                items = listen_buffer.size();
            }
            emit(turn, out::AsrFinal{turn.generation, nextTurnId(), user_text});
            emit(turn, out::Stored{session_id, items});
            finishTurn(turn);
            return;
        }

        if (listen_mode && triggered) {
            std::vector<std::string> buffered;
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                listen_only = false;
                buffered.swap(listen_buffer);
            }
            emit(turn, out::MemoryEvent{"listening_mode_off"});

            std::string query = (wake_triggered && !wake_stripped.empty()) ? wake_stripped : user_text;
            std::string combined;
            for (const auto& u : buffered) {
                combined += (combined.empty() ? "" : " ") + u;
            }
            if (!trim(combined).empty()) query = trim(combined + " " + query);
            user_text = query;
        }

        emit(turn, out::AsrFinal{turn.generation, nextTurnId(), user_text});
        emit(turn, out::Event{out::EventKind::Speaking, turn.generation});

        if (route.fact_check) {
            factCheck(turn, user_text);
        } else if (route.memory_query) {
            resolveMemoryQuery(turn, *route.memory_query, user_text);
        } else if (knowledgeBaseEnabled()) {
            askKnowledgeBase(turn, user_text, user_text);
        } else {
            std::string compiled_context;
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                compiled_context = memory.contextFor(15, 3500);
            }
            streamReply(turn, user_text, compiled_context);
        }
        finishTurn(turn);
    }

    uint64_t nextTurnId() {
        std::lock_guard<std::mutex> lock(state_mutex);
        return ++turn_id;
    }

    /// Apply router effects; returns the listen-only flag afterwards.
    bool applyEffects(const Turn& turn, const commands::Effects& effects) {
        Profile updated;
        bool listen_mode = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            if (effects.set_assistant_name) {
                profile.assistant_name = *effects.set_assistant_name;
                profile.wake_word = *effects.set_assistant_name;
            }
            if (effects.set_user_name) profile.user_name = *effects.set_user_name;
            if (effects.set_timezone) profile.timezone = *effects.set_timezone;
            if (effects.set_location) profile.location = *effects.set_location;
            if (effects.set_listen_only) listen_only = *effects.set_listen_only;
            if (effects.clear_memory) {
                conversation.clearHistory();
                listen_buffer.clear();
                memory.clear();
            }
            updated = profile;
            listen_mode = listen_only;
        }

        if (effects.changesProfile()) {
            emit(turn, out::ProfileUpdate{updated});
        }
        if (effects.set_listen_only) {
            std::cout << log_tag << "listen_only=" << (listen_mode ? "true" : "false") << std::endl;
            emit(turn, out::MemoryEvent{listen_mode ? "listening_mode_on" : "listening_mode_off"});
        }
        return listen_mode;
    }

    bool knowledgeBaseEnabled() const {
        std::lock_guard<std::mutex> lock(state_mutex);
        return use_knowledge_base && collab.knowledge_base != nullptr;
    }

    rag::AskRequest askRequest(const std::string& message) const {
        std::lock_guard<std::mutex> lock(state_mutex);
        rag::AskRequest req;
        req.message = message;
        req.persona = persona;
        req.context_window = context_window.empty() ? "all" : context_window;
        return req;
    }

    /// Single backend RAG answer, spoken and recorded.
    void askKnowledgeBase(const Turn& turn, const std::string& user_text, const std::string& message) {
        std::string answer;
        try {
            answer = collab.knowledge_base->ask(askRequest(message));
        } catch (const std::exception& e) {
            emitError(turn, whereOf(e, "backend_rag"), e.what());
            return;
        }
        if (!live(turn)) return;

        const std::string clean = llm::stripMarkdownForSpeech(answer);
        if (!clean.empty()) emit(turn, out::AssistantText{turn.generation, clean});
        speak(turn, answer);
        recordAssistant(user_text, clean.empty() ? answer : clean, true);
    }

    void factCheck(const Turn& turn, const std::string& user_text) {
        std::string context;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            context = memory.contextFor(10, 3000);
        }

        if (knowledgeBaseEnabled()) {
            askKnowledgeBase(turn, user_text,
                             "Fact-check the following. User request: " + user_text + "\n\nContext:\n" + context);
            return;
        }

        auto messages = buildMessages(user_text, "", FACT_CHECK_PROMPT + context);
        auto reply = completeOnce(turn, messages);
        if (!reply || !live(turn)) return;

        const std::string clean = llm::stripMarkdownForSpeech(*reply);
        if (!clean.empty()) emit(turn, out::AssistantText{turn.generation, clean});
        speak(turn, *reply);
        recordAssistant(user_text, clean.empty() ? *reply : clean, true);
    }

    void resolveMemoryQuery(const Turn& turn, const commands::MemoryQuery& query, const std::string& user_text) {
        const double minutes = query.minutes.value_or(5.0);
        const std::string n = minutesText(minutes);

        switch (query.type) {
            case commands::MemoryQueryType::Recap: {
                std::string recap;
                {
                    std::lock_guard<std::mutex> lock(state_mutex);
                    recap = memory.summarizeLast(minutes);
                }
                std::string reply;
                if (!recap.empty()) {
                    emit(turn, out::MemoryInfo{turn.generation, recap, minutes, std::nullopt});
                    reply = recap.size() < 1500
                        ? "In the last " + n + " minutes, here's what was said:\n\n" + recap
                        : recap.substr(0, 1500) + "...";
                } else {
                    reply = "I don't have anything in the last " + n + " minutes.";
                }
                emit(turn, out::AssistantText{turn.generation, reply});
                speak(turn, reply.substr(0, 500));
                break;
            }

            case commands::MemoryQueryType::Summarize: {
                std::string transcript;
                {
                    std::lock_guard<std::mutex> lock(state_mutex);
                    transcript = memory.summarizeLast(minutes);
                }
                if (transcript.empty()) {
                    speak(turn, "No conversation in the last " + n + " minutes to summarize.");
                    break;
                }
                auto messages = buildMessages(
                    "Summarize this conversation from the last " + n + " minutes in 2-4 sentences.", "",
                    "You are a concise summarizer. Output only the summary, no preamble.\n\nConversation:\n" +
                        transcript.substr(0, 3000));
                if (auto reply = completeOnce(turn, messages)) {
                    const std::string clean = llm::stripMarkdownForSpeech(*reply);
                    emit(turn, out::AssistantText{turn.generation, clean});
                    speak(turn, clean);
                } else {
                    speak(turn, "I couldn't generate a summary.");
                }
                break;
            }

            case commands::MemoryQueryType::TimestampsTags: {
                std::vector<memory::MemoryEntry> entries;
                {
                    std::lock_guard<std::mutex> lock(state_mutex);
                    entries = memory.queryLast(minutes);
                }
                std::ostringstream lines;
                for (size_t i = 0; i < entries.size(); ++i) {
                    const auto& e = entries[i];
                    if (i > 0) lines << "\n";
                    lines << "[" << memory::ConversationMemory::formatClock(e.ts_start) << "] "
                          << (e.speaker.empty() ? "user" : e.speaker) << ": " << e.text.substr(0, 80)
                          << (e.text.size() > 80 ? "..." : "");
                    if (!e.tags.empty()) {
                        lines << " tags=[";
                        for (size_t t = 0; t < e.tags.size(); ++t) {
                            lines << (t ? ", " : "") << e.tags[t];
                        }
                        lines << "]";
                    }
                }
                const std::string reply = entries.empty() ? "No entries in that window." : lines.str();
                emit(turn, out::MemoryInfo{turn.generation, std::nullopt, std::nullopt, entries});
                emit(turn, out::AssistantText{turn.generation, reply});
                speak(turn, reply.substr(0, 400));
                break;
            }

            case commands::MemoryQueryType::WhenMentioned: {
                const std::string topic = query.topic.empty() ? user_text : query.topic;
                bool found = false;
                std::string transcript;
                {
                    std::lock_guard<std::mutex> lock(state_mutex);
                    // The question itself is already in memory
                    for (const auto& e : memory.queryTopic(topic)) {
                        if (e.text != user_text) {
                            found = true;
                            break;
                        }
                    }
                    if (found) transcript = memory.summarizeLast(30);
                }
                if (!found) {
                    speak(turn, "I don't have any mentions of that in recent conversation.");
                    break;
                }
                auto messages = buildMessages(
                    "When did we talk about this? User asked: " + user_text, "",
                    "Use only this transcript. List approximate times and who said what.\n\n" +
                        transcript.substr(0, 2500));
                if (auto reply = completeOnce(turn, messages)) {
                    const std::string clean = llm::stripMarkdownForSpeech(*reply);
                    emit(turn, out::AssistantText{turn.generation, clean});
                    speak(turn, clean);
                } else {
                    speak(turn, "I couldn't find that.");
                }
                break;
            }
        }
    }

    void streamReply(const Turn& turn, const std::string& user_text, const std::string& compiled_context) {
        const auto messages = buildMessages(user_text, compiled_context);
        auto stream = std::make_shared<TokenStream>();

        core::TaskHandle producer = tasks.spawn("llm_producer",
            [this, stream, messages, gen = turn.generation](const core::TaskHandle& self) {
                try {
                    collab.llm->streamTokens(messages, [&](const std::string& token) {
                        if (self.cancelled() || !cancellation.isCurrent(gen)) return false;
                        return stream->tokens.push(token);
                    });
                } catch (const std::exception& e) {
                    std::lock_guard<std::mutex> lock(stream->mutex);
                    stream->error = e.what();
                }
                stream->tokens.close();
            });

        // Unblocks the producer however this function exits
        struct StopProducer {
            core::TaskHandle& handle;
            TokenStream& stream;
            ~StopProducer() {
                handle.cancel();
                stream.tokens.close();
            }
        } stop_producer{producer, *stream};

        llm::PhraseSegmenter segmenter(llm::PhraseConfig{
            static_cast<size_t>(std::max(1, config.phrase_min_chars)),
            static_cast<size_t>(std::max(1, config.phrase_max_chars)),
            config.phrase_commit_pause_ms});
        const auto poll_interval = std::chrono::milliseconds(std::max(10, config.phrase_commit_pause_ms / 3));

        std::string assistant_text;
        while (true) {
            if (!live(turn)) return;

            auto token = stream->tokens.popFor(poll_interval);
            if (!token) {
                if (stream->tokens.closed() && stream->tokens.size() == 0) break;
                // Model paused: commit what is buffered
                if (auto phrase = segmenter.poll()) commitPhrase(turn, *phrase);
                continue;
            }

            assistant_text += *token;
            emit(turn, out::AssistantTextPartial{turn.generation, llm::stripMarkdownForSpeech(assistant_text)});
            if (auto phrase = segmenter.feed(*token)) commitPhrase(turn, *phrase);
        }

        std::optional<std::string> error;
        {
            std::lock_guard<std::mutex> lock(stream->mutex);
            error = stream->error;
        }

        if (!error) {
            if (!live(turn)) return;
            if (auto rest = segmenter.flush()) commitPhrase(turn, *rest);
            const std::string final_text = llm::stripMarkdownForSpeech(trim(assistant_text));
            if (!final_text.empty()) emit(turn, out::AssistantText{turn.generation, final_text});
            recordAssistant(user_text, final_text, true);
            return;
        }

        // One synchronous retry with the same messages
        emitError(turn, "llm_stream", *error);
        auto reply = completeOnce(turn, messages);
        if (!reply || !live(turn)) return;

        const std::string clean = llm::stripMarkdownForSpeech(*reply);
        if (!clean.empty()) emit(turn, out::AssistantText{turn.generation, clean});
        speak(turn, *reply);
        recordAssistant(user_text, clean.empty() ? *reply : clean, true);
    }

    // ------------------------------------------------------------------
    // Control messages
    // ------------------------------------------------------------------

    void applyContext(const protocol::in::SetContext& ctx) {
        std::string system_prompt;
        Profile updated;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            if (ctx.system_prompt && !trim(*ctx.system_prompt).empty()) {
                conversation.setSystemPrompt(trim(*ctx.system_prompt));
            }
            use_knowledge_base = ctx.use_knowledge_base;
            persona = ctx.persona;
            context_window = ctx.context_window;
            voice_bot_name = ctx.voice_bot_name;
            voice_user_name = ctx.voice_user_name;

            if (ctx.assistant_name) {
                const std::string name = trim(*ctx.assistant_name);
                if (!name.empty()) profile.assistant_name = name;
                profile.wake_word = profile.assistant_name;
            }
            if (ctx.wake_word) {
                const std::string wake = trim(*ctx.wake_word);
                if (!wake.empty()) profile.wake_word = wake;
            }
            if (ctx.user_name) profile.user_name = trim(*ctx.user_name);
            if (ctx.timezone) {
                const std::string tz = trim(*ctx.timezone);
                profile.timezone = tz.empty() ? "America/New_York" : tz;
            }
            if (ctx.location) profile.location = trim(*ctx.location);

            listen_only = ctx.listen_only;
            if (ctx.trigger_phrases) trigger_phrases = *ctx.trigger_phrases;
            if (ctx.clear_memory) {
                conversation.clearHistory();
                listen_buffer.clear();
            }

            system_prompt = conversation.systemPrompt();
            updated = profile;
        }

        send(out::ContextAck{system_prompt, ctx.clear_memory});
        send(out::ProfileUpdate{updated});
    }

    void clearHistory() {
        std::string system_prompt;
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            conversation.clearHistory();
            system_prompt = conversation.systemPrompt();
        }
        send(out::ContextAck{system_prompt, true});
    }

    void onAudioFrame(double ts, std::string pcm16) {
        if (closed || paused) return;
        if (pcm16.size() != static_cast<size_t>(config.frameBytes())) {
            const size_t n = ++rejected_frames;
            if (config.echo_debug && (n == 1 || n % 100 == 0)) {
                std::cout << log_tag << "Dropped " << n << " frames of wrong size (got "
                          << pcm16.size() << ", want " << config.frameBytes() << ")" << std::endl;
            }
            return;
        }
        inbound.push(audio::Frame{ts, std::move(pcm16)});
    }

    void onControl(const protocol::Inbound& message) {
        std::visit(core::Overloaded{
            [&](const protocol::in::Start&) { sendHandshake(); },
            [&](const protocol::in::Audio& m) {
                onAudioFrame(m.ts.value_or(nowSeconds()), m.pcm16);
            },
            [&](const protocol::in::Pause&) {
                paused = true;
                inbound.clear();
                cancelAssistantPipeline(false, true);
            },
            [&](const protocol::in::Resume&) { paused = false; },
            [&](const protocol::in::Stop&) { inbound.push(ForceEndpoint{}); },
            [&](const protocol::in::SetContext& m) { applyContext(m); },
            [&](const protocol::in::ClearMemory&) { clearHistory(); },
        }, message);
    }

    // ------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------

    void start() {
        if (started.exchange(true)) return;

        if (collab.make_speech_core) {
            speech_core = collab.make_speech_core();
            const bool connected = speech_core && speech_core->connect(
                [this](std::optional<uint64_t> generation, int sample_rate, std::string pcm16) {
                    const uint64_t gen = generation.value_or(cancellation.current());
                    cancellation.emitIfCurrent(gen, [&]() {
                        outbound.push(out::AudioOut{gen, sample_rate, 1.0f, std::move(pcm16)});
                    });
                });
            if (!connected) {
                std::cerr << log_tag << "Speech core unavailable, using local TTS" << std::endl;
                speech_core.reset();
            }
        }

        sender_thread = std::thread([this]() { sendLoop(); });
        consumer_thread = std::thread([this]() { consumeLoop(); });

        std::cout << log_tag << "Started" << std::endl;
        sendHandshake();

        const std::string intro = trim(config.intro_phrase);
        if (!intro.empty() && collab.tts) {
            std::lock_guard<std::mutex> lock(tasks_mutex);
            const uint64_t gen = cancellation.current();
            intro_task = tasks.spawn("intro", [this, gen, intro](const core::TaskHandle& self) {
                playIntro(Turn{gen, self}, intro);
            });
        }
    }

    void close() {
        if (closed.exchange(true) && !consumer_thread.joinable() && !sender_thread.joinable()) return;

        // Fence every in-flight task before tearing the queues down
        cancellation.cancel([&](uint64_t) { tasks.cancelAll(); });

        inbound.close();
        outbound.close();
        if (consumer_thread.joinable()) consumer_thread.join();
        if (sender_thread.joinable()) sender_thread.join();
        tasks.joinAll();

        if (speech_core) {
            speech_core->close();
        }
        std::cout << log_tag << "Closed" << std::endl;
    }
};

VoiceSession::VoiceSession(std::string session_id,
                           const Config& config,
                           Collaborators collaborators,
                           std::shared_ptr<Transport> transport)
    : impl_(std::make_unique<Impl>(std::move(session_id), config, std::move(collaborators), std::move(transport))) {
}

VoiceSession::~VoiceSession() {
    close();
}

void VoiceSession::start() { impl_->start(); }
void VoiceSession::close() { impl_->close(); }

void VoiceSession::onBinary(const std::string& bytes) {
    impl_->onAudioFrame(nowSeconds(), bytes);
}

void VoiceSession::onText(const std::string& text) {
    auto decoded = protocol::decodeInbound(text);
    if (!decoded) {
        std::cerr << impl_->log_tag << "Protocol error: " << decoded.error << std::endl;
        impl_->send(out::Error{"protocol", decoded.error, std::nullopt});
        return;
    }
    impl_->onControl(*decoded.message);
}

void VoiceSession::onAudioFrame(double timestamp, std::string pcm16) {
    impl_->onAudioFrame(timestamp, std::move(pcm16));
}

void VoiceSession::onControl(const protocol::Inbound& message) {
    impl_->onControl(message);
}

uint64_t VoiceSession::cancelAssistantPipeline(bool keep_listening, bool send_cancel) {
    return impl_->cancelAssistantPipeline(keep_listening, send_cancel);
}

const std::string& VoiceSession::id() const { return impl_->session_id; }
uint64_t VoiceSession::generation() const { return impl_->cancellation.current(); }
SessionState VoiceSession::state() const { return impl_->state.load(); }
bool VoiceSession::assistantActive() const { return impl_->assistantActive(); }
bool VoiceSession::paused() const { return impl_->paused.load(); }

bool VoiceSession::listenOnly() const {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->listen_only;
}

Profile VoiceSession::profile() const { return impl_->profileSnapshot(); }

size_t VoiceSession::historySize() const {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->conversation.history().size();
}

size_t VoiceSession::memorySize() const {
    std::lock_guard<std::mutex> lock(impl_->state_mutex);
    return impl_->memory.size();
}

} // namespace emv::session
