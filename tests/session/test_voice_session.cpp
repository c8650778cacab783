/**
 * test_voice_session.cpp - Session state machine with fake collaborators
 *
 * Frames are pushed the way the WebSocket reader does; the recorded
 * transport sees exactly what a client would.
 */

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <nlohmann/json.hpp>

#include "emv/Error.hpp"
#include "emv/audio/Pcm.hpp"
#include "emv/llm/ConversationEngine.hpp"
#include "emv/rag/KnowledgeBase.hpp"
#include "emv/session/VoiceSession.hpp"

using json = nlohmann::json;
using namespace emv;
using namespace emv::session;
using std::chrono::milliseconds;

namespace {

// ----------------------------------------------------------------------------
// Fakes
// ----------------------------------------------------------------------------

class RecordingTransport : public Transport {
public:
    void sendText(const std::string& text) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(json::parse(text));
        }
        cv_.notify_all();
    }

    std::vector<json> snapshot() {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    bool waitFor(const std::function<bool(const std::vector<json>&)>& pred, milliseconds timeout = milliseconds(5000)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() { return pred(messages_); });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<json> messages_;
};

class AlwaysSpeech : public audio::FrameClassifier {
public:
    bool isSpeech(const audio::Frame&) override { return true; }
};

/// Blocks inside the first classification until released.
class HeldSpeech : public audio::FrameClassifier {
public:
    struct Latch {
        std::mutex mutex;
        std::condition_variable cv;
        bool released = false;
        std::atomic<bool> entered{false};

        void release() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                released = true;
            }
            cv.notify_all();
        }
    };

    explicit HeldSpeech(std::shared_ptr<Latch> latch) : latch_(std::move(latch)) {}

    bool isSpeech(const audio::Frame&) override {
        latch_->entered = true;
        std::unique_lock<std::mutex> lock(latch_->mutex);
        latch_->cv.wait(lock, [this]() { return latch_->released; });
        return true;
    }

private:
    std::shared_ptr<Latch> latch_;
};

class FakeTranscriber : public stt::Transcriber {
public:
    std::string transcribe(const std::vector<float>&) override {
        calls++;
        if (delay_ms > 0) std::this_thread::sleep_for(milliseconds(delay_ms));
        if (fail) throw ServiceError("stt", "decoder exploded");
        std::lock_guard<std::mutex> lock(mutex);
        return text;
    }

    void say(const std::string& t) {
        std::lock_guard<std::mutex> lock(mutex);
        text = t;
    }

    std::mutex mutex;
    std::string text = "hello there";
    std::atomic<int> calls{0};
    int delay_ms = 0;
    bool fail = false;
};

class FakeChatModel : public llm::ChatModel {
public:
    void streamTokens(const std::vector<llm::Message>& messages, const llm::TokenCallback& on_token) override {
        record(messages);
        stream_calls++;
        if (fail_stream) throw ServiceError("llm_stream", "connection reset");
        for (const auto& t : tokens) {
            if (token_delay_ms > 0) std::this_thread::sleep_for(milliseconds(token_delay_ms));
            if (!on_token(t)) return;
            delivered++;
        }
    }

    std::string complete(const std::vector<llm::Message>& messages) override {
        record(messages);
        complete_calls++;
        return completion;
    }

    std::vector<llm::Message> lastMessages() {
        std::lock_guard<std::mutex> lock(mutex);
        return last_messages;
    }

    std::vector<std::string> tokens = {"Sure", ", here", " is", " the", " answer."};
    std::string completion = "Fallback reply.";
    int token_delay_ms = 0;
    bool fail_stream = false;
    std::atomic<int> stream_calls{0};
    std::atomic<int> complete_calls{0};
    std::atomic<int> delivered{0};

private:
    void record(const std::vector<llm::Message>& messages) {
        std::lock_guard<std::mutex> lock(mutex);
        last_messages = messages;
    }

    std::mutex mutex;
    std::vector<llm::Message> last_messages;
};

class FakeSynthesizer : public tts::Synthesizer {
public:
    tts::Synthesis synthesize(const std::string&) override {
        calls++;
        return tts::Synthesis{std::vector<float>(7200, 0.2f), 24000};  // 0.3 s
    }

    std::atomic<int> calls{0};
};

class FakeKnowledgeBase : public rag::KnowledgeBase {
public:
    std::string ask(const rag::AskRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex);
        requests.push_back(request);
        if (fail) throw std::runtime_error("503 from backend");
        return answer;
    }

    std::vector<rag::AskRequest> received() {
        std::lock_guard<std::mutex> lock(mutex);
        return requests;
    }

    std::mutex mutex;
    std::vector<rag::AskRequest> requests;
    std::string answer = "The launch is on Friday.";
    bool fail = false;
};

// ----------------------------------------------------------------------------
// Helpers
// ----------------------------------------------------------------------------

size_t count(const std::vector<json>& msgs, const std::string& type, const std::string& event = "") {
    size_t n = 0;
    for (const auto& m : msgs) {
        if (m.value("type", "") != type) continue;
        if (!event.empty() && m.value("event", "") != event) continue;
        n++;
    }
    return n;
}

std::function<bool(const std::vector<json>&)> has(const std::string& type, const std::string& event = "",
                                                  size_t n = 1) {
    return [=](const std::vector<json>& msgs) { return count(msgs, type, event) >= n; };
}

/// Polls for session state that is not announced by a message.
bool eventually(const std::function<bool()>& cond, milliseconds timeout = milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(milliseconds(10));
    }
    return cond();
}

const json* find(const std::vector<json>& msgs, const std::string& type, const std::string& event = "") {
    for (const auto& m : msgs) {
        if (m.value("type", "") == type && (event.empty() || m.value("event", "") == event)) return &m;
    }
    return nullptr;
}

// ----------------------------------------------------------------------------
// Harness
// ----------------------------------------------------------------------------

struct Harness {
    std::shared_ptr<FakeTranscriber> stt = std::make_shared<FakeTranscriber>();
    std::shared_ptr<FakeChatModel> llm = std::make_shared<FakeChatModel>();
    std::shared_ptr<FakeSynthesizer> tts = std::make_shared<FakeSynthesizer>();
    std::shared_ptr<RecordingTransport> transport = std::make_shared<RecordingTransport>();
    std::shared_ptr<FakeKnowledgeBase> kb;  // optional
    std::function<std::unique_ptr<audio::FrameClassifier>()> classifier;  // AlwaysSpeech when empty
    Config config;
    std::unique_ptr<VoiceSession> session;

    Harness() {
        config.intro_phrase = "";
        config.endpoint_silence_ms = 100;  // 5 frames
        config.min_speech_ms = 100;
        config.end_tail_ms = 40;
        config.tts_chunk_seconds = 0.1f;
        config.emotion_mode = false;
    }

    void start() {
        Collaborators c;
        c.stt = stt;
        c.llm = llm;
        c.tts = tts;
        c.knowledge_base = kb;
        if (classifier) {
            c.make_classifier = classifier;
        } else {
            c.make_classifier = []() { return std::make_unique<AlwaysSpeech>(); };
        }
        session = std::make_unique<VoiceSession>("0123456789abcdef", config, std::move(c), transport);
        session->start();
    }

    void frames(int count, bool loud) {
        const std::vector<float> samples(static_cast<size_t>(config.frameSamples()), loud ? 0.3f : 0.0f);
        const std::string pcm = audio::floatToPcm16(samples);
        for (int i = 0; i < count; ++i) {
            session->onAudioFrame(0.0, pcm);
        }
    }

    void utterance(const std::string& text) {
        stt->say(text);
        frames(20, true);
        frames(8, false);
    }

    /// Speak and wait for the n-th turn to finish.
    void turn(const std::string& text, size_t n) {
        utterance(text);
        assert(waitFor(has("event", "BACK_TO_LISTENING", n)));
        assert(eventually([&]() { return session->state() == SessionState::IDLE; }));
    }

    bool waitFor(const std::function<bool(const std::vector<json>&)>& pred) {
        return transport->waitFor(pred);
    }
};

} // anonymous namespace

// ----------------------------------------------------------------------------
// Tests
// ----------------------------------------------------------------------------

void test_handshake() {
    std::cout << "\n--- Test: Handshake ---" << std::endl;
    Harness h;
    h.start();

    assert(h.waitFor(has("profile_update")));
    auto msgs = h.transport->snapshot();
    assert(msgs[0]["type"] == "hello");
    assert(msgs[0]["session_id"] == "0123456789abcdef");
    assert(msgs[1]["type"] == "context_ack");
    assert(msgs[1]["system_prompt"] == llm::ConversationEngine::DEFAULT_SYSTEM_PROMPT);
    assert(msgs[2]["type"] == "profile_update");
    assert(msgs[2]["assistant_name"] == "EchoMind");
    assert(h.session->state() == SessionState::IDLE);
    assert(h.session->generation() == 0);

    // A repeated start re-sends the handshake
    h.session->onText(R"({"type":"start"})");
    assert(h.waitFor(has("hello", "", 2)));

    std::cout << "[PASS] Handshake sent in order" << std::endl;
}

void test_intro_phrase() {
    std::cout << "\n--- Test: Intro phrase ---" << std::endl;
    Harness h;
    h.config.intro_phrase = "Hi, I'm listening.";
    h.start();

    assert(h.waitFor(has("event", "BACK_TO_LISTENING")));
    auto msgs = h.transport->snapshot();
    assert(find(msgs, "event", "SPEAKING"));
    const json* audio = find(msgs, "audio_out");
    assert(audio && (*audio)["generation_id"] == 0);
    assert((*audio)["sample_rate"] == 24000);
    assert(h.tts->calls == 1);

    std::cout << "[PASS] Intro spoken then back to listening" << std::endl;
}

void test_full_turn() {
    std::cout << "\n--- Test: Full turn ---" << std::endl;
    Harness h;
    h.start();
    h.utterance("what is the weather");

    assert(h.waitFor(has("event", "BACK_TO_LISTENING")));
    auto msgs = h.transport->snapshot();

    const char* expected_order[] = {"USER_SPEECH_START", "USER_SPEECH_END", "THINKING", "SPEAKING", "BACK_TO_LISTENING"};
    size_t next = 0;
    for (const auto& m : msgs) {
        if (m["type"] == "event" && next < 5 && m["event"] == expected_order[next]) next++;
    }
    assert(next == 5);

    const json* asr = find(msgs, "asr_final");
    assert(asr && (*asr)["text"] == "what is the weather");
    assert((*asr)["turn_id"] == 1);
    assert((*asr)["generation_id"] == 1);

    assert(count(msgs, "assistant_text_partial") == 5);
    const json* phrase = find(msgs, "assistant_phrase");
    assert(phrase && (*phrase)["text"] == "Sure, here is the answer.");
    assert(count(msgs, "audio_out") == 3);
    const json* final_text = find(msgs, "assistant_text");
    assert(final_text && (*final_text)["text"] == "Sure, here is the answer.");

    // The user turn bumped the epoch once
    assert(h.session->generation() == 1);
    assert(h.llm->stream_calls == 1);

    auto sent = h.llm->lastMessages();
    assert(sent.front().role == llm::Message::Role::System);
    assert(sent.back().content == "what is the weather");

    assert(eventually([&]() { return h.session->state() == SessionState::IDLE; }));
    assert(h.session->historySize() == 2);
    assert(h.session->memorySize() == 2);

    std::cout << "[PASS] Transcript, reply and audio delivered" << std::endl;
}

void test_barge_in_fences_old_generation() {
    std::cout << "\n--- Test: Barge-in ---" << std::endl;
    Harness h;
    h.llm->tokens.clear();
    for (int i = 0; i < 10; ++i) {
        for (const char* t : {"This", " is", " a", " sentence."}) h.llm->tokens.push_back(t);
    }
    h.llm->token_delay_ms = 40;
    h.start();
    h.utterance("tell me a story");

    assert(h.waitFor(has("audio_out")));
    const uint64_t speaking_gen = h.session->generation();
    assert(h.session->assistantActive());

    // Lead while the assistant talks is 6 frames
    h.frames(8, true);
    assert(h.waitFor(has("cancel")));
    std::this_thread::sleep_for(milliseconds(300));

    auto msgs = h.transport->snapshot();
    size_t cancel_at = 0;
    for (size_t i = 0; i < msgs.size(); ++i) {
        if (msgs[i]["type"] == "cancel") cancel_at = i;
    }
    assert(msgs[cancel_at]["generation_id"] == speaking_gen + 1);

    // Nothing from the interrupted generation follows the cancel
    for (size_t i = cancel_at + 1; i < msgs.size(); ++i) {
        const auto& m = msgs[i];
        if (!m.contains("generation_id")) continue;
        if (m["generation_id"].get<uint64_t>() >= speaking_gen + 1) continue;
        assert(m["type"] == "event");
        assert(m["event"] == "USER_SPEECH_START" || m["event"] == "USER_SPEECH_END");
    }

    assert(find(msgs, "event", "USER_SPEECH_START"));
    assert(h.session->state() == SessionState::LISTENING);
    assert(h.llm->delivered < 40);

    std::cout << "[PASS] cancel{" << speaking_gen + 1 << "} fenced the old reply" << std::endl;
}

void test_single_finalize_in_flight() {
    std::cout << "\n--- Test: One finalize at a time ---" << std::endl;
    Harness h;
    h.stt->delay_ms = 300;
    h.start();

    h.utterance("first");
    assert(h.waitFor(has("event", "THINKING")));
    h.utterance("second");

    assert(h.waitFor(has("event", "BACK_TO_LISTENING")));
    std::this_thread::sleep_for(milliseconds(400));
    auto msgs = h.transport->snapshot();

    assert(count(msgs, "asr_final") == 1);
    assert(find(msgs, "asr_final")->at("text") == "second");
    assert(h.stt->calls == 2);
    assert(h.llm->stream_calls == 1);

    std::cout << "[PASS] Superseded finalize never replied" << std::endl;
}

void test_listen_only_stores_then_triggers() {
    std::cout << "\n--- Test: Listen-only mode ---" << std::endl;
    Harness h;
    h.start();
    h.session->onText(R"({"type":"set_context","listen_only":true})");
    assert(h.waitFor(has("profile_update", "", 2)));
    assert(h.session->listenOnly());

    h.utterance("we should ship on friday");
    assert(h.waitFor(has("stored")));
    assert(h.waitFor(has("event", "BACK_TO_LISTENING")));
    auto msgs = h.transport->snapshot();
    assert(find(msgs, "stored")->at("items") == 1);
    assert(find(msgs, "asr_final")->at("text") == "we should ship on friday");
    assert(h.llm->stream_calls == 0);

    h.utterance("now you can speak");
    assert(h.waitFor(has("memory_event")));
    assert(h.waitFor(has("assistant_text")));

    msgs = h.transport->snapshot();
    assert(find(msgs, "memory_event")->at("event") == "listening_mode_off");
    assert(!h.session->listenOnly());
    assert(h.llm->lastMessages().back().content == "we should ship on friday now you can speak");

    std::cout << "[PASS] Buffered speech answered on trigger" << std::endl;
}

void test_direct_command() {
    std::cout << "\n--- Test: Direct command ---" << std::endl;
    Harness h;
    h.start();
    h.utterance("My name is Ana");

    assert(h.waitFor(has("event", "BACK_TO_LISTENING")));
    auto msgs = h.transport->snapshot();
    assert(count(msgs, "profile_update") == 2);
    assert(msgs.back()["type"] == "event");

    const json* reply = find(msgs, "assistant_text");
    assert(reply && (*reply)["text"] == "Nice to meet you, ana.");
    assert(h.session->profile().user_name == "ana");
    assert(h.llm->stream_calls == 0 && h.llm->complete_calls == 0);
    assert(h.tts->calls == 1);

    std::cout << "[PASS] Command answered without the LLM" << std::endl;
}

void test_set_context_and_clear() {
    std::cout << "\n--- Test: set_context / clear_memory ---" << std::endl;
    Harness h;
    h.start();
    h.session->onText(R"({"type":"set_context","system_prompt":"Be a pirate.","assistant_name":"Nova","timezone":""})");
    assert(h.waitFor(has("context_ack", "", 2)));
    assert(h.waitFor(has("profile_update", "", 2)));

    auto msgs = h.transport->snapshot();
    assert(msgs[3]["system_prompt"] == "Be a pirate.");
    Profile p = h.session->profile();
    assert(p.assistant_name == "Nova" && p.wake_word == "Nova");
    assert(p.timezone == "America/New_York");

    h.session->onText(R"({"type":"clear_memory"})");
    assert(h.waitFor(has("context_ack", "", 3)));
    msgs = h.transport->snapshot();
    assert(msgs.back()["cleared"] == true);

    std::cout << "[PASS] Context applied and acknowledged" << std::endl;
}

void test_pause_resume_and_bad_frames() {
    std::cout << "\n--- Test: Pause / resume ---" << std::endl;
    Harness h;
    h.start();

    h.session->onText(R"({"type":"pause"})");
    assert(h.waitFor(has("cancel")));
    assert(h.session->paused());
    assert(h.session->generation() == 1);

    h.utterance("ignored");
    h.session->onBinary("abc");
    std::this_thread::sleep_for(milliseconds(200));
    assert(count(h.transport->snapshot(), "event", "USER_SPEECH_START") == 0);

    h.session->onText(R"({"type":"resume"})");
    assert(!h.session->paused());

    // Wrong-size frames are dropped even when not paused
    for (int i = 0; i < 30; ++i) h.session->onBinary(std::string(100, '\x7f'));
    std::this_thread::sleep_for(milliseconds(100));
    assert(count(h.transport->snapshot(), "event", "USER_SPEECH_START") == 0);

    h.utterance("back again");
    assert(h.waitFor(has("asr_final")));

    std::cout << "[PASS] Paused audio ignored, resume restores input" << std::endl;
}

void test_eos_forces_endpoint() {
    std::cout << "\n--- Test: eos ---" << std::endl;
    Harness h;
    h.start();
    h.stt->say("cut short");
    h.frames(20, true);
    h.session->onText(R"({"type":"eos"})");

    assert(h.waitFor(has("asr_final")));
    assert(find(h.transport->snapshot(), "asr_final")->at("text") == "cut short");

    std::cout << "[PASS] eos ends the utterance" << std::endl;
}

void test_protocol_error() {
    std::cout << "\n--- Test: Protocol error ---" << std::endl;
    Harness h;
    h.start();
    h.session->onText("{oops");
    h.session->onText(R"({"type":"dance"})");

    assert(h.waitFor(has("error", "", 2)));
    auto msgs = h.transport->snapshot();
    const json* err = find(msgs, "error");
    assert((*err)["where"] == "protocol");
    assert((*err)["message"] == "malformed JSON");

    std::cout << "[PASS] Bad messages reported, session alive" << std::endl;
}

void test_stt_failure() {
    std::cout << "\n--- Test: STT failure ---" << std::endl;
    Harness h;
    h.stt->fail = true;
    h.start();
    h.utterance("anything");

    assert(h.waitFor(has("error")));
    const auto msgs = h.transport->snapshot();
    const json* err = find(msgs, "error");
    assert((*err)["where"] == "stt");
    assert((*err)["generation_id"] == 1);
    assert(eventually([&]() { return h.session->state() == SessionState::IDLE; }));
    assert(h.llm->stream_calls == 0);

    std::cout << "[PASS] STT error reported" << std::endl;
}

void test_llm_stream_fallback() {
    std::cout << "\n--- Test: LLM stream fallback ---" << std::endl;
    Harness h;
    h.llm->fail_stream = true;
    h.start();
    h.utterance("explain gravity");

    assert(h.waitFor(has("assistant_text")));
    assert(h.waitFor(has("event", "BACK_TO_LISTENING")));
    auto msgs = h.transport->snapshot();
    assert(find(msgs, "error")->at("where") == "llm_stream");
    assert(find(msgs, "assistant_text")->at("text") == "Fallback reply.");
    assert(h.llm->complete_calls == 1);
    assert(count(msgs, "audio_out") == 3);

    std::cout << "[PASS] Fell back to a single completion" << std::endl;
}

void test_memory_recap() {
    std::cout << "\n--- Test: Memory recap ---" << std::endl;
    Harness h;
    h.start();
    h.utterance("what did we say in the last 5 minutes");

    assert(h.waitFor(has("memory_info")));
    assert(h.waitFor(has("assistant_text")));
    auto msgs = h.transport->snapshot();
    const json* info = find(msgs, "memory_info");
    assert((*info)["minutes"] == 5.0);
    assert((*info)["summary"].get<std::string>().find("what did we say") != std::string::npos);

    const std::string reply = find(msgs, "assistant_text")->at("text");
    assert(reply.rfind("In the last 5 minutes, here's what was said:", 0) == 0);
    assert(h.llm->stream_calls == 0);

    std::cout << "[PASS] Recap answered from memory" << std::endl;
}

void test_memory_summarize() {
    std::cout << "\n--- Test: Memory summarize ---" << std::endl;
    Harness h;
    h.llm->completion = "You talked about a tight budget.";
    h.start();
    h.turn("the budget is tight this quarter", 1);

    h.turn("summarize the last 5 minutes", 2);
    auto msgs = h.transport->snapshot();
    assert(count(msgs, "assistant_text") == 2);
    assert(msgs[msgs.size() - 1]["event"] == "BACK_TO_LISTENING");
    bool summary_sent = false;
    for (const auto& m : msgs) {
        if (m.value("type", "") == "assistant_text" && m["text"] == "You talked about a tight budget.") {
            summary_sent = true;
        }
    }
    assert(summary_sent);
    assert(h.llm->complete_calls == 1 && h.llm->stream_calls == 1);

    const auto sent = h.llm->lastMessages();
    assert(sent.front().content.find("Conversation:") != std::string::npos);
    assert(sent.front().content.find("the budget is tight this quarter") != std::string::npos);
    assert(sent.back().content == "Summarize this conversation from the last 5 minutes in 2-4 sentences.");

    std::cout << "[PASS] Summary generated from the memory window" << std::endl;
}

void test_when_mentioned() {
    std::cout << "\n--- Test: When was it mentioned ---" << std::endl;
    Harness h;
    h.llm->completion = "At 10:02 you said the budget is tight.";
    h.start();

    // Nothing said about it yet: spoken answer, no model call
    h.turn("when did we talk about the budget", 1);
    assert(h.llm->complete_calls == 0 && h.llm->stream_calls == 0);
    assert(count(h.transport->snapshot(), "assistant_text") == 0);
    assert(h.tts->calls == 1);

    h.turn("the budget is tight", 2);
    h.turn("when did we talk about the budget", 3);
    assert(h.llm->complete_calls == 1);
    auto msgs = h.transport->snapshot();
    const json* last_text = nullptr;
    for (const auto& m : msgs) {
        if (m.value("type", "") == "assistant_text") last_text = &m;
    }
    assert(last_text && (*last_text)["text"] == "At 10:02 you said the budget is tight.");

    const auto sent = h.llm->lastMessages();
    assert(sent.front().content.rfind("Use only this transcript.", 0) == 0);
    assert(sent.front().content.find("the budget is tight") != std::string::npos);

    std::cout << "[PASS] Miss answered directly, hit resolved against the transcript" << std::endl;
}

void test_timestamps_and_tags() {
    std::cout << "\n--- Test: Timestamps and tags ---" << std::endl;
    Harness h;
    h.start();
    h.turn("the launch moved to friday", 1);
    h.turn("give timestamps and tags", 2);

    auto msgs = h.transport->snapshot();
    const json* info = find(msgs, "memory_info");
    assert(info && (*info)["entries"].is_array());
    const json& entries = (*info)["entries"];
    assert(entries.size() == 3);  // user, assistant, this request
    assert(entries[0]["text"] == "the launch moved to friday");
    assert(entries[0]["speaker"] == "user");
    assert(entries[1]["speaker"] == "assistant");

    const json* last_text = nullptr;
    for (const auto& m : msgs) {
        if (m.value("type", "") == "assistant_text") last_text = &m;
    }
    const std::string listing = (*last_text)["text"];
    assert(listing.rfind("[", 0) == 0);
    assert(listing.find("user: the launch moved to friday") != std::string::npos);
    assert(h.llm->complete_calls == 0);

    std::cout << "[PASS] Entries listed with clock times" << std::endl;
}

void test_fact_check_with_model() {
    std::cout << "\n--- Test: Fact check with the model ---" << std::endl;
    Harness h;
    h.llm->completion = "Water boils at 100 C at sea level, so that is correct.";
    h.start();
    h.turn("water boils at one hundred degrees", 1);
    h.turn("can you fact check that", 2);

    assert(h.llm->complete_calls == 1 && h.llm->stream_calls == 1);
    const auto sent = h.llm->lastMessages();
    assert(sent.front().content.rfind("You are a fact-checking assistant.", 0) == 0);
    assert(sent.front().content.find("water boils at one hundred degrees") != std::string::npos);

    auto msgs = h.transport->snapshot();
    bool verdict = false;
    for (const auto& m : msgs) {
        if (m.value("type", "") == "assistant_text" &&
            m["text"] == "Water boils at 100 C at sea level, so that is correct.") {
            verdict = true;
        }
    }
    assert(verdict);
    assert(h.session->historySize() == 4);

    std::cout << "[PASS] Fact check answered by a single completion" << std::endl;
}

void test_knowledge_base_answers() {
    std::cout << "\n--- Test: Knowledge base ---" << std::endl;
    Harness h;
    h.kb = std::make_shared<FakeKnowledgeBase>();
    h.start();

    // Present but not enabled: the model answers
    h.turn("when is the launch", 1);
    assert(h.kb->received().empty());
    assert(h.llm->stream_calls == 1);

    h.session->onText(R"({"type":"set_context","use_knowledge_base":true,"persona":" analyst ","context_window":"24h"})");
    assert(h.waitFor(has("context_ack", "", 2)));

    h.turn("when is the launch", 2);
    auto asked = h.kb->received();
    assert(asked.size() == 1);
    assert(asked[0].message == "when is the launch");
    assert(asked[0].persona == "analyst");
    assert(asked[0].context_window == "24h");
    assert(h.llm->stream_calls == 1);

    auto msgs = h.transport->snapshot();
    const json* last_text = nullptr;
    for (const auto& m : msgs) {
        if (m.value("type", "") == "assistant_text") last_text = &m;
    }
    assert((*last_text)["text"] == "The launch is on Friday.");

    // Fact check goes to the backend with the recent transcript
    h.turn("fact check that", 3);
    asked = h.kb->received();
    assert(asked.size() == 2);
    assert(asked[1].message.rfind("Fact-check the following. User request: fact check that", 0) == 0);
    assert(asked[1].message.find("The launch is on Friday.") != std::string::npos);
    assert(h.llm->complete_calls == 0);

    std::cout << "[PASS] Backend answers replace the model when enabled" << std::endl;
}

void test_knowledge_base_failure() {
    std::cout << "\n--- Test: Knowledge base failure ---" << std::endl;
    Harness h;
    h.kb = std::make_shared<FakeKnowledgeBase>();
    h.kb->fail = true;
    h.start();
    h.session->onText(R"({"type":"set_context","use_knowledge_base":true})");
    assert(h.waitFor(has("context_ack", "", 2)));

    h.turn("what changed today", 1);
    auto msgs = h.transport->snapshot();
    const json* err = find(msgs, "error");
    assert(err && (*err)["where"] == "backend_rag");
    assert((*err)["generation_id"] == 1);
    assert(count(msgs, "assistant_text") == 0);
    assert(h.llm->stream_calls == 0);

    std::cout << "[PASS] Backend error reported, turn still ends" << std::endl;
}

void test_pause_drops_queued_frames() {
    std::cout << "\n--- Test: Pause drops queued frames ---" << std::endl;
    Harness h;
    auto latch = std::make_shared<HeldSpeech::Latch>();
    h.classifier = [latch]() { return std::make_unique<HeldSpeech>(latch); };
    h.start();
    assert(h.waitFor(has("profile_update")));

    // The first frame parks in the classifier, the rest queue behind it
    h.frames(20, true);
    assert(eventually([&]() { return latch->entered.load(); }));

    std::thread releaser([latch]() {
        std::this_thread::sleep_for(milliseconds(100));
        latch->release();
    });
    h.session->onText(R"({"type":"pause"})");
    releaser.join();

    std::this_thread::sleep_for(milliseconds(300));
    auto msgs = h.transport->snapshot();
    assert(count(msgs, "cancel") == 1);
    assert(count(msgs, "event", "USER_SPEECH_START") == 0);
    assert(h.session->state() == SessionState::IDLE);

    h.session->onText(R"({"type":"resume"})");
    h.utterance("after the pause");
    assert(h.waitFor(has("asr_final")));
    assert(find(h.transport->snapshot(), "asr_final")->at("text") == "after the pause");

    std::cout << "[PASS] Frames queued before pause never reach the gate" << std::endl;
}

void test_short_clip_returns_to_listening() {
    std::cout << "\n--- Test: Clip too short to transcribe ---" << std::endl;
    Harness h;
    h.start();

    // Long enough to count as speech, under a quarter second of audio
    h.frames(6, true);
    h.frames(8, false);

    assert(h.waitFor(has("event", "BACK_TO_LISTENING")));
    auto msgs = h.transport->snapshot();
    assert(count(msgs, "event", "THINKING") == 1);
    assert(msgs.back()["event"] == "BACK_TO_LISTENING");
    assert(msgs.back()["generation_id"] == 1);
    assert(count(msgs, "asr_final") == 0);
    assert(h.stt->calls == 0);
    assert(eventually([&]() { return h.session->state() == SessionState::IDLE; }));

    std::cout << "[PASS] THINKING is always closed by BACK_TO_LISTENING" << std::endl;
}

int main() {
    std::cout << "=== Voice Session Tests ===" << std::endl;

    test_handshake();
    test_intro_phrase();
    test_full_turn();
    test_barge_in_fences_old_generation();
    test_single_finalize_in_flight();
    test_listen_only_stores_then_triggers();
    test_direct_command();
    test_set_context_and_clear();
    test_pause_resume_and_bad_frames();
    test_eos_forces_endpoint();
    test_protocol_error();
    test_stt_failure();
    test_llm_stream_fallback();
    test_memory_recap();
    test_memory_summarize();
    test_when_mentioned();
    test_timestamps_and_tags();
    test_fact_check_with_model();
    test_knowledge_base_answers();
    test_knowledge_base_failure();
    test_pause_drops_queued_frames();
    test_short_clip_returns_to_listening();

    std::cout << "\nAll voice session tests passed!" << std::endl;
    return 0;
}
