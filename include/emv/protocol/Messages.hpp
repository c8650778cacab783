/**
 * Messages.hpp - WebSocket protocol as closed message variants
 *
 * JSON exists only at the edge: decodeInbound() parses client text frames,
 * toJson()/encode() render server messages.
 */

#pragma once

#include "emv/memory/ConversationMemory.hpp"
#include "emv/session/Profile.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace emv::protocol {

// ---------------------------------------------------------------------------
// Client -> server
// ---------------------------------------------------------------------------
namespace in {

struct Start {};

struct Audio {
    std::string pcm16;          // decoded bytes
    std::optional<double> ts;
};

struct Pause {};
struct Resume {};
struct Stop {};  // "stop" or "eos"

struct SetContext {
    std::optional<std::string> system_prompt;
    bool use_knowledge_base = false;
    std::string persona;
    std::string context_window = "all";
    std::string voice_bot_name;
    std::string voice_user_name;
    std::optional<std::string> assistant_name;
    std::optional<std::string> wake_word;
    std::optional<std::string> user_name;
    std::optional<std::string> timezone;
    std::optional<std::string> location;
    bool listen_only = false;
    std::optional<std::vector<std::string>> trigger_phrases;
    bool clear_memory = false;
};

struct ClearMemory {};

} // namespace in

using Inbound = std::variant<
    in::Start,
    in::Audio,
    in::Pause,
    in::Resume,
    in::Stop,
    in::SetContext,
    in::ClearMemory>;

struct DecodeResult {
    std::optional<Inbound> message;
    std::string error;  // set when message is empty

    explicit operator bool() const { return message.has_value(); }
};

DecodeResult decodeInbound(const std::string& text);

// ---------------------------------------------------------------------------
// Server -> client
// ---------------------------------------------------------------------------
namespace out {

struct Hello {
    std::string session_id;
    std::string note;
};

struct ContextAck {
    std::string system_prompt;
    std::optional<bool> cleared;
};

struct ProfileUpdate {
    session::Profile profile;
};

enum class EventKind {
    Speaking,
    Thinking,
    UserSpeechStart,
    UserSpeechEnd,
    BackToListening
};

struct Event {
    EventKind event;
    uint64_t generation = 0;
};

struct AsrFinal {
    uint64_t generation = 0;
    uint64_t turn_id = 0;
    std::string text;
};

struct AssistantText {
    uint64_t generation = 0;
    std::string text;
};

struct AssistantTextPartial {
    uint64_t generation = 0;
    std::string text;
};

struct AssistantPhrase {
    uint64_t generation = 0;
    std::string text;
};

struct AudioOut {
    uint64_t generation = 0;
    int sample_rate = 0;
    float playback_rate = 1.0f;
    std::string pcm16;  // raw bytes, base64 encoded on the wire
};

struct Cancel {
    uint64_t generation = 0;
};

struct MemoryEvent {
    std::string event;  // listening_mode_on | listening_mode_off
};

struct MemoryInfo {
    uint64_t generation = 0;
    std::optional<std::string> summary;
    std::optional<double> minutes;
    std::optional<std::vector<memory::MemoryEntry>> entries;
};

struct Stored {
    std::string session_id;
    size_t items = 0;
};

struct Error {
    std::string where;
    std::string message;
    std::optional<uint64_t> generation;
};

} // namespace out

using Outbound = std::variant<
    out::Hello,
    out::ContextAck,
    out::ProfileUpdate,
    out::Event,
    out::AsrFinal,
    out::AssistantText,
    out::AssistantTextPartial,
    out::AssistantPhrase,
    out::AudioOut,
    out::Cancel,
    out::MemoryEvent,
    out::MemoryInfo,
    out::Stored,
    out::Error>;

const char* toString(out::EventKind kind);
const char* typeName(const Outbound& message);

/// Generation tag, if the message carries one.
std::optional<uint64_t> generationOf(const Outbound& message);

/**
 * True when the message belongs to an epoch older than `current` and must
 * not reach the client. User speech events and cancels are never stale.
 */
bool isStale(const Outbound& message, uint64_t current);

nlohmann::json toJson(const Outbound& message);
std::string encode(const Outbound& message);

} // namespace emv::protocol
