/**
 * Messages.cpp - JSON codec for the session WebSocket protocol
 */

#include "emv/protocol/Messages.hpp"
#include "emv/core/Overloaded.hpp"
#include "emv/protocol/Base64.hpp"

#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace emv::protocol {

namespace {

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

/// Scalars as text; strings unquoted.
std::string asText(const json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return "";
    return v.dump();
}

bool truthy(const json& v) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number_integer()) return v.get<long long>() != 0;
    if (v.is_number()) return v.get<double>() != 0.0;
    if (v.is_string()) return !v.get<std::string>().empty();
    if (v.is_array() || v.is_object()) return !v.empty();
    return false;
}

/// Present and not null.
std::optional<std::string> optionalText(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    return asText(*it);
}

bool flag(const json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && truthy(*it);
}

in::SetContext decodeSetContext(const json& data) {
    in::SetContext ctx;

    ctx.system_prompt = optionalText(data, "system_prompt");
    ctx.use_knowledge_base = flag(data, "use_knowledge_base");
    ctx.persona = trim(optionalText(data, "persona").value_or(""));
    ctx.context_window = trim(optionalText(data, "context_window").value_or(""));
    if (ctx.context_window.empty()) ctx.context_window = "all";
    ctx.voice_bot_name = trim(optionalText(data, "voice_bot_name").value_or(""));
    ctx.voice_user_name = trim(optionalText(data, "voice_user_name").value_or(""));

    ctx.assistant_name = optionalText(data, "assistant_name");
    ctx.wake_word = optionalText(data, "wake_word");
    ctx.user_name = optionalText(data, "user_name");
    ctx.timezone = optionalText(data, "timezone");
    ctx.location = optionalText(data, "location");

    ctx.listen_only = flag(data, "listen_only");
    ctx.clear_memory = flag(data, "clear_memory");

    auto triggers = data.find("trigger_phrases");
    if (triggers != data.end() && triggers->is_array()) {
        std::vector<std::string> phrases;
        for (const auto& item : *triggers) {
            std::string phrase = lower(trim(asText(item)));
            if (!phrase.empty()) phrases.push_back(std::move(phrase));
        }
        ctx.trigger_phrases = std::move(phrases);
    }
    return ctx;
}

DecodeResult failure(std::string error) {
    DecodeResult r;
    r.error = std::move(error);
    return r;
}

} // anonymous namespace

DecodeResult decodeInbound(const std::string& text) {
    json data = json::parse(text, nullptr, false);
    if (data.is_discarded()) return failure("malformed JSON");
    if (!data.is_object()) return failure("expected a JSON object");

    const std::string type = asText(data.value("type", json()));
    DecodeResult r;

    if (type == "start") {
        r.message = in::Start{};
    } else if (type == "audio" || type == "audio_frame") {
        std::string b64 = asText(data.value("pcm16_b64", json()));
        if (b64.empty()) b64 = asText(data.value("pcm", json()));
        if (b64.empty()) return failure("audio message without pcm16_b64");

        auto pcm = base64Decode(b64);
        if (!pcm) return failure("audio payload is not valid base64");

        in::Audio audio;
        audio.pcm16 = std::move(*pcm);
        auto ts = data.find("ts");
        if (ts != data.end() && ts->is_number()) audio.ts = ts->get<double>();
        r.message = std::move(audio);
    } else if (type == "pause") {
        r.message = in::Pause{};
    } else if (type == "resume") {
        r.message = in::Resume{};
    } else if (type == "stop" || type == "eos") {
        r.message = in::Stop{};
    } else if (type == "set_context") {
        r.message = decodeSetContext(data);
    } else if (type == "clear_memory") {
        r.message = in::ClearMemory{};
    } else if (type.empty()) {
        return failure("message without type");
    } else {
        return failure("unknown message type: " + type);
    }
    return r;
}

const char* toString(out::EventKind kind) {
    switch (kind) {
        case out::EventKind::Speaking: return "SPEAKING";
        case out::EventKind::Thinking: return "THINKING";
        case out::EventKind::UserSpeechStart: return "USER_SPEECH_START";
        case out::EventKind::UserSpeechEnd: return "USER_SPEECH_END";
        case out::EventKind::BackToListening: return "BACK_TO_LISTENING";
    }
    return "UNKNOWN";
}

const char* typeName(const Outbound& message) {
    return std::visit(core::Overloaded{
        [](const out::Hello&) { return "hello"; },
        [](const out::ContextAck&) { return "context_ack"; },
        [](const out::ProfileUpdate&) { return "profile_update"; },
        [](const out::Event&) { return "event"; },
        [](const out::AsrFinal&) { return "asr_final"; },
        [](const out::AssistantText&) { return "assistant_text"; },
        [](const out::AssistantTextPartial&) { return "assistant_text_partial"; },
        [](const out::AssistantPhrase&) { return "assistant_phrase"; },
        [](const out::AudioOut&) { return "audio_out"; },
        [](const out::Cancel&) { return "cancel"; },
        [](const out::MemoryEvent&) { return "memory_event"; },
        [](const out::MemoryInfo&) { return "memory_info"; },
        [](const out::Stored&) { return "stored"; },
        [](const out::Error&) { return "error"; },
    }, message);
}

std::optional<uint64_t> generationOf(const Outbound& message) {
    return std::visit(core::Overloaded{
        [](const out::Event& m) -> std::optional<uint64_t> { return m.generation; },
        [](const out::AsrFinal& m) -> std::optional<uint64_t> { return m.generation; },
        [](const out::AssistantText& m) -> std::optional<uint64_t> { return m.generation; },
        [](const out::AssistantTextPartial& m) -> std::optional<uint64_t> { return m.generation; },
        [](const out::AssistantPhrase& m) -> std::optional<uint64_t> { return m.generation; },
        [](const out::AudioOut& m) -> std::optional<uint64_t> { return m.generation; },
        [](const out::Cancel& m) -> std::optional<uint64_t> { return m.generation; },
        [](const out::MemoryInfo& m) -> std::optional<uint64_t> { return m.generation; },
        [](const out::Error& m) { return m.generation; },
        [](const auto&) -> std::optional<uint64_t> { return std::nullopt; },
    }, message);
}

bool isStale(const Outbound& message, uint64_t current) {
    if (std::holds_alternative<out::Cancel>(message)) return false;
    if (const auto* event = std::get_if<out::Event>(&message)) {
        if (event->event == out::EventKind::UserSpeechStart ||
            event->event == out::EventKind::UserSpeechEnd) {
            return false;
        }
    }
    const auto generation = generationOf(message);
    return generation && *generation < current;
}

json toJson(const Outbound& message) {
    json j = std::visit(core::Overloaded{
        [](const out::Hello& m) {
            return json{{"session_id", m.session_id}, {"note", m.note}};
        },
        [](const out::ContextAck& m) {
            json o{{"system_prompt", m.system_prompt}};
            if (m.cleared) o["cleared"] = *m.cleared;
            return o;
        },
        [](const out::ProfileUpdate& m) {
            return json(m.profile);
        },
        [](const out::Event& m) {
            return json{{"event", toString(m.event)}, {"generation_id", m.generation}};
        },
        [](const out::AsrFinal& m) {
            return json{{"turn_id", m.turn_id}, {"generation_id", m.generation}, {"text", m.text}};
        },
        [](const out::AssistantText& m) {
            return json{{"generation_id", m.generation}, {"text", m.text}};
        },
        [](const out::AssistantTextPartial& m) {
            return json{{"generation_id", m.generation}, {"text", m.text}};
        },
        [](const out::AssistantPhrase& m) {
            return json{{"generation_id", m.generation}, {"text", m.text}};
        },
        [](const out::AudioOut& m) {
            return json{
                {"generation_id", m.generation},
                {"sample_rate", m.sample_rate},
                {"playback_rate", m.playback_rate},
                {"pcm16_b64", base64Encode(m.pcm16)}
            };
        },
        [](const out::Cancel& m) {
            return json{{"generation_id", m.generation}};
        },
        [](const out::MemoryEvent& m) {
            return json{{"event", m.event}};
        },
        [](const out::MemoryInfo& m) {
            json o{{"generation_id", m.generation}};
            if (m.summary) o["summary"] = *m.summary;
            if (m.minutes) o["minutes"] = *m.minutes;
            if (m.entries) {
                json arr = json::array();
                for (const auto& e : *m.entries) arr.push_back(e.toJson());
                o["entries"] = std::move(arr);
            }
            return o;
        },
        [](const out::Stored& m) {
            return json{{"session_id", m.session_id}, {"items", m.items}};
        },
        [](const out::Error& m) {
            json o{{"where", m.where}, {"message", m.message}};
            if (m.generation) o["generation_id"] = *m.generation;
            return o;
        },
    }, message);

    j["type"] = typeName(message);
    return j;
}

std::string encode(const Outbound& message) {
    // Transcripts may carry invalid UTF-8; replace rather than throw
    return toJson(message).dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace emv::protocol
