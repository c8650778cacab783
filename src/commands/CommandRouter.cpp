/**
 * CommandRouter.cpp - Keyword intent classification and routing
 */

#include "emv/commands/CommandRouter.hpp"
#include "emv/core/Overloaded.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <string>

namespace emv::commands {

namespace {

std::string trim(const std::string& s, const char* chars = " \t\r\n") {
    auto begin = s.find_first_not_of(chars);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(chars);
    return s.substr(begin, end - begin + 1);
}

std::string normalize(const std::string& s) {
    std::string out = trim(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

/// Value after a leading pattern, or nullopt when absent / empty.
std::optional<std::string> extractAfter(const std::string& u, const std::string& pattern) {
    if (!startsWith(u, pattern)) return std::nullopt;
    std::string rest = trim(u.substr(pattern.size()));
    if (rest.empty()) return std::nullopt;
    return rest;
}

bool matchAny(const std::string& u, std::initializer_list<const char*> phrases) {
    for (const char* p : phrases) {
        if (u.find(p) != std::string::npos) return true;
    }
    return false;
}

/// "when did we talk about the budget?" -> "budget"; the whole utterance when no marker matches.
std::string mentionTopic(const std::string& u) {
    std::string topic = u;
    for (const char* marker : {" talk about ", " talked about ", " mention ", " mentioned ",
                               " discuss ", " discussed ", "when was "}) {
        const auto at = u.rfind(marker);
        if (at != std::string::npos) {
            topic = u.substr(at + std::char_traits<char>::length(marker));
            break;
        }
    }
    topic = trim(topic, " \t\r\n?.!,");
    for (const char* article : {"the ", "a ", "an ", "our ", "my ", "that "}) {
        if (startsWith(topic, article)) {
            topic = trim(topic.substr(std::char_traits<char>::length(article)));
            break;
        }
    }
    return topic.empty() ? u : topic;
}

} // anonymous namespace

const char* toString(MemoryQueryType type) {
    switch (type) {
        case MemoryQueryType::Recap: return "recap";
        case MemoryQueryType::Summarize: return "summarize";
        case MemoryQueryType::WhenMentioned: return "when_mentioned";
        case MemoryQueryType::TimestampsTags: return "timestamps_tags";
    }
    return "recap";
}

std::optional<double> KeywordIntentClassifier::extractMinutes(const std::string& utterance) {
    static const std::regex last_re(R"((?:last|past)\s+(\d+)\s*(?:minute|min)s?\b)");
    static const std::regex ago_re(R"((\d+)\s*(?:minute|min)s?\s*(?:ago|back))");

    const std::string u = normalize(utterance);
    std::smatch m;
    if (std::regex_search(u, m, last_re)) return std::stod(m[1].str());
    if (std::regex_search(u, m, ago_re)) return std::stod(m[1].str());
    return std::nullopt;
}

Intent KeywordIntentClassifier::classify(const std::string& utterance) const {
    const std::string u = normalize(utterance);

    // Assistant name / wake word
    for (const char* pattern : {"your name is ", "call yourself ", "change wake word to ",
                                "wake word is ", "you're called "}) {
        auto name = extractAfter(u, pattern);
        if (name && name->size() < 80) return intent::SetAssistantName{*name};
    }

    // User name ("i'm" / "i am" are left to location so "I'm in X" is not a name)
    for (const char* pattern : {"my name is ", "call me "}) {
        auto name = extractAfter(u, pattern);
        if (name && name->size() < 80) return intent::SetUserName{*name};
    }

    if (matchAny(u, {"set timezone to ", "timezone is ", "my timezone is ", "i'm in timezone "})) {
        static const std::regex tz_re(R"((?:timezone|time zone)\s+(?:is|to)?\s*([\w/\s+-]+?)(?:\s*\.|$))");
        static const std::regex tz_fallback_re(R"((?:set\s+)?timezone\s+to\s+([\w/\s+-]+))");
        std::smatch m;
        if (std::regex_search(u, m, tz_re) || std::regex_search(u, m, tz_fallback_re)) {
            std::string tz = trim(m[1].str());
            if (!tz.empty() && tz.size() < 60) return intent::SetTimezone{tz};
        }
    }

    for (const char* pattern : {"i'm in ", "i am in ", "location is ", "i'm at ", "set location to "}) {
        auto loc = extractAfter(u, pattern);
        if (loc && loc->size() < 120) return intent::SetLocation{*loc};
    }

    if (matchAny(u, {"listen to conversation", "start listening", "just listen", "keep listening"})) {
        return intent::StartListening{};
    }

    if (matchAny(u, {"stop listening", "pause listening", "pause", "don't listen", "stop"})) {
        // a bare "stop" is ambiguous
        if (matchAny(u, {"listening", "pause", "don't listen"})) return intent::StopListening{};
    }

    if (matchAny(u, {"resume listening", "resume", "start listening again"})) {
        return intent::ResumeListening{};
    }

    if (matchAny(u, {"clear memory", "clear conversation", "forget everything", "reset memory"})) {
        return intent::ClearMemory{};
    }

    const auto minutes = extractMinutes(u);
    if (minutes && matchAny(u, {"what did i say", "what did we say", "what was said", "recap", "last minutes"})) {
        return intent::QueryMemory{{MemoryQueryType::Recap, minutes, ""}};
    }
    if (minutes && matchAny(u, {"summarize", "summary", "summarise"})) {
        return intent::QueryMemory{{MemoryQueryType::Summarize, minutes, ""}};
    }

    if (matchAny(u, {"when did we", "when did i", "when did you", "when was",
                     "when did we mention", "when did we talk about"})) {
        return intent::QueryMemory{{MemoryQueryType::WhenMentioned, std::nullopt, mentionTopic(u)}};
    }

    if (matchAny(u, {"timestamps and tags", "give timestamps", "list with timestamps", "who said what"})) {
        return intent::QueryMemory{{MemoryQueryType::TimestampsTags, minutes, ""}};
    }

    if (matchAny(u, {"fact check", "fact check it", "fact check that", "verify that", "verify it"})) {
        return intent::FactCheck{};
    }

    return intent::None{};
}

CommandRouter::CommandRouter()
    : classifier_(std::make_shared<KeywordIntentClassifier>()) {
}

CommandRouter::CommandRouter(std::shared_ptr<const IntentClassifier> classifier)
    : classifier_(std::move(classifier)) {
    if (!classifier_) classifier_ = std::make_shared<KeywordIntentClassifier>();
}

RouteResult CommandRouter::route(const std::string& utterance,
                                 const session::Profile& profile,
                                 const std::string& memory_summary,
                                 bool listen_only,
                                 const std::vector<std::string>& trigger_phrases) const {
    RouteResult r;
    const Intent intent = classifier_->classify(utterance);

    const std::string wake_word = profile.wake_word.empty() ? profile.assistant_name : profile.wake_word;
    const std::string resume_hint = trigger_phrases.empty() ? "now you can speak" : trigger_phrases.front();

    std::visit(core::Overloaded{
        [&](const intent::None&) {},
        [&](const intent::SetAssistantName& i) {
            r.handled = true;
            r.effects.set_assistant_name = i.name;
            r.response = normalize(profile.assistant_name) == i.name
                ? "I already respond to the name " + i.name + "."
                : "Got it. I'll respond to the name " + i.name + ".";
        },
        [&](const intent::SetUserName& i) {
            r.handled = true;
            r.effects.set_user_name = i.name;
            r.response = "Nice to meet you, " + i.name + ".";
        },
        [&](const intent::SetTimezone& i) {
            r.handled = true;
            r.effects.set_timezone = i.timezone;
            r.response = "Timezone set to " + i.timezone + ".";
        },
        [&](const intent::SetLocation& i) {
            r.handled = true;
            r.effects.set_location = i.location;
            r.response = "Noted. Location: " + i.location + ".";
        },
        [&](const intent::StartListening&) {
            r.handled = true;
            r.effects.set_listen_only = true;
            if (listen_only) {
                r.response = "I'm already listening. Say " + wake_word + " or '" + resume_hint +
                             "' when you want me to respond.";
            } else {
                r.response = "I'm now listening to the conversation. Say " + wake_word + " or '" +
                             resume_hint + "' when you want me to respond.";
            }
        },
        [&](const intent::StopListening&) {
            r.handled = true;
            r.effects.set_listen_only = false;
            r.response = listen_only
                ? "Stopped listening. Say 'start listening' when you want me to listen again."
                : "I wasn't in listening mode.";
        },
        [&](const intent::ResumeListening&) {
            r.handled = true;
            r.effects.set_listen_only = true;
            r.response = listen_only ? "I'm still listening." : "Resuming. I'm listening again.";
        },
        [&](const intent::ClearMemory&) {
            r.handled = true;
            r.effects.clear_memory = true;
            r.response = trim(memory_summary).empty() ? "There was nothing to forget." : "Memory cleared.";
        },
        [&](const intent::QueryMemory& i) {
            r.handled = true;
            r.memory_query = i.query;
        },
        [&](const intent::FactCheck&) {
            r.handled = true;
            r.fact_check = true;
        },
    }, intent);

    return r;
}

std::string stripWakeWord(const std::string& utterance, const std::string& wake_word) {
    const std::string u = trim(utterance);
    const std::string w = normalize(wake_word);
    if (w.empty()) return u;

    if (!startsWithWakeWord(u, wake_word)) return u;

    std::string rest = u.substr(w.size());
    const auto pos = rest.find_first_not_of(" ,;:");
    if (pos == std::string::npos) return "";
    return trim(rest.substr(pos));
}

bool startsWithWakeWord(const std::string& utterance, const std::string& wake_word) {
    const std::string w = normalize(wake_word);
    if (w.empty()) return false;
    return startsWith(normalize(utterance), w);
}

} // namespace emv::commands
