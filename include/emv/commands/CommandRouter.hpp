/**
 * CommandRouter.hpp - Deterministic voice command routing
 *
 * Classifies an utterance into an intent (profile changes, listen-only
 * mode, memory queries, fact-check) and turns it into a RouteResult the
 * session applies. No model calls.
 */

#pragma once

#include "emv/session/Profile.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace emv::commands {

enum class MemoryQueryType {
    Recap,
    Summarize,
    WhenMentioned,
    TimestampsTags
};

const char* toString(MemoryQueryType type);

struct MemoryQuery {
    MemoryQueryType type = MemoryQueryType::Recap;
    std::optional<double> minutes;  // absent -> caller default
    std::string topic;              // WhenMentioned only
};

namespace intent {

struct None {};
struct SetAssistantName { std::string name; };
struct SetUserName { std::string name; };
struct SetTimezone { std::string timezone; };
struct SetLocation { std::string location; };
struct StartListening {};
struct StopListening {};
struct ResumeListening {};
struct ClearMemory {};
struct QueryMemory { MemoryQuery query; };
struct FactCheck {};

} // namespace intent

using Intent = std::variant<
    intent::None,
    intent::SetAssistantName,
    intent::SetUserName,
    intent::SetTimezone,
    intent::SetLocation,
    intent::StartListening,
    intent::StopListening,
    intent::ResumeListening,
    intent::ClearMemory,
    intent::QueryMemory,
    intent::FactCheck>;

/**
 * Swappable classification strategy (keyword today, a model tomorrow).
 */
class IntentClassifier {
public:
    virtual ~IntentClassifier() = default;
    virtual Intent classify(const std::string& utterance) const = 0;
};

class KeywordIntentClassifier : public IntentClassifier {
public:
    Intent classify(const std::string& utterance) const override;

    /// "last 5 minutes" -> 5, "10 min ago" -> 10
    static std::optional<double> extractMinutes(const std::string& utterance);
};

struct Effects {
    std::optional<std::string> set_assistant_name;  // also the wake word
    std::optional<std::string> set_user_name;
    std::optional<std::string> set_timezone;
    std::optional<std::string> set_location;
    std::optional<bool> set_listen_only;
    bool clear_memory = false;

    bool changesProfile() const {
        return set_assistant_name || set_user_name || set_timezone || set_location;
    }
};

struct RouteResult {
    bool handled = false;
    std::optional<std::string> response;  // spoken directly, LLM skipped
    Effects effects;
    std::optional<MemoryQuery> memory_query;
    bool fact_check = false;
};

class CommandRouter {
public:
    CommandRouter();
    explicit CommandRouter(std::shared_ptr<const IntentClassifier> classifier);

    /**
     * Classify `utterance` and build the reply and effects. The current
     * profile, listen-only flag and trigger phrases shape the spoken
     * responses; `memory_summary` is the memory context before this
     * utterance (empty when nothing was said yet).
     */
    RouteResult route(const std::string& utterance,
                      const session::Profile& profile,
                      const std::string& memory_summary,
                      bool listen_only,
                      const std::vector<std::string>& trigger_phrases) const;

private:
    std::shared_ptr<const IntentClassifier> classifier_;
};

/// Remove a leading wake word (case-insensitive) plus " ,;:" separators.
std::string stripWakeWord(const std::string& utterance, const std::string& wake_word);

/// True if the utterance begins with the wake word (case-insensitive).
bool startsWithWakeWord(const std::string& utterance, const std::string& wake_word);

} // namespace emv::commands
