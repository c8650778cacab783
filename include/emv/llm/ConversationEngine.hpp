/**
 * ConversationEngine.hpp - System prompt, profile line and bounded chat history
 */

#pragma once

#include "emv/llm/ChatModel.hpp"
#include "emv/session/Profile.hpp"

#include <string>
#include <vector>

namespace emv::llm {

struct HistoryLimits {
    size_t max_turns = 12;     // user+assistant pairs
    size_t max_tokens = 1400;  // approximate, system prompt included
};

class ConversationEngine {
public:
    static constexpr const char* DEFAULT_SYSTEM_PROMPT =
        "You are a realtime voice assistant. Be concise, helpful, and conversational.";

    explicit ConversationEngine(HistoryLimits limits = {});

    void setSystemPrompt(const std::string& prompt);
    const std::string& systemPrompt() const { return system_prompt_; }

    /**
     * Profile line + system prompt, optionally followed by recent
     * conversation context.
     */
    std::string systemMessage(const session::Profile& profile,
                              const std::string& compiled_context = "") const;

    /**
     * Trim history, then build [system, history..., user].
     * A non-empty `system_override` replaces the profile system message.
     */
    std::vector<Message> buildMessages(const std::string& user_text,
                                       const session::Profile& profile,
                                       const std::string& compiled_context = "",
                                       const std::string& system_override = "");

    void addTurn(const std::string& user_text, const std::string& assistant_text);
    void clearHistory();
    const std::vector<Message>& history() const { return history_; }

    static std::string profileLine(const session::Profile& profile);

    /// ~4 characters per token, at least 1.
    static size_t approxTokens(const std::string& text);

private:
    void trimHistory();

    HistoryLimits limits_;
    std::string system_prompt_;
    std::vector<Message> history_;
};

} // namespace emv::llm
