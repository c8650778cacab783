/**
 * ConversationEngine.cpp - Chat message assembly for the voice assistant
 */

#include "emv/llm/ConversationEngine.hpp"

#include <algorithm>
#include <sstream>

namespace emv::llm {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

} // anonymous namespace

ConversationEngine::ConversationEngine(HistoryLimits limits)
    : limits_(limits)
    , system_prompt_(DEFAULT_SYSTEM_PROMPT) {
}

void ConversationEngine::setSystemPrompt(const std::string& prompt) {
    system_prompt_ = prompt;
}

size_t ConversationEngine::approxTokens(const std::string& text) {
    return std::max<size_t>(1, text.size() / 4);
}

std::string ConversationEngine::profileLine(const session::Profile& profile) {
    std::stringstream line;
    line << "Assistant name: " << (profile.assistant_name.empty() ? "EchoMind" : profile.assistant_name) << ".";
    line << " User name: " << (profile.user_name.empty() ? "User" : profile.user_name) << ".";
    line << " Timezone: " << (profile.timezone.empty() ? "America/New_York" : profile.timezone) << ".";
    if (!profile.location.empty()) {
        line << " Location: " << profile.location << ".";
    }
    return line.str();
}

std::string ConversationEngine::systemMessage(const session::Profile& profile,
                                              const std::string& compiled_context) const {
    std::string base = trim(system_prompt_);
    if (!compiled_context.empty()) {
        base += "\n\nRecent conversation context (for reference):\n" + compiled_context;
    }
    return profileLine(profile) + " " + base;
}

void ConversationEngine::trimHistory() {
    const size_t max_messages = limits_.max_turns * 2;
    if (history_.size() > max_messages) {
        history_.erase(history_.begin(), history_.end() - static_cast<std::ptrdiff_t>(max_messages));
    }

    size_t total = approxTokens(system_prompt_);
    for (const auto& msg : history_) {
        total += approxTokens(msg.content);
    }

    // Oldest first until under budget
    size_t drop = 0;
    while (drop < history_.size() && total > limits_.max_tokens) {
        total -= approxTokens(history_[drop].content);
        ++drop;
    }
    history_.erase(history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(drop));
}

std::vector<Message> ConversationEngine::buildMessages(const std::string& user_text,
                                                       const session::Profile& profile,
                                                       const std::string& compiled_context,
                                                       const std::string& system_override) {
    trimHistory();

    std::vector<Message> messages;
    messages.reserve(history_.size() + 2);
    messages.push_back({Message::Role::System,
                        system_override.empty() ? systemMessage(profile, compiled_context) : system_override});
    messages.insert(messages.end(), history_.begin(), history_.end());
    messages.push_back({Message::Role::User, user_text});
    return messages;
}

void ConversationEngine::addTurn(const std::string& user_text, const std::string& assistant_text) {
    history_.push_back({Message::Role::User, user_text});
    history_.push_back({Message::Role::Assistant, assistant_text});
    trimHistory();
}

void ConversationEngine::clearHistory() {
    history_.clear();
}

} // namespace emv::llm
