/**
 * ChatModel.cpp - Chat message serialization
 */

#include "emv/llm/ChatModel.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace emv::llm {

const char* toString(Message::Role role) {
    switch (role) {
        case Message::Role::System: return "system";
        case Message::Role::User: return "user";
        case Message::Role::Assistant: return "assistant";
    }
    return "user";
}

json toJson(const std::vector<Message>& messages) {
    json arr = json::array();
    for (const auto& m : messages) {
        arr.push_back({{"role", toString(m.role)}, {"content", m.content}});
    }
    return arr;
}

} // namespace emv::llm
