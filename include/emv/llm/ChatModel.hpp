/**
 * ChatModel.hpp - Chat completion collaborator interface
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace emv::llm {

struct Message {
    enum class Role { System, User, Assistant };

    Role role = Role::User;
    std::string content;
};

const char* toString(Message::Role role);
nlohmann::json toJson(const std::vector<Message>& messages);

/// Called per streamed token; return false to stop the stream.
using TokenCallback = std::function<bool(const std::string&)>;

class ChatModel {
public:
    virtual ~ChatModel() = default;

    /**
     * Stream a completion token by token. Blocks until the stream ends or
     * the callback returns false. Throws emv::ServiceError("llm_stream").
     */
    virtual void streamTokens(const std::vector<Message>& messages, const TokenCallback& on_token) = 0;

    /// Single non-streamed completion. Throws emv::ServiceError("llm").
    virtual std::string complete(const std::vector<Message>& messages) = 0;
};

} // namespace emv::llm
