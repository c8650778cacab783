/**
 * LLMClient.hpp - OpenAI-compatible chat completions over HTTP
 */

#pragma once

#include "emv/llm/ChatModel.hpp"

#include <memory>
#include <string>

namespace emv::llm {

struct LLMOptions {
    std::string model = "qwen2.5:7b-instruct";
    float temperature = 0.7f;
    int max_tokens = 220;
    int timeout_ms = 90000;
    int stream_timeout_ms = 120000;
};

class LLMClient : public ChatModel {
public:
    /**
     * @param url full endpoint, e.g. http://127.0.0.1:11434/v1/chat/completions
     */
    explicit LLMClient(const std::string& url, LLMOptions options = {});
    ~LLMClient() override;

    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    bool isHealthy();

    void streamTokens(const std::vector<Message>& messages, const TokenCallback& on_token) override;
    std::string complete(const std::vector<Message>& messages) override;

    const std::string& url() const { return url_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string url_;
};

} // namespace emv::llm
