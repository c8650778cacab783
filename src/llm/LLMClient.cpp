/**
 * LLMClient.cpp - HTTP client for OpenAI-compatible servers (Ollama, llama.cpp)
 *
 * Uses cpp-httplib with Request.content_receiver for true streaming responses.
 */

#include "emv/llm/LLMClient.hpp"
#include "emv/Error.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace emv::llm {

namespace {

/// Split "http://host:port/path" into ("http://host:port", "/path").
std::pair<std::string, std::string> splitUrl(const std::string& url) {
    const auto scheme = url.find("://");
    const auto path_start = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    if (path_start == std::string::npos) return {url, "/"};
    return {url.substr(0, path_start), url.substr(path_start)};
}

void setTimeouts(httplib::Client& client, int timeout_ms) {
    client.set_connection_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
    client.set_read_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
    client.set_write_timeout(timeout_ms / 1000, (timeout_ms % 1000) * 1000);
}

} // anonymous namespace

struct LLMClient::Impl {
    std::string host;
    std::string path;
    LLMOptions options;

    Impl(const std::string& url, LLMOptions opts) : options(std::move(opts)) {
        std::tie(host, path) = splitUrl(url);
    }

    // One client per request: sessions stream concurrently
    std::unique_ptr<httplib::Client> makeClient(int timeout_ms) const {
        auto client = std::make_unique<httplib::Client>(host);
        setTimeouts(*client, timeout_ms);
        return client;
    }

    json buildRequest(const std::vector<Message>& messages, bool stream) const {
        return {
            {"model", options.model},
            {"messages", toJson(messages)},
            {"temperature", options.temperature},
            {"max_tokens", options.max_tokens},
            {"stream", stream}
        };
    }
};

LLMClient::LLMClient(const std::string& url, LLMOptions options)
    : impl_(std::make_unique<Impl>(url, std::move(options)))
    , url_(url) {
    std::cout << "[LLMClient] Endpoint " << url_ << " (model " << impl_->options.model << ")" << std::endl;
}

LLMClient::~LLMClient() = default;

bool LLMClient::isHealthy() {
    auto client = impl_->makeClient(3000);
    std::string models_path = impl_->path;
    const auto pos = models_path.rfind("/chat/completions");
    if (pos != std::string::npos) models_path = models_path.substr(0, pos) + "/models";

    auto res = client->Get(models_path);
    return res && res->status == 200;
}

void LLMClient::streamTokens(const std::vector<Message>& messages, const TokenCallback& on_token) {
    const std::string body = impl_->buildRequest(messages, true).dump();
    std::cout << "[LLMClient] POST " << impl_->path << " stream=true messages=" << messages.size() << std::endl;

    bool should_stop = false;
    bool done = false;
    std::string buffer;
    std::string error_body;

    httplib::Request req;
    req.method = "POST";
    req.path = impl_->path;
    req.set_header("Content-Type", "application/json");
    req.set_header("Accept", "text/event-stream");
    req.body = body;

    req.content_receiver = [&](const char* data, size_t data_length,
                               uint64_t /*offset*/, uint64_t /*total_length*/) -> bool {
        if (should_stop || done) return false;

        buffer.append(data, data_length);

        size_t pos;
        while ((pos = buffer.find('\n')) != std::string::npos) {
            std::string line = buffer.substr(0, pos);
            buffer.erase(0, pos + 1);

            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) continue;

            std::string json_str = line;
            if (line.rfind("data:", 0) == 0) {
                json_str = line.substr(5);
                if (!json_str.empty() && json_str.front() == ' ') json_str.erase(0, 1);
            }

            if (json_str == "[DONE]") {
                done = true;
                return false;
            }

            json chunk = json::parse(json_str, nullptr, false);
            if (chunk.is_discarded()) {
                // Non-JSON body: most likely an error page, keep it for the message
                if (error_body.size() < 512) error_body += json_str;
                continue;
            }
            if (chunk.contains("error")) {
                error_body = chunk["error"].dump();
                continue;
            }

            // Role-only and keep-alive chunks carry null or missing fields
            auto choices = chunk.find("choices");
            if (choices == chunk.end() || !choices->is_array() || choices->empty()) continue;
            const json& choice = choices->front();
            if (!choice.is_object()) continue;
            auto delta = choice.find("delta");
            if (delta == choice.end() || !delta->is_object()) continue;
            auto content = delta->find("content");
            if (content == delta->end() || !content->is_string()) continue;
            const std::string token = content->get<std::string>();

            if (!token.empty() && on_token && !on_token(token)) {
                should_stop = true;
                return false;
            }
        }
        return true;
    };

    auto client = impl_->makeClient(impl_->options.stream_timeout_ms);
    auto result = client->send(req);

    if (should_stop || done) return;

    if (!result) {
        throw ServiceError("llm_stream", "stream request failed: " + httplib::to_string(result.error()));
    }
    if (result->status != 200) {
        throw ServiceError("llm_stream", "HTTP " + std::to_string(result->status) +
                           (error_body.empty() ? "" : ": " + error_body));
    }
    if (!error_body.empty()) {
        throw ServiceError("llm_stream", error_body);
    }
}

std::string LLMClient::complete(const std::vector<Message>& messages) {
    const std::string body = impl_->buildRequest(messages, false).dump();
    std::cout << "[LLMClient] POST " << impl_->path << " stream=false messages=" << messages.size() << std::endl;

    auto client = impl_->makeClient(impl_->options.timeout_ms);
    auto res = client->Post(impl_->path, body, "application/json");

    if (!res) {
        throw ServiceError("llm", "request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw ServiceError("llm", "HTTP " + std::to_string(res->status) + ": " + res->body.substr(0, 300));
    }

    try {
        json res_json = json::parse(res->body);
        const json& message = res_json.at("choices").at(0).at("message");
        auto field = message.find("content");
        std::string content = (field != message.end() && field->is_string()) ? field->get<std::string>() : "";
        const auto begin = content.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) return "";
        return content.substr(begin, content.find_last_not_of(" \t\r\n") - begin + 1);
    } catch (const json::exception& e) {
        throw ServiceError("llm", std::string("invalid completion response: ") + e.what());
    }
}

} // namespace emv::llm
