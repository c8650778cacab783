/**
 * BackendClient.cpp - Retrieval-augmented answers from the chat backend
 */

#include "emv/rag/BackendClient.hpp"
#include "emv/Error.hpp"

#include <iostream>

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace emv::rag {

BackendClient::BackendClient(const std::string& base_url, int timeout_ms)
    : base_url_(base_url), timeout_ms_(timeout_ms) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string BackendClient::ask(const AskRequest& request) {
    json payload = {
        {"message", request.message},
        {"persona", request.persona.empty() ? json() : json(request.persona)},
        {"context_window", request.context_window.empty() ? "all" : request.context_window},
        {"use_knowledge_base", request.use_knowledge_base},
        {"advanced_rag", request.advanced_rag}
    };

    httplib::Client client(base_url_);
    client.set_connection_timeout(timeout_ms_ / 1000, (timeout_ms_ % 1000) * 1000);
    client.set_read_timeout(timeout_ms_ / 1000, (timeout_ms_ % 1000) * 1000);

    std::cout << "[BackendClient] POST " << base_url_ << "/api/chat/ask-voice" << std::endl;
    auto res = client.Post("/api/chat/ask-voice", payload.dump(), "application/json");

    if (!res) {
        throw ServiceError("backend_rag", "request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw ServiceError("backend_rag", "HTTP " + std::to_string(res->status) + ": " + res->body.substr(0, 300));
    }

    json data = json::parse(res->body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        throw ServiceError("backend_rag", "response is not a JSON object");
    }

    const json answer = data.value("answer", json());
    std::string text = answer.is_string() ? answer.get<std::string>() : "";
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    return text.substr(begin, text.find_last_not_of(" \t\r\n") - begin + 1);
}

} // namespace emv::rag
