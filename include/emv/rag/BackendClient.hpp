/**
 * BackendClient.hpp - Chat backend voice endpoint (POST /api/chat/ask-voice)
 */

#pragma once

#include "emv/rag/KnowledgeBase.hpp"

#include <string>

namespace emv::rag {

class BackendClient : public KnowledgeBase {
public:
    BackendClient(const std::string& base_url, int timeout_ms = 60000);

    std::string ask(const AskRequest& request) override;

    const std::string& baseUrl() const { return base_url_; }

private:
    std::string base_url_;
    int timeout_ms_;
};

} // namespace emv::rag
