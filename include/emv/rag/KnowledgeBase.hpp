/**
 * KnowledgeBase.hpp - Retrieval-augmented answer collaborator
 */

#pragma once

#include <string>

namespace emv::rag {

struct AskRequest {
    std::string message;
    std::string persona;               // empty -> null on the wire
    std::string context_window = "all";
    bool use_knowledge_base = true;
    bool advanced_rag = true;
};

class KnowledgeBase {
public:
    virtual ~KnowledgeBase() = default;

    /// Throws emv::ServiceError("backend_rag") on failure.
    virtual std::string ask(const AskRequest& request) = 0;
};

} // namespace emv::rag
