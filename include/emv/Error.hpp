/**
 * Error.hpp - Collaborator failure type
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace emv {

/**
 * Raised by STT / LLM / TTS / backend adapters. `where()` is the tag
 * reported to the client in the `error` event.
 */
class ServiceError : public std::runtime_error {
public:
    ServiceError(std::string where, const std::string& message)
        : std::runtime_error(message), where_(std::move(where)) {}

    const std::string& where() const noexcept { return where_; }

private:
    std::string where_;
};

} // namespace emv
