/**
 * Transcriber.hpp - Speech-to-text collaborator interface
 */

#pragma once

#include <string>
#include <vector>

namespace emv::stt {

class Transcriber {
public:
    virtual ~Transcriber() = default;

    /**
     * Transcribe mono float audio at the service sample rate.
     * Throws emv::ServiceError("stt") on failure.
     */
    virtual std::string transcribe(const std::vector<float>& audio) = 0;
};

} // namespace emv::stt
