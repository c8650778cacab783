/**
 * Transport.hpp - Outbound side of a client connection
 */

#pragma once

#include <string>

namespace emv::session {

class Transport {
public:
    virtual ~Transport() = default;

    /// Write one text frame. Throws on socket failure.
    virtual void sendText(const std::string& text) = 0;
};

} // namespace emv::session
