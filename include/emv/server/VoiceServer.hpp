/**
 * VoiceServer.hpp - HTTP health endpoint + WebSocket voice sessions
 *
 *   GET /health -> {"status":"ok"}
 *   GET /ws     -> WebSocket upgrade, one VoiceSession per connection
 */

#pragma once

#include "emv/Config.hpp"
#include "emv/session/VoiceSession.hpp"

#include <memory>
#include <string>

namespace emv::server {

class VoiceServer {
public:
    VoiceServer(const Config& config, session::Collaborators collaborators);
    ~VoiceServer();

    VoiceServer(const VoiceServer&) = delete;
    VoiceServer& operator=(const VoiceServer&) = delete;

    /// Bind and start accepting on a background thread. Throws on bind failure.
    void start();

    /// Stop accepting, close every live connection and join its thread.
    void stop();

    bool isRunning() const;
    size_t activeSessions() const;
    unsigned short port() const;

    /// Random RFC 4122 version 4 identifier.
    static std::string newSessionId();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace emv::server
