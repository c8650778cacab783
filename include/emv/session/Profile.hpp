/**
 * Profile.hpp - Session-scoped assistant/user profile
 */

#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace emv::session {

struct Profile {
    std::string assistant_name = "EchoMind";
    std::string wake_word = "EchoMind";
    std::string user_name;
    std::string timezone = "America/New_York";
    std::string location;

    bool operator==(const Profile&) const = default;
};

inline void to_json(nlohmann::json& j, const Profile& p) {
    j = nlohmann::json{
        {"assistant_name", p.assistant_name},
        {"wake_word", p.wake_word},
        {"user_name", p.user_name},
        {"timezone", p.timezone},
        {"location", p.location}
    };
}

} // namespace emv::session
