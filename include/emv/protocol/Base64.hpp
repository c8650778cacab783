/**
 * Base64.hpp - Standard base64 with padding (audio payloads)
 */

#pragma once

#include <optional>
#include <string>

namespace emv::protocol {

std::string base64Encode(const std::string& bytes);

/// nullopt on bad length or characters outside the base64 alphabet.
std::optional<std::string> base64Decode(const std::string& text);

} // namespace emv::protocol
