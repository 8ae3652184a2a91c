#pragma once

#include <string>

namespace reportd::utils {

// Raw 32-byte digest.
std::string HmacSha256(const std::string& key, const std::string& message);
std::string Base64Encode(const std::string& data);
// Throws std::invalid_argument on malformed input.
std::string Base64Decode(const std::string& encoded);

}  // namespace reportd::utils
