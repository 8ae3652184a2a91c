#include "utils/crypto.hpp"

#include <stdexcept>
#include <vector>

#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace reportd::utils {

std::string HmacSha256(const std::string& key, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    const auto* result = HMAC(EVP_sha256(),
                              key.data(), static_cast<int>(key.size()),
                              reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                              digest, &length);
    if (result == nullptr) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), length);
}

std::string Base64Encode(const std::string& data) {
    if (data.empty()) {
        return {};
    }
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    const int written = EVP_EncodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(data.data()),
                                        static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
}

std::string Base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }
    if (encoded.size() % 4 != 0) {
        throw std::invalid_argument("base64 input length is not a multiple of 4");
    }
    std::vector<unsigned char> out(3 * (encoded.size() / 4) + 1);
    const int written = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(encoded.data()),
                                        static_cast<int>(encoded.size()));
    if (written < 0) {
        throw std::invalid_argument("malformed base64 input");
    }
    // EVP_DecodeBlock keeps the bytes produced by '=' padding.
    std::size_t length = static_cast<std::size_t>(written);
    if (encoded[encoded.size() - 1] == '=') {
        --length;
    }
    if (encoded[encoded.size() - 2] == '=') {
        --length;
    }
    return std::string(reinterpret_cast<const char*>(out.data()), length);
}

}  // namespace reportd::utils
