#pragma once

#include <chrono>
#include <mutex>
#include <string>

namespace reportd::auth {

struct ClientCredential {
    std::string authority_url = "https://login.microsoftonline.com";
    std::string tenant_id;
    std::string client_id;
    std::string client_secret;
    // e.g. https://graph.microsoft.com/.default
    std::string scope;
};

class TokenSource {
public:
    virtual ~TokenSource() = default;
    // Throws std::runtime_error when no token can be obtained.
    virtual std::string GetToken() = 0;
};

// OAuth2 client-credential grant; caches the token until shortly before expiry.
class ClientCredentialTokenSource : public TokenSource {
public:
    explicit ClientCredentialTokenSource(ClientCredential credential, int timeout_s = 30);

    std::string GetToken() override;

private:
    ClientCredential credential_;
    int timeout_s_;
    std::mutex mutex_;
    std::string token_;
    std::chrono::steady_clock::time_point expires_at_{};
};

}  // namespace reportd::auth
