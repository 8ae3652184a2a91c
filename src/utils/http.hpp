#pragma once

#include <memory>
#include <string>

#include "httplib.h"

namespace reportd::utils {

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    // Path including the leading slash; never empty.
    std::string path = "/";
    // Raw query without the '?'.
    std::string query;

    std::string SchemeHostPort() const;
    std::string PathWithQuery() const;
};

// Throws std::invalid_argument when the URL has no host.
ParsedUrl ParseUrl(const std::string& url);

std::string UrlEncode(const std::string& value);

// Client with timeouts and HTTP(S)_PROXY applied.
std::unique_ptr<httplib::Client> MakeHttpClient(const ParsedUrl& url, int timeout_s);

std::string HttpErrorToString(const httplib::Result& result);

}  // namespace reportd::utils
