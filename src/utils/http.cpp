#include "utils/http.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "utils/common.hpp"

namespace reportd::utils {
namespace {

bool ParseProxyHostPort(const std::string& proxy, std::string& host, int& port) {
    if (proxy.empty()) {
        return false;
    }
    std::string working = proxy;
    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        working = working.substr(scheme_pos + 3);
    }
    const auto slash_pos = working.find('/');
    if (slash_pos != std::string::npos) {
        working = working.substr(0, slash_pos);
    }
    const auto colon_pos = working.rfind(':');
    if (colon_pos == std::string::npos) {
        return false;
    }
    host = working.substr(0, colon_pos);
    try {
        port = std::stoi(working.substr(colon_pos + 1));
    } catch (const std::exception&) {
        return false;
    }
    return !host.empty() && port > 0;
}

void ApplyProxy(httplib::Client& client, bool https) {
    const char* names[] = {
        https ? "HTTPS_PROXY" : "HTTP_PROXY",
        https ? "https_proxy" : "http_proxy",
    };
    for (const auto* name : names) {
        std::string host;
        int port = 0;
        if (ParseProxyHostPort(GetEnv(name), host, port)) {
            client.set_proxy(host, port);
            return;
        }
    }
}

}  // namespace

std::string ParsedUrl::SchemeHostPort() const {
    return std::string(https ? "https://" : "http://") + host + ":" + std::to_string(port);
}

std::string ParsedUrl::PathWithQuery() const {
    return query.empty() ? path : path + "?" + query;
}

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto query_pos = working.find('?');
    if (query_pos != std::string::npos) {
        parsed.query = working.substr(query_pos + 1);
        working = working.substr(0, query_pos);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::exception&) {
            throw std::invalid_argument("invalid port in url: " + url);
        }
    } else {
        parsed.host = host_port;
    }

    if (parsed.host.empty()) {
        throw std::invalid_argument("url has no host: " + url);
    }
    return parsed;
}

std::string UrlEncode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return escaped.str();
}

std::unique_ptr<httplib::Client> MakeHttpClient(const ParsedUrl& url, int timeout_s) {
    auto client = std::make_unique<httplib::Client>(url.SchemeHostPort());
    client->set_connection_timeout(timeout_s);
    client->set_read_timeout(timeout_s);
    client->set_write_timeout(timeout_s);
    ApplyProxy(*client, url.https);
    return client;
}

std::string HttpErrorToString(const httplib::Result& result) {
    if (result) {
        return "HTTP " + std::to_string(result->status);
    }
    return httplib::to_string(result.error());
}

}  // namespace reportd::utils
