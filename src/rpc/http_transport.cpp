#include "rpc/http_transport.hpp"

#include <utility>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace reportd::rpc {
namespace {

constexpr const char* kTag = "rpc";
constexpr const char* kJsonContentType = "application/json";

}  // namespace

HttpTransport::HttpTransport(RpcHandler& handler, std::string host, int port)
    : handler_(handler), host_(std::move(host)), port_(port) {
    RegisterRoutes();
}

HttpTransport::~HttpTransport() {
    Stop();
}

void HttpTransport::RegisterRoutes() {
    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", kJsonContentType);
    });

    server_.Post(R"(/rpc/([A-Za-z]+))", [this](const httplib::Request& req, httplib::Response& res) {
        const auto method = req.matches[1].str();
        nlohmann::json params = nlohmann::json::object();
        if (!req.body.empty()) {
            try {
                params = nlohmann::json::parse(req.body);
            } catch (const nlohmann::json::parse_error& ex) {
                res.status = 400;
                res.set_content(MakeError("parse_error", ex.what()).dump(), kJsonContentType);
                return;
            }
        }

        utils::LogDebug(kTag, "request", {{"method", method}, {"remote", req.remote_addr}});
        const auto response = handler_.Handle(method, params);
        if (!response.value("ok", false)) {
            const auto code = response.at("error").value("code", std::string());
            res.status = code == "method_not_found" ? 404 : 400;
            if (code == "internal" || code == "store_error") {
                res.status = 500;
            }
        }
        res.set_content(response.dump(), kJsonContentType);
    });
}

bool HttpTransport::Start() {
    if (running_.exchange(true)) {
        return true;
    }
    if (port_ == 0) {
        port_ = server_.bind_to_any_port(host_);
        if (port_ <= 0) {
            running_.store(false);
            utils::LogError(kTag, "failed to bind", {{"host", host_}});
            return false;
        }
    } else if (!server_.bind_to_port(host_, port_)) {
        running_.store(false);
        utils::LogError(kTag, "failed to bind", {{"host", host_}, {"port", std::to_string(port_)}});
        return false;
    }
    thread_ = std::thread([this]() {
        if (!server_.listen_after_bind()) {
            utils::LogError(kTag, "server stopped listening", {{"host", host_}, {"port", std::to_string(port_)}});
        }
    });
    utils::LogInfo(kTag, "listening", {{"host", host_}, {"port", std::to_string(port_)}});
    return true;
}

void HttpTransport::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    server_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

}  // namespace reportd::rpc
