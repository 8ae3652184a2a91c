#pragma once

#include <string>

namespace reportd::notify {

class WebhookSender {
public:
    virtual ~WebhookSender() = default;
    // True on a 2xx response. Never throws.
    virtual bool Post(const std::string& url, const std::string& json_body) = 0;
};

class HttpWebhookSender : public WebhookSender {
public:
    explicit HttpWebhookSender(int timeout_s = 30);

    bool Post(const std::string& url, const std::string& json_body) override;

private:
    int timeout_s_;
};

}  // namespace reportd::notify
