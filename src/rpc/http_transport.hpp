#pragma once

#include <atomic>
#include <string>
#include <thread>

#include "httplib.h"
#include "rpc/rpc_handler.hpp"

namespace reportd::rpc {

// Loopback HTTP binding: POST /rpc/<method> with a JSON params body.
class HttpTransport {
public:
    HttpTransport(RpcHandler& handler, std::string host, int port);
    ~HttpTransport();

    // Listens on a background thread; false when the socket cannot be bound.
    bool Start();
    void Stop();
    int port() const { return port_; }

private:
    void RegisterRoutes();

    RpcHandler& handler_;
    std::string host_;
    int port_;
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

}  // namespace reportd::rpc
