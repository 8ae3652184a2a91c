#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace reportd::rpc {

// Request/response contract shared by every transport.
// Success: {"ok": true, "result": ...}
// Failure: {"ok": false, "error": {"code": ..., "message": ...}}
class RpcHandler {
public:
    virtual ~RpcHandler() = default;
    virtual nlohmann::json Handle(const std::string& method, const nlohmann::json& params) = 0;
};

nlohmann::json MakeResult(nlohmann::json result);
nlohmann::json MakeError(const std::string& code, const std::string& message);

}  // namespace reportd::rpc
