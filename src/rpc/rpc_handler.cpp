#include "rpc/rpc_handler.hpp"

#include <utility>

namespace reportd::rpc {

nlohmann::json MakeResult(nlohmann::json result) {
    return nlohmann::json{{"ok", true}, {"result", std::move(result)}};
}

nlohmann::json MakeError(const std::string& code, const std::string& message) {
    return nlohmann::json{{"ok", false}, {"error", {{"code", code}, {"message", message}}}};
}

}  // namespace reportd::rpc
