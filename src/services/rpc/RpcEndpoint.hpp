#pragma once
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "ToolRegistry.hpp"

namespace tgw {

// JSON-RPC 2.0 dispatcher for the tool catalog (initialize, tools/list,
// tools/call). Transport-agnostic: the HTTP layer feeds it one decoded
// message per POST.
class RpcEndpoint {
public:
  static constexpr const char* kProtocolVersion = "2024-11-05";

  explicit RpcEndpoint(const ToolRegistry& registry);

  // nullopt for notifications, which get no reply.
  std::optional<nlohmann::json> handleMessage(const nlohmann::json& message) const;

  // Response for a body that did not parse.
  static nlohmann::json parseError();

  nlohmann::json toolCatalog() const;

private:
  nlohmann::json handleInitialize(const nlohmann::json& id) const;
  nlohmann::json handleToolsCall(const nlohmann::json& params, const nlohmann::json& id) const;

  static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message);
  static nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);

  const ToolRegistry& registry_;
};

} // namespace tgw
