#include "RpcEndpoint.hpp"

#include <spdlog/spdlog.h>

namespace tgw {

using nlohmann::json;

namespace {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
} // anonymous namespace

RpcEndpoint::RpcEndpoint(const ToolRegistry& registry) : registry_(registry) {}

std::optional<json> RpcEndpoint::handleMessage(const json& message) const {
  if (!message.is_object()) return makeError(nullptr, kInvalidRequest, "Invalid Request");

  if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
    if (message.contains("id")) {
      return makeError(message["id"], kInvalidRequest, "Invalid JSON-RPC version");
    }
    return std::nullopt;
  }

  auto methodIt = message.find("method");
  if (methodIt == message.end() || !methodIt->is_string()) {
    return makeError(message.value("id", json()), kInvalidRequest, "Invalid Request");
  }
  const std::string method = methodIt->get<std::string>();

  // Notifications have no id (notifications/initialized and friends).
  if (!message.contains("id")) {
    spdlog::debug("rpc notification {}", method);
    return std::nullopt;
  }

  const json& id = message["id"];
  json params = message.value("params", json::object());

  if (method == "initialize") return handleInitialize(id);
  if (method == "ping") return makeResult(id, json::object());
  if (method == "tools/list") return makeResult(id, {{"tools", toolCatalog()}});
  if (method == "tools/call") return handleToolsCall(params, id);
  return makeError(id, kMethodNotFound, "Method not found: " + method);
}

json RpcEndpoint::parseError() {
  return makeError(nullptr, kParseError, "Parse error");
}

json RpcEndpoint::toolCatalog() const {
  json tools = json::array();
  for (const auto& schema : registry_.tools()) {
    tools.push_back({
      {"name", schema.name},
      {"description", schema.description},
      {"inputSchema", schema.inputSchema},
      {"annotations", schema.annotations}
    });
  }
  return tools;
}

json RpcEndpoint::handleInitialize(const json& id) const {
  json result;
  result["protocolVersion"] = kProtocolVersion;
  result["capabilities"] = {{"tools", json::object()}};
  result["serverInfo"] = {{"name", "taiga-gateway"}, {"version", "0.1.0"}};
  return makeResult(id, result);
}

json RpcEndpoint::handleToolsCall(const json& params, const json& id) const {
  if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
    return makeError(id, kInvalidParams, "Missing 'name' parameter");
  }
  const std::string name = params["name"].get<std::string>();
  if (!registry_.has(name)) return makeError(id, kInvalidParams, "Unknown tool: " + name);

  json arguments = params.value("arguments", json::object());
  if (arguments.is_null()) arguments = json::object();

  ToolResult result = registry_.execute(name, arguments);
  json out;
  out["content"] = result.content;
  out["isError"] = result.isError;
  return makeResult(id, out);
}

json RpcEndpoint::makeError(const json& id, int code, const std::string& message) {
  return {
    {"jsonrpc", "2.0"},
    {"id", id},
    {"error", {{"code", code}, {"message", message}}}
  };
}

json RpcEndpoint::makeResult(const json& id, const json& result) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

} // namespace tgw
