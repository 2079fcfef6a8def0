#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace tgw {

class Gateway;

struct ToolSchema {
  std::string name;
  std::string description;
  nlohmann::json inputSchema;
  nlohmann::json annotations = nlohmann::json::object();
};

struct ToolResult {
  bool isError = false;
  nlohmann::json content = nlohmann::json::array();  // MCP content blocks
};

using ToolHandler = std::function<nlohmann::json(const nlohmann::json& args)>;

// Named tools with JSON schemas. execute() never throws for handler
// failures: gateway errors become isError results with their message,
// anything else is logged and reported as an opaque internal error.
class ToolRegistry {
public:
  void add(ToolSchema schema, ToolHandler handler);

  bool has(const std::string& name) const;
  const std::vector<ToolSchema>& tools() const { return tools_; }

  ToolResult execute(const std::string& name, const nlohmann::json& args) const;

private:
  std::vector<ToolSchema> tools_;
  std::unordered_map<std::string, ToolHandler> handlers_;
};

// Registers the taiga.* tool catalog backed by `gateway`. The gateway must
// outlive the registry.
void register_gateway_tools(ToolRegistry& registry, Gateway& gateway);

} // namespace tgw
