#include "ToolRegistry.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

#include "core/errors/Errors.hpp"

namespace tgw {

using nlohmann::json;

static ToolResult text_result(bool isError, const std::string& text) {
  return ToolResult{isError, json::array({{{"type", "text"}, {"text", text}}})};
}

void ToolRegistry::add(ToolSchema schema, ToolHandler handler) {
  if (handlers_.count(schema.name)) {
    throw std::invalid_argument("tool already registered: " + schema.name);
  }
  handlers_.emplace(schema.name, std::move(handler));
  tools_.push_back(std::move(schema));
}

bool ToolRegistry::has(const std::string& name) const {
  return handlers_.count(name) != 0;
}

ToolResult ToolRegistry::execute(const std::string& name, const json& args) const {
  auto it = handlers_.find(name);
  if (it == handlers_.end()) return text_result(true, "Unknown tool: " + name);

  try {
    const json out = it->second(args);
    return text_result(false, out.is_string() ? out.get<std::string>() : out.dump());
  } catch (const GatewayError& e) {
    spdlog::warn("tool {} failed: {}", name, e.what());
    return text_result(true, e.what());
  } catch (const json::exception& e) {
    spdlog::warn("tool {} rejected arguments: {}", name, e.what());
    return text_result(true, std::string("invalid arguments: ") + e.what());
  } catch (const std::exception& e) {
    spdlog::error("unexpected error in tool {}: {}", name, e.what());
    return text_result(true, "Internal server error");
  }
}

} // namespace tgw
