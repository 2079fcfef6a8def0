// src/main.cpp
#include <iostream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "core/config/Config.hpp"
#include "core/idempotency/IdempotencyStore.hpp"
#include "core/taiga/TaigaClient.hpp"
#include "services/api/HttpServer.hpp"
#include "services/gateway/Gateway.hpp"
#include "services/rpc/RpcEndpoint.hpp"
#include "services/rpc/ToolRegistry.hpp"

// ---------- helpers ----------

static void apply_log_level(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to "off"
  if (level == spdlog::level::off && name != "off") {
    spdlog::warn("unknown TGW_LOG_LEVEL '{}', using info", name);
    level = spdlog::level::info;
  }
  spdlog::set_level(level);
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --serve       # start HTTP server (TGW_PORT or 8080)\n"
            << "  " << argv0 << " --tools       # print the RPC tool catalog as JSON\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const std::string mode = argc > 1 ? argv[1] : "";
    if (mode != "--serve" && mode != "--tools") {
      print_usage(argv[0]);
      return 1;
    }

    tgw::GatewayConfig config = tgw::load_config_from_env();
    apply_log_level(config.logLevel);

    // Construct services
    tgw::IdempotencyStore idempotency(config.idempotencyTtl);
    tgw::Gateway gateway(tgw::make_taiga_client_factory(config.taiga), idempotency);
    tgw::ToolRegistry registry;
    tgw::register_gateway_tools(registry, gateway);
    tgw::RpcEndpoint rpc(registry);

    if (mode == "--tools") {
      std::cout << rpc.toolCatalog().dump(2) << "\n";
      return 0;
    }

    if (config.apiKey.empty()) {
      spdlog::warn("TGW_API_KEY is not set; /actions/* will answer 503");
    }
    if (!config.taiga.complete()) {
      spdlog::warn("TAIGA_BASE_URL, TAIGA_USERNAME or TAIGA_PASSWORD missing; remote calls will fail");
    }

    tgw::run_http_server(gateway, rpc, config);
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
