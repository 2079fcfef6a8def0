#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "ActionDispatch.hpp"
#include "core/config/Config.hpp"
#include "services/gateway/Gateway.hpp"
#include "services/rpc/RpcEndpoint.hpp"

using nlohmann::json;

// -------- helpers --------

static void send_json(httplib::Response& res, int status, const json& body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

static void handle_action(const tgw::ActionRoute& route,
                          tgw::Gateway& gateway,
                          const std::string& apiKey,
                          const httplib::Request& req,
                          httplib::Response& res) {
  const bool present = req.has_header("X-Api-Key");
  const std::string presented = req.get_header_value("X-Api-Key");

  auto out = tgw::run_action([&]() -> json {
    tgw::verify_api_key(apiKey, presented, present);
    const json args = route.method == tgw::ActionMethod::Get
      ? tgw::query_to_args(req.params)
      : tgw::parse_body_object(req.body);
    return route.call(gateway, args);
  }, route.envelope);

  send_json(res, out.status, out.body);
}

// -------- server --------

namespace tgw {

void run_http_server(Gateway& gateway,
                     const RpcEndpoint& rpc,
                     const GatewayConfig& config) {
  httplib::Server svr;

  svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::info("{} {} -> {}", req.method, req.path, res.status);
  });

  // Health checks
  svr.Get("/healthz", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });
  svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("taiga-gateway up", "text/plain");
  });

  // /actions/<name>
  const std::string apiKey = config.apiKey;
  for (const auto& route : action_routes()) {
    const std::string path = "/actions/" + route.name;
    auto handler = [&route, &gateway, apiKey](const httplib::Request& req, httplib::Response& res) {
      handle_action(route, gateway, apiKey, req, res);
    };
    if (route.method == ActionMethod::Get) {
      svr.Get(path, handler);
    } else {
      svr.Post(path, handler);
    }
  }

  // POST /mcp
  // Body: one JSON-RPC 2.0 message. Notifications are acknowledged with 202.
  svr.Post("/mcp", [&rpc](const httplib::Request& req, httplib::Response& res) {
    json message = json::parse(req.body, nullptr, /*allow_exceptions*/ false);
    if (message.is_discarded()) {
      send_json(res, 200, RpcEndpoint::parseError());
      return;
    }
    auto reply = rpc.handleMessage(message);
    if (!reply) {
      res.status = 202;
      return;
    }
    send_json(res, 200, *reply);
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404) res.set_content("not found", "text/plain");
  });

  spdlog::info("HTTP server listening on http://{}:{}", config.bindHost, config.port);
  if (!svr.listen(config.bindHost, config.port)) {
    spdlog::error("Failed to bind {}:{}", config.bindHost, config.port);
    throw std::runtime_error("failed to bind " + config.bindHost + ":" + std::to_string(config.port));
  }
}

} // namespace tgw
