#pragma once
#include <chrono>
#include <string>

namespace tgw {

struct TaigaSettings {
  std::string baseUrl;
  std::string username;
  std::string password;
  int timeoutSeconds = 30;

  // All three remote settings present.
  bool complete() const {
    return !baseUrl.empty() && !username.empty() && !password.empty();
  }
};

struct GatewayConfig {
  int port = 8080;
  std::string bindHost = "0.0.0.0";
  std::string apiKey;          // empty = actions answer 503
  std::string logLevel = "info";
  std::chrono::seconds idempotencyTtl{24 * 60 * 60};
  TaigaSettings taiga;
};

std::string get_env_or(const char* key, const std::string& defval);

// Reads TGW_* and TAIGA_* variables. Unparseable numbers fall back to defaults.
GatewayConfig load_config_from_env();

} // namespace tgw
