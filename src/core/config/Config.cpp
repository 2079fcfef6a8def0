#include "Config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace tgw {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

static long env_long_or(const char* key, long defval, long maxval = std::numeric_limits<int>::max()) {
  const std::string raw = get_env_or(key, "");
  if (raw.empty()) return defval;
  try {
    size_t pos = 0;
    long v = std::stol(raw, &pos);
    if (pos != raw.size() || v <= 0 || v > maxval) throw std::invalid_argument(raw);
    return v;
  } catch (const std::exception&) {
    spdlog::warn("ignoring invalid {}='{}', using {}", key, raw, defval);
    return defval;
  }
}

GatewayConfig load_config_from_env() {
  GatewayConfig cfg;
  cfg.port           = static_cast<int>(env_long_or("TGW_PORT", cfg.port, 65535));
  cfg.bindHost       = get_env_or("TGW_BIND", cfg.bindHost);
  cfg.apiKey         = get_env_or("TGW_API_KEY", "");
  cfg.logLevel       = get_env_or("TGW_LOG_LEVEL", cfg.logLevel);
  cfg.idempotencyTtl = std::chrono::seconds(
    env_long_or("TGW_IDEMPOTENCY_TTL_SECONDS", static_cast<long>(cfg.idempotencyTtl.count())));

  cfg.taiga.baseUrl        = get_env_or("TAIGA_BASE_URL", "");
  cfg.taiga.username       = get_env_or("TAIGA_USERNAME", "");
  cfg.taiga.password       = get_env_or("TAIGA_PASSWORD", "");
  cfg.taiga.timeoutSeconds = static_cast<int>(env_long_or("TGW_TAIGA_TIMEOUT_SECONDS", cfg.taiga.timeoutSeconds));
  return cfg;
}

} // namespace tgw
