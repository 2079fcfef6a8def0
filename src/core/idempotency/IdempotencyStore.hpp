#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace tgw {

// Process-local cache of create results keyed by idempotency key.
// Expired entries are purged lazily on every get()/store(); there is no
// background sweeper. All access goes through one mutex, which is never held
// across a remote call.
class IdempotencyStore {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  static constexpr std::chrono::seconds kDefaultTtl{24 * 60 * 60};

  explicit IdempotencyStore(std::chrono::seconds ttl = kDefaultTtl,
                            Clock clock = &std::chrono::steady_clock::now);

  // Copy of the stored value, or nullopt when absent or expired.
  std::optional<nlohmann::json> get(const std::string& key);

  // Upserts a copy of `value`, expiring ttl from now.
  void store(const std::string& key, const nlohmann::json& value);

  // Entries currently held, expired-but-unpurged ones included.
  size_t size() const;

  std::chrono::seconds ttl() const { return ttl_; }

private:
  struct Entry {
    std::chrono::steady_clock::time_point expiresAt;
    nlohmann::json value;
  };

  void purgeExpiredLocked(std::chrono::steady_clock::time_point now);

  std::chrono::seconds ttl_;
  Clock clock_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, Entry> entries_;
};

// token + ":" + hex(sha256(entityId + ":" + subject)). Binds the caller's
// token to the request content so a reused token with a different subject
// is a different key.
std::string make_idempotency_key(const std::string& token,
                                 const std::string& entityId,
                                 const std::string& subject);

} // namespace tgw
