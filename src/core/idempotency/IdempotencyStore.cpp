#include "IdempotencyStore.hpp"

#include <utility>

#include "core/util/Hash.hpp"

namespace tgw {

IdempotencyStore::IdempotencyStore(std::chrono::seconds ttl, Clock clock)
  : ttl_(ttl), clock_(std::move(clock)) {}

std::optional<nlohmann::json> IdempotencyStore::get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mu_);
  purgeExpiredLocked(clock_());
  auto it = entries_.find(key);
  if (it == entries_.end()) return std::nullopt;
  return it->second.value;
}

void IdempotencyStore::store(const std::string& key, const nlohmann::json& value) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = clock_();
  purgeExpiredLocked(now);
  entries_[key] = Entry{now + ttl_, value};
}

size_t IdempotencyStore::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

void IdempotencyStore::purgeExpiredLocked(std::chrono::steady_clock::time_point now) {
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.expiresAt <= now) it = entries_.erase(it);
    else ++it;
  }
}

std::string make_idempotency_key(const std::string& token,
                                 const std::string& entityId,
                                 const std::string& subject) {
  return token + ":" + sha256_hex(entityId + ":" + subject);
}

} // namespace tgw
