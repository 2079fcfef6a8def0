#pragma once
#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>

#include "core/taiga/TaigaApi.hpp"

namespace tgw {

// Which status enumeration a lookup runs against.
enum class StatusKind { UserStory, Task };

// Maps a status name or slug to its numeric id for one project. The
// enumeration is fetched on every call, never cached.
class StatusResolver {
public:
  explicit StatusResolver(TaigaApi& api) : api_(api) {}

  // null -> nullopt; integer -> unchanged, no remote call; string -> id of the
  // first entry whose name or slug equals it, NotFound when none does.
  std::optional<int64_t> resolve(StatusKind kind, int64_t projectId, const nlohmann::json& status);

private:
  TaigaApi& api_;
};

} // namespace tgw
