#include "StatusResolver.hpp"

#include <string>

#include "core/errors/Errors.hpp"

namespace tgw {

std::optional<int64_t> StatusResolver::resolve(StatusKind kind, int64_t projectId,
                                               const nlohmann::json& status) {
  if (status.is_null()) return std::nullopt;
  if (status.is_number_integer()) return status.get<int64_t>();
  if (!status.is_string()) throw ValidationError("status must be an integer or string");

  const auto& wanted = status.get_ref<const std::string&>();
  const nlohmann::json entries = kind == StatusKind::UserStory
    ? api_.listUserStoryStatuses(projectId)
    : api_.listTaskStatuses(projectId);

  if (entries.is_array()) {
    for (const auto& entry : entries) {
      if (!entry.is_object()) continue;
      const bool byName = entry.value("name", nlohmann::json()) == wanted;
      const bool bySlug = entry.value("slug", nlohmann::json()) == wanted;
      if ((byName || bySlug) && entry.contains("id") && entry["id"].is_number_integer()) {
        return entry["id"].get<int64_t>();
      }
    }
  }

  const char* label = kind == StatusKind::UserStory ? "status" : "task status";
  throw NotFound(std::string(label) + " '" + wanted + "' not found for project " +
                 std::to_string(projectId));
}

} // namespace tgw
