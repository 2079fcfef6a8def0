#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/status/StatusResolver.hpp"
#include "core/taiga/TaigaApi.hpp"
#include "core/validation/Params.hpp"

namespace tgw {

enum class EntityKind { UserStory, Epic, Task, Issue };

// How the orchestrator reads and writes one kind of versioned record.
struct EntityAccessors {
  std::string label;                                   // "user story", "task", ...
  std::function<json(int64_t)> getCurrent;
  std::function<json(int64_t, const json&)> submitUpdate;
  std::optional<StatusKind> statusKind;                // nullopt: integer ids only
};

EntityAccessors accessors_for(TaigaApi& api, EntityKind kind);

// Stories and tasks resolve status names; epics and issues take ids only.
std::optional<StatusKind> status_kind_for(EntityKind kind);

// Partial update. Each field is unset (left out of the payload), null (sent
// as null) or a value (sent verbatim).
struct UpdateRequest {
  int64_t id = 0;
  std::vector<std::pair<std::string, Field>> fields;   // payload key -> value
  Field status;
  std::optional<int64_t> version;                      // explicit version wins over the fetched one
};

// fetch current -> merge fields -> submit with version -> rewrite 409 into
// Conflict. Never retries and never submits without a version or without at
// least one field.
class UpdateOrchestrator {
public:
  UpdateOrchestrator(EntityAccessors accessors, StatusResolver& resolver)
    : acc_(std::move(accessors)), resolver_(resolver) {}

  json update(const UpdateRequest& req);

  // Input checks that need no remote call: at least one field set, status of
  // an acceptable type. update() runs these too.
  static void validate(const UpdateRequest& req, std::optional<StatusKind> statusKind);

private:
  EntityAccessors acc_;
  StatusResolver& resolver_;
};

} // namespace tgw
