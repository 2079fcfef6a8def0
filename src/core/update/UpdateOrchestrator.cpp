#include "UpdateOrchestrator.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>

#include "core/errors/Errors.hpp"

namespace tgw {

EntityAccessors accessors_for(TaigaApi& api, EntityKind kind) {
  switch (kind) {
    case EntityKind::UserStory:
      return {"user story",
              [&api](int64_t id) { return api.getUserStory(id); },
              [&api](int64_t id, const json& p) { return api.updateUserStory(id, p); },
              status_kind_for(kind)};
    case EntityKind::Epic:
      return {"epic",
              [&api](int64_t id) { return api.getEpic(id); },
              [&api](int64_t id, const json& p) { return api.updateEpic(id, p); },
              status_kind_for(kind)};
    case EntityKind::Task:
      return {"task",
              [&api](int64_t id) { return api.getTask(id); },
              [&api](int64_t id, const json& p) { return api.updateTask(id, p); },
              status_kind_for(kind)};
    case EntityKind::Issue:
      return {"issue",
              [&api](int64_t id) { return api.getIssue(id); },
              [&api](int64_t id, const json& p) { return api.updateIssue(id, p); },
              status_kind_for(kind)};
  }
  throw std::invalid_argument("unknown entity kind");
}

std::optional<StatusKind> status_kind_for(EntityKind kind) {
  switch (kind) {
    case EntityKind::UserStory: return StatusKind::UserStory;
    case EntityKind::Task:      return StatusKind::Task;
    default:                    return std::nullopt;
  }
}

static std::optional<int64_t> integer_field(const json& record, const char* key) {
  if (!record.is_object()) return std::nullopt;
  auto it = record.find(key);
  if (it == record.end() || !it->is_number_integer()) return std::nullopt;
  return it->get<int64_t>();
}

void UpdateOrchestrator::validate(const UpdateRequest& req, std::optional<StatusKind> statusKind) {
  bool hasUpdates = req.status.has_value();
  for (const auto& [key, value] : req.fields) {
    if (value) hasUpdates = true;
  }
  if (!hasUpdates) throw ValidationError("at least one field must be provided");

  if (req.status && !req.status->is_null()) {
    const json& s = *req.status;
    if (statusKind && !s.is_number_integer() && !s.is_string()) {
      throw ValidationError("status must be an integer or string");
    }
    if (!statusKind && !s.is_number_integer()) {
      throw ValidationError("status must be an integer");
    }
  }
}

json UpdateOrchestrator::update(const UpdateRequest& req) {
  validate(req, acc_.statusKind);

  const json existing = acc_.getCurrent(req.id);

  json payload = json::object();
  for (const auto& [key, value] : req.fields) {
    if (value) payload[key] = *value;
  }

  if (req.status) {
    const json& s = *req.status;
    if (s.is_string()) {
      auto project = integer_field(payload, "project");
      if (!project) project = integer_field(existing, "project");
      if (!project) {
        throw RemoteApiError("unable to resolve project for " + acc_.label + " status lookup");
      }
      payload["status"] = *resolver_.resolve(*acc_.statusKind, *project, s);
    } else {
      payload["status"] = s;
    }
  }

  if (req.version) {
    payload["version"] = *req.version;
  } else {
    auto version = integer_field(existing, "version");
    if (!version) throw RemoteApiError("unable to resolve version for " + acc_.label + " update");
    payload["version"] = *version;
  }

  try {
    return acc_.submitUpdate(req.id, payload);
  } catch (const RemoteApiError& e) {
    if (e.statusCode() != 409) throw;
    const json latest = acc_.getCurrent(req.id);
    const json latestVersion = latest.is_object() ? latest.value("version", json()) : json();
    spdlog::warn("version conflict on {} {}: submitted {}, latest {}", acc_.label, req.id,
                 payload["version"].dump(), latestVersion.dump());
    throw Conflict("conflict updating " + acc_.label + " " + std::to_string(req.id) +
                   ": latest version is " + latestVersion.dump());
  }
}

} // namespace tgw
