#include "Gateway.hpp"

#include <map>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/errors/Errors.hpp"
#include "core/record/FieldProjector.hpp"
#include "core/status/StatusResolver.hpp"
#include "core/validation/Params.hpp"

namespace tgw {

// -------- helpers --------

static void require_object(const json& args) {
  if (!args.is_object() && !args.is_null()) {
    throw ValidationError("arguments must be a JSON object");
  }
}

static int64_t require_int(const json& args, const std::string& key) {
  return parseInt(require(args, key), key);
}

static std::optional<int64_t> opt_int(const json& args, const std::string& key) {
  auto v = field(args, key);
  if (!v) return std::nullopt;
  return optionalInt(*v, key);
}

// Id parameter that accepts an alias ("user_story_id" or "story_id").
static int64_t require_id(const json& args, std::initializer_list<const char*> keys) {
  const char* key = firstPresent(args, keys);
  if (!key) throw ValidationError("Field '" + std::string(*keys.begin()) + "' is required");
  return parseInt(args.at(key), key);
}

static std::optional<int64_t> integer_field(const json& record, const char* key) {
  if (!record.is_object()) return std::nullopt;
  auto it = record.find(key);
  if (it == record.end() || !it->is_number_integer()) return std::nullopt;
  return it->get<int64_t>();
}

static std::string record_string(const json& record, const char* key) {
  if (!record.is_object()) return {};
  auto it = record.find(key);
  if (it == record.end() || !it->is_string()) return {};
  return it->get<std::string>();
}

template <typename Fn>
static Field map_field(const json& args, const std::string& key, Fn convert) {
  auto v = field(args, key);
  if (!v) return std::nullopt;
  return convert(*v);
}

static json string_or_null(const json& v, const std::string& name) {
  if (v.is_null() || v.is_string()) return v;
  throw ValidationError(name + " must be a string");
}

// null clears to an empty list; anything else must already be a list.
static json tags_or_empty(const json& v) {
  if (v.is_null()) return json::array();
  return requireList(v, "tags", false);
}

static json date_or_null(const json& v, const std::string& name) {
  if (v.is_null()) return v;
  return isoDate(v, name);
}

static void check_status_type(const Field& status) {
  if (status && !status->is_null() && !status->is_number_integer() && !status->is_string()) {
    throw ValidationError("status must be an integer or string");
  }
}

static bool matches_any(const json& record, std::initializer_list<const char*> keys,
                        const std::string& needle) {
  for (const char* k : keys) {
    auto it = record.find(k);
    if (it != record.end() && it->is_string() &&
        containsIgnoreCase(it->get_ref<const std::string&>(), needle)) {
      return true;
    }
  }
  return false;
}

static void append_filter(std::multimap<std::string, std::string>& out,
                          const std::string& key, const json& v) {
  if (v.is_null()) return;
  if (v.is_array()) {
    for (const auto& item : v) append_filter(out, key, item);
  } else if (v.is_string()) {
    out.emplace(key, v.get<std::string>());
  } else if (v.is_boolean()) {
    out.emplace(key, v.get<bool>() ? "true" : "false");
  } else if (v.is_number()) {
    out.emplace(key, v.dump());
  } else {
    throw ValidationError(key + " must be a scalar value");
  }
}

// -------- gateway --------

Gateway::Gateway(ClientFactory factory, IdempotencyStore& idempotency)
  : factory_(std::move(factory)), idempotency_(idempotency) {}

std::shared_ptr<TaigaApi> Gateway::client() {
  auto api = factory_();
  if (!api) throw std::runtime_error("Taiga client factory returned no client");
  return api;
}

json Gateway::runUpdate(EntityKind kind, const UpdateRequest& req) {
  UpdateOrchestrator::validate(req, status_kind_for(kind));
  auto api = client();
  StatusResolver resolver(*api);
  UpdateOrchestrator orchestrator(accessors_for(*api, kind), resolver);
  return orchestrator.update(req);
}

// Projects

json Gateway::listProjects(const json& args) {
  require_object(args);
  const auto search = optionalString(args, "search");

  std::multimap<std::string, std::string> filters;
  if (args.is_object()) {
    for (const auto& [key, value] : args.items()) {
      if (key == "search") continue;
      append_filter(filters, key, value);
    }
  }

  auto api = client();
  if (filters.find("member") == filters.end()) {
    filters.emplace("member", std::to_string(api->currentUserId()));
  }
  const json projects = api->listProjects(filters);

  json out = json::array();
  if (!projects.is_array()) return out;
  for (const auto& p : projects) {
    if (search && !containsIgnoreCase(record_string(p, "name"), *search)) continue;
    out.push_back(project(p, fields::kProjectSummary));
  }
  return out;
}

json Gateway::getProject(const json& args) {
  require_object(args);
  const auto projectId = opt_int(args, "project_id");
  const auto slug = optionalString(args, "slug");
  if (projectId.has_value() == slug.has_value()) {
    throw ValidationError("Provide either project_id or slug, but not both");
  }

  auto api = client();
  const json p = projectId ? api->getProject(*projectId) : api->getProjectBySlug(*slug);
  return project(p, fields::kProjectDetail);
}

// Epics

json Gateway::listEpics(const json& args) {
  require_object(args);
  const json ids = asList(field(args, "project_id").value_or(json()));
  if (ids.empty()) throw ValidationError("At least one project_id is required");

  std::vector<int64_t> projectIds;
  for (const auto& id : ids) projectIds.push_back(parseInt(id, "project_id"));

  auto api = client();
  json out = json::array();
  for (int64_t pid : projectIds) {
    const json epics = api->listEpics(pid);
    if (!epics.is_array()) continue;
    for (const auto& epic : epics) {
      json entry = project(epic, fields::kEpicSummary);
      entry["project_id"] = pid;
      out.push_back(std::move(entry));
    }
  }
  return out;
}

json Gateway::createEpic(const json& args) {
  require_object(args);
  const int64_t projectId = require_int(args, "project_id");
  const std::string subject = requireString(require(args, "subject"), "subject");

  json payload = {{"project", projectId}, {"subject", subject}};
  if (auto v = field(args, "description")) payload["description"] = *v;
  if (auto v = field(args, "status")) payload["status"] = parseInt(*v, "status");
  if (auto v = field(args, "assigned_to")) payload["assigned_to"] = intOrNull(*v, "assigned_to");
  if (auto v = field(args, "tags")) payload["tags"] = requireList(*v, "tags");
  if (auto v = field(args, "color")) payload["color"] = string_or_null(*v, "color");

  auto api = client();
  return project(api->createEpic(payload), fields::kEpic);
}

json Gateway::updateEpic(const json& args) {
  require_object(args);
  UpdateRequest req;
  req.id = require_int(args, "epic_id");
  req.fields = {
    {"subject", map_field(args, "subject", [](const json& v) { return string_or_null(v, "subject"); })},
    {"description", field(args, "description")},
    {"assigned_to", map_field(args, "assigned_to", [](const json& v) { return intOrNull(v, "assigned_to"); })},
    {"tags", map_field(args, "tags", [](const json& v) { return requireList(v, "tags"); })},
    {"color", map_field(args, "color", [](const json& v) { return string_or_null(v, "color"); })},
  };
  req.status = map_field(args, "status", [](const json& v) { return intOrNull(v, "status"); });
  req.version = opt_int(args, "version");
  return project(runUpdate(EntityKind::Epic, req), fields::kEpic);
}

json Gateway::deleteEpic(const json& args) {
  require_object(args);
  const int64_t id = require_int(args, "epic_id");
  client()->deleteEpic(id);
  return {{"epic_id", id}};
}

json Gateway::addStoryToEpic(const json& args) {
  require_object(args);
  const int64_t epicId = require_int(args, "epic_id");
  const int64_t storyId = require_int(args, "user_story_id");
  return client()->linkEpicUserStory(epicId, storyId);
}

// User stories

json Gateway::listStories(const json& args) {
  require_object(args);
  StoryFilter filter;
  filter.project = require_int(args, "project_id");
  if (const char* k = firstPresent(args, {"epic_id", "epic"})) filter.epic = optionalInt(args.at(k), "epic_id");
  if (const char* k = firstPresent(args, {"search", "q"})) filter.q = optionalString(args, k);
  if (const char* k = firstPresent(args, {"tags", "tag"})) {
    for (const auto& t : asList(args.at(k))) {
      if (!t.is_string()) throw ValidationError("tags must be a list of strings");
      filter.tags.push_back(t.get<std::string>());
    }
  }
  filter.page = opt_int(args, "page");
  filter.pageSize = opt_int(args, "page_size");

  auto api = client();
  return projectAll(api->listUserStories(filter), fields::kStorySummary);
}

json Gateway::createStory(const json& args) {
  require_object(args);
  const int64_t projectId = require_int(args, "project_id");
  const std::string subject = requireString(require(args, "subject"), "subject");
  const Field status = field(args, "status");
  check_status_type(status);
  const json tags = requireList(field(args, "tags").value_or(json()), "tags");
  const auto assignedTo = opt_int(args, "assigned_to");
  const Field description = field(args, "description");

  json payload = {{"project", projectId}, {"subject", subject}};
  if (description && !description->is_null() && *description != "") payload["description"] = *description;
  if (tags.is_array() && !tags.empty()) payload["tags"] = tags;
  if (assignedTo) payload["assigned_to"] = *assignedTo;

  auto api = client();
  StatusResolver resolver(*api);
  if (status) {
    if (auto id = resolver.resolve(StatusKind::UserStory, projectId, *status)) payload["status"] = *id;
  }
  return project(api->createUserStory(payload), fields::kStory);
}

json Gateway::updateStory(const json& args) {
  require_object(args);
  UpdateRequest req;
  req.id = require_id(args, {"user_story_id", "story_id"});
  req.fields = {
    {"project", map_field(args, "project_id", [](const json& v) { return json(parseInt(v, "project_id")); })},
    {"subject", map_field(args, "subject", [](const json& v) { return string_or_null(v, "subject"); })},
    {"description", field(args, "description")},
    {"tags", map_field(args, "tags", tags_or_empty)},
    {"assigned_to", map_field(args, "assigned_to", [](const json& v) { return intOrNull(v, "assigned_to"); })},
    {"epic", map_field(args, "epic_id", [](const json& v) { return intOrNull(v, "epic_id"); })},
    {"milestone", map_field(args, "milestone_id", [](const json& v) { return intOrNull(v, "milestone_id"); })},
    {"custom_attributes", map_field(args, "custom_attributes", [](const json& v) {
      if (!v.is_null() && !v.is_object()) throw ValidationError("custom_attributes must be an object");
      return v;
    })},
  };
  req.status = field(args, "status");
  req.version = opt_int(args, "version");
  return project(runUpdate(EntityKind::UserStory, req), fields::kStory);
}

json Gateway::deleteStory(const json& args) {
  require_object(args);
  const int64_t id = require_id(args, {"user_story_id", "story_id"});
  client()->deleteUserStory(id);
  return {{"story_id", id}};
}

// Statuses

json Gateway::listStatuses(const json& args) {
  require_object(args);
  const int64_t projectId = require_int(args, "project_id");
  const auto search = optionalString(args, "search");
  const std::string kind = optionalString(args, "kind").value_or("story");
  if (kind != "story" && kind != "task") throw ValidationError("kind must be 'story' or 'task'");

  auto api = client();
  const json statuses = kind == "task" ? api->listTaskStatuses(projectId)
                                       : api->listUserStoryStatuses(projectId);
  json out = json::array();
  if (!statuses.is_array()) return out;
  for (const auto& s : statuses) {
    if (search && !matches_any(s, {"name", "slug"}, *search)) continue;
    out.push_back(project(s, fields::kStatus));
  }
  return out;
}

// Tasks

json Gateway::listTasks(const json& args) {
  require_object(args);
  TaskFilter filter;
  filter.project = opt_int(args, "project_id");
  filter.userStory = opt_int(args, "user_story_id");
  filter.assignedTo = opt_int(args, "assigned_to");
  filter.q = optionalString(args, "search");
  filter.page = opt_int(args, "page");
  filter.pageSize = opt_int(args, "page_size");

  // Query strings carry ids as text; only non-numeric strings are names.
  Field status = field(args, "status");
  if (status && status->is_string()) {
    try {
      status = json(parseInt(*status, "status"));
    } catch (const ValidationError&) {
      if (!filter.project) throw ValidationError("project_id is required when filtering by status name");
    }
  }
  check_status_type(status);

  auto api = client();
  if (status && !status->is_null()) {
    StatusResolver resolver(*api);
    filter.status = resolver.resolve(StatusKind::Task, filter.project.value_or(0), *status);
  }

  Page page = api->listTasks(filter);
  return {{"tasks", projectAll(page.items, fields::kTask)}, {"pagination", page.pagination}};
}

json Gateway::createTask(const json& args) {
  require_object(args);
  const std::string subject = requireString(require(args, "subject"), "subject");
  const auto userStoryId = opt_int(args, "user_story_id");
  const auto projectArg = opt_int(args, "project_id");
  if (!userStoryId && !projectArg) throw ValidationError("Field 'user_story_id' is required");

  const Field description = field(args, "description");
  const Field assignedTo = map_field(args, "assigned_to", [](const json& v) { return intOrNull(v, "assigned_to"); });
  const Field tags = map_field(args, "tags", tags_or_empty);
  const Field dueDate = map_field(args, "due_date", [](const json& v) { return date_or_null(v, "due_date"); });
  const Field status = field(args, "status");
  check_status_type(status);

  std::string cacheKey;
  if (auto token = optionalString(args, "idempotency_key"); token && !token->empty()) {
    const std::string entity = userStoryId ? std::to_string(*userStoryId)
                                           : "project:" + std::to_string(*projectArg);
    cacheKey = make_idempotency_key(*token, entity, subject);
    if (auto cached = idempotency_.get(cacheKey)) {
      spdlog::debug("idempotent replay for task create (key {})", *token);
      return project(*cached, fields::kTask);
    }
  }

  auto api = client();
  int64_t projectId = 0;
  if (projectArg) {
    projectId = *projectArg;
  } else {
    auto fromStory = integer_field(api->getUserStory(*userStoryId), "project");
    if (!fromStory) throw RemoteApiError("unable to resolve project for task creation");
    projectId = *fromStory;
  }

  json payload = {{"project", projectId}, {"subject", subject}};
  if (userStoryId) payload["user_story"] = *userStoryId;
  if (description) payload["description"] = *description;
  if (assignedTo) payload["assigned_to"] = *assignedTo;
  if (tags) payload["tags"] = *tags;
  if (dueDate) payload["due_date"] = *dueDate;
  if (status) {
    StatusResolver resolver(*api);
    auto id = resolver.resolve(StatusKind::Task, projectId, *status);
    payload["status"] = id ? json(*id) : json(nullptr);
  }

  const json task = api->createTask(payload);
  if (!cacheKey.empty()) idempotency_.store(cacheKey, task);
  return project(task, fields::kTask);
}

json Gateway::updateTask(const json& args) {
  require_object(args);
  UpdateRequest req;
  req.id = require_int(args, "task_id");
  req.fields = {
    {"subject", map_field(args, "subject", [](const json& v) { return string_or_null(v, "subject"); })},
    {"description", field(args, "description")},
    {"assigned_to", map_field(args, "assigned_to", [](const json& v) { return intOrNull(v, "assigned_to"); })},
    {"tags", map_field(args, "tags", tags_or_empty)},
    {"due_date", map_field(args, "due_date", [](const json& v) { return date_or_null(v, "due_date"); })},
    {"user_story", map_field(args, "user_story_id", [](const json& v) { return intOrNull(v, "user_story_id"); })},
  };
  req.status = field(args, "status");
  req.version = opt_int(args, "version");
  return project(runUpdate(EntityKind::Task, req), fields::kTask);
}

json Gateway::deleteTask(const json& args) {
  require_object(args);
  const int64_t id = require_int(args, "task_id");
  client()->deleteTask(id);
  return {{"task_id", id}};
}

// Issues

json Gateway::createIssue(const json& args) {
  require_object(args);
  const int64_t projectId = require_int(args, "project_id");
  const std::string subject = requireString(require(args, "subject"), "subject");

  json payload = {{"project", projectId}, {"subject", subject}};
  if (auto v = field(args, "description")) payload["description"] = *v;
  static const std::pair<const char*, const char*> kIntFields[] = {
    {"status", "status"}, {"priority", "priority"}, {"severity", "severity"}, {"type", "issue_type"}
  };
  for (const auto& [arg, key] : kIntFields) {
    if (auto v = field(args, arg)) payload[key] = parseInt(*v, arg);
  }
  if (auto v = field(args, "assigned_to")) payload["assigned_to"] = intOrNull(*v, "assigned_to");
  if (auto v = field(args, "tags")) payload["tags"] = requireList(*v, "tags");

  auto api = client();
  return project(api->createIssue(payload), fields::kIssue);
}

json Gateway::updateIssue(const json& args) {
  require_object(args);
  UpdateRequest req;
  req.id = require_int(args, "issue_id");
  req.fields = {
    {"subject", map_field(args, "subject", [](const json& v) { return string_or_null(v, "subject"); })},
    {"description", field(args, "description")},
    {"priority", map_field(args, "priority", [](const json& v) { return json(parseInt(v, "priority")); })},
    {"severity", map_field(args, "severity", [](const json& v) { return json(parseInt(v, "severity")); })},
    {"issue_type", map_field(args, "type", [](const json& v) { return json(parseInt(v, "type")); })},
    {"assigned_to", map_field(args, "assigned_to", [](const json& v) { return intOrNull(v, "assigned_to"); })},
    {"tags", map_field(args, "tags", [](const json& v) { return requireList(v, "tags"); })},
  };
  req.status = map_field(args, "status", [](const json& v) { return json(parseInt(v, "status")); });
  req.version = opt_int(args, "version");
  return project(runUpdate(EntityKind::Issue, req), fields::kIssue);
}

json Gateway::deleteIssue(const json& args) {
  require_object(args);
  const int64_t id = require_int(args, "issue_id");
  client()->deleteIssue(id);
  return {{"issue_id", id}};
}

// Users and milestones

json Gateway::listUsers(const json& args) {
  require_object(args);
  const auto projectId = opt_int(args, "project_id");
  const auto search = optionalString(args, "search");

  auto api = client();
  json users;
  try {
    users = api->listUsers(projectId);
  } catch (const RemoteApiError& e) {
    const bool denied = e.statusCode() == 401 || e.statusCode() == 403;
    if (!projectId || !denied) throw;
    spdlog::info("global user list denied ({}), falling back to members of project {}",
                 e.statusCode(), *projectId);
    users = api->listProjectUsers(*projectId);
  }

  json out = json::array();
  if (!users.is_array()) return out;
  for (const auto& entry : users) {
    const json& user = (entry.is_object() && entry.contains("user") && entry["user"].is_object())
      ? entry["user"] : entry;
    json projected = project(user, fields::kUser);
    if (search && !matches_any(projected, {"full_name", "username", "email"}, *search)) continue;
    out.push_back(std::move(projected));
  }
  return out;
}

json Gateway::listMilestones(const json& args) {
  require_object(args);
  const int64_t projectId = require_int(args, "project_id");
  const auto search = optionalString(args, "search");

  auto api = client();
  const json milestones = api->listMilestones(projectId);
  json out = json::array();
  if (!milestones.is_array()) return out;
  for (const auto& m : milestones) {
    json entry = project(m, fields::kMilestone);
    if (search && !matches_any(entry, {"name", "slug"}, *search)) continue;
    out.push_back(std::move(entry));
  }
  return out;
}

} // namespace tgw
