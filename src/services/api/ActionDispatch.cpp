#include "ActionDispatch.hpp"

#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"
#include "core/util/Hash.hpp"
#include "services/gateway/Gateway.hpp"

namespace tgw {

using nlohmann::json;

// -------- helpers --------

template <typename Method>
static ActionRoute get_route(const char* name, const char* envelope, Method m) {
  return {name, ActionMethod::Get, envelope, [m](Gateway& gw, const json& args) { return (gw.*m)(args); }};
}

template <typename Method>
static ActionRoute post_route(const char* name, const char* envelope, Method m) {
  return {name, ActionMethod::Post, envelope, [m](Gateway& gw, const json& args) { return (gw.*m)(args); }};
}

static json project_by_slug(Gateway& gw, const json& args) {
  auto it = args.find("slug");
  if (it == args.end() || it->is_null()) throw ValidationError("Field 'slug' is required");
  return gw.getProject({{"slug", *it}});
}

// -------- routes --------

const std::vector<ActionRoute>& action_routes() {
  static const std::vector<ActionRoute> routes = {
    get_route("list_projects", "projects", &Gateway::listProjects),
    get_route("get_project", "project", &Gateway::getProject),
    {"get_project_by_slug", ActionMethod::Get, "project", project_by_slug},
    get_route("list_epics", "epics", &Gateway::listEpics),
    get_route("list_stories", "stories", &Gateway::listStories),
    get_route("statuses", "statuses", &Gateway::listStatuses),
    get_route("list_tasks", "", &Gateway::listTasks),
    get_route("list_users", "users", &Gateway::listUsers),
    get_route("list_milestones", "milestones", &Gateway::listMilestones),

    post_route("create_story", "story", &Gateway::createStory),
    post_route("update_story", "story", &Gateway::updateStory),
    post_route("delete_story", "deleted", &Gateway::deleteStory),
    post_route("add_story_to_epic", "link", &Gateway::addStoryToEpic),
    post_route("create_epic", "epic", &Gateway::createEpic),
    post_route("update_epic", "epic", &Gateway::updateEpic),
    post_route("delete_epic", "deleted", &Gateway::deleteEpic),
    post_route("create_task", "task", &Gateway::createTask),
    post_route("update_task", "task", &Gateway::updateTask),
    post_route("delete_task", "deleted", &Gateway::deleteTask),
    post_route("create_issue", "issue", &Gateway::createIssue),
    post_route("update_issue", "issue", &Gateway::updateIssue),
    post_route("delete_issue", "deleted", &Gateway::deleteIssue),
  };
  return routes;
}

void verify_api_key(const std::string& configured, const std::string& presented, bool present) {
  if (configured.empty()) throw NotConfigured("Proxy API key is not configured");
  if (!present || presented.empty()) throw Unauthorized("Missing X-Api-Key header");
  if (!constant_time_equals(presented, configured)) throw Unauthorized("Invalid API key");
}

json query_to_args(const httplib::Params& params) {
  json args = json::object();
  for (const auto& [key, value] : params) {
    if (value.empty()) continue;
    auto it = args.find(key);
    if (it == args.end()) {
      args[key] = value;
    } else if (it->is_array()) {
      it->push_back(value);
    } else {
      *it = json::array({*it, value});
    }
  }
  return args;
}

json parse_body_object(const std::string& body) {
  if (body.empty()) return json::object();
  json parsed = json::parse(body, nullptr, /*allow_exceptions*/ false);
  if (parsed.is_discarded()) throw ValidationError("Request body must be valid JSON");
  if (!parsed.is_object()) throw ValidationError("Request body must be a JSON object");
  return parsed;
}

ActionResponse run_action(const std::function<json()>& fn, const std::string& envelope) {
  try {
    json result = fn();
    if (envelope.empty()) return {200, std::move(result)};
    return {200, json{{envelope, std::move(result)}}};
  } catch (const GatewayError& e) {
    if (e.httpStatus() >= 500) {
      spdlog::warn("action unavailable: {}", e.what());
    } else {
      spdlog::warn("action rejected ({}): {}", e.httpStatus(), e.what());
    }
    return {e.httpStatus(), json{{"error", e.what()}}};
  } catch (const std::exception& e) {
    spdlog::error("internal error: {}", e.what());
    return {500, json{{"error", "Internal server error"}}};
  }
}

} // namespace tgw
