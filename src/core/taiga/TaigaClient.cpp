#include "TaigaClient.hpp"

#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

#include "core/errors/Errors.hpp"

namespace tgw {

// -------- helpers --------

static json safe_json(const std::string& body) {
  if (body.empty()) return nullptr;
  try {
    return json::parse(body);
  } catch (const json::parse_error&) {
    return body;
  }
}

static void add_param(httplib::Params& p, const char* key, const std::optional<int64_t>& v) {
  if (v) p.emplace(key, std::to_string(*v));
}

BaseUrl split_base_url(const std::string& url) {
  const auto scheme = url.find("://");
  if (scheme == std::string::npos ||
      (url.compare(0, scheme, "http") != 0 && url.compare(0, scheme, "https") != 0)) {
    throw NotConfigured("TAIGA_BASE_URL must start with http:// or https://");
  }
  const auto hostStart = scheme + 3;
  const auto slash = url.find('/', hostStart);
  BaseUrl out;
  out.schemeHostPort = url.substr(0, slash);
  if (out.schemeHostPort.size() == hostStart) {
    throw NotConfigured("TAIGA_BASE_URL has no host");
  }
  if (slash != std::string::npos) {
    out.pathPrefix = url.substr(slash);
    while (!out.pathPrefix.empty() && out.pathPrefix.back() == '/') out.pathPrefix.pop_back();
  }
  return out;
}

nlohmann::json extract_pagination(const httplib::Headers& headers) {
  static const std::pair<const char*, const char*> kMapping[] = {
    {"x-pagination-page", "page"},
    {"x-pagination-page-size", "page_size"},
    {"x-pagination-total", "total"},
    {"x-pagination-pages", "total_pages"},
  };
  json out = json::object();
  for (const auto& [header, field] : kMapping) {
    auto it = headers.find(header);
    if (it == headers.end()) continue;
    try {
      size_t pos = 0;
      long long v = std::stoll(it->second, &pos);
      if (pos != it->second.size()) throw std::invalid_argument(it->second);
      out[field] = v;
    } catch (const std::exception&) {
      out[field] = it->second;
    }
  }
  return out;
}

// -------- client --------

TaigaClient::TaigaClient(TaigaSettings settings)
  : settings_(std::move(settings)), base_(split_base_url(settings_.baseUrl)) {
  http_ = std::make_unique<httplib::Client>(base_.schemeHostPort);
  http_->set_connection_timeout(settings_.timeoutSeconds, 0);
  http_->set_read_timeout(settings_.timeoutSeconds, 0);
  http_->set_write_timeout(settings_.timeoutSeconds, 0);
  http_->set_default_headers({{"Accept", "application/json"}});
}

std::string TaigaClient::urlFor(const std::string& path) const {
  std::string p = path;
  while (!p.empty() && p.front() == '/') p.erase(p.begin());
  return base_.pathPrefix + "/" + p;
}

void TaigaClient::authenticate() {
  if (token_) return;

  const json payload = {
    {"type", "normal"},
    {"username", settings_.username},
    {"password", settings_.password}
  };
  auto res = http_->Post(urlFor("auth"), httplib::Headers{}, payload.dump(), "application/json");
  if (!res) {
    throw std::runtime_error("Taiga authentication request failed: " + httplib::to_string(res.error()));
  }
  if (res->status < 200 || res->status >= 300) {
    throw RemoteApiError("Taiga authentication failed with status " + std::to_string(res->status) +
                           ": " + res->body,
                         res->status, safe_json(res->body));
  }

  const json data = safe_json(res->body);
  if (!data.is_object() || !data.contains("auth_token") || !data["auth_token"].is_string()) {
    throw RemoteApiError("Taiga authentication response did not contain auth_token");
  }
  token_ = data["auth_token"].get<std::string>();
  http_->set_bearer_token_auth(*token_);

  if (auto it = data.find("id"); it != data.end() && it->is_number_integer()) {
    userId_ = it->get<int64_t>();
  }
}

json TaigaClient::request(const std::string& method,
                          const std::string& path,
                          const httplib::Params& params,
                          const json* body,
                          httplib::Headers* responseHeaders) {
  const std::string url = urlFor(path);
  const std::string payload = body ? body->dump() : std::string();

  httplib::Result res = [&]() {
    if (method == "GET")    return http_->Get(url, params, httplib::Headers{});
    if (method == "POST")   return http_->Post(url, httplib::Headers{}, payload, "application/json");
    if (method == "PATCH")  return http_->Patch(url, httplib::Headers{}, payload, "application/json");
    if (method == "DELETE") return http_->Delete(url, httplib::Headers{});
    throw std::invalid_argument("unsupported method " + method);
  }();

  if (!res) {
    throw std::runtime_error("Taiga API " + method + " " + url + " failed: " +
                             httplib::to_string(res.error()));
  }
  if (res->status < 200 || res->status >= 300) {
    spdlog::warn("Taiga API {} {} -> {}", method, url, res->status);
    throw RemoteApiError("Taiga API request failed with status " + std::to_string(res->status) +
                           ": " + res->body,
                         res->status, safe_json(res->body));
  }
  if (responseHeaders) *responseHeaders = res->headers;
  return safe_json(res->body);
}

int64_t TaigaClient::currentUserId() {
  if (userId_) return *userId_;
  const json data = request("GET", "users/me");
  if (!data.is_object() || !data.contains("id")) {
    throw RemoteApiError("Taiga API did not provide the authenticated user id");
  }
  const json& id = data["id"];
  if (!id.is_number_integer()) {
    throw RemoteApiError("Taiga API did not provide the authenticated user id");
  }
  userId_ = id.get<int64_t>();
  return *userId_;
}

json TaigaClient::listProjects(const std::multimap<std::string, std::string>& filters) {
  httplib::Params params(filters.begin(), filters.end());
  return request("GET", "projects", params);
}

json TaigaClient::getProject(int64_t id) {
  return request("GET", "projects/" + std::to_string(id));
}

json TaigaClient::getProjectBySlug(const std::string& slug) {
  return request("GET", "projects/by_slug", {{"slug", slug}});
}

json TaigaClient::listEpics(int64_t project) {
  return request("GET", "epics", {{"project", std::to_string(project)}});
}

json TaigaClient::getEpic(int64_t id) {
  return request("GET", "epics/" + std::to_string(id));
}

json TaigaClient::createEpic(const json& payload) {
  return request("POST", "epics", {}, &payload);
}

json TaigaClient::updateEpic(int64_t id, const json& payload) {
  return request("PATCH", "epics/" + std::to_string(id), {}, &payload);
}

void TaigaClient::deleteEpic(int64_t id) {
  request("DELETE", "epics/" + std::to_string(id));
}

json TaigaClient::linkEpicUserStory(int64_t epic, int64_t userStory) {
  const json payload = {{"epic", epic}, {"user_story", userStory}};
  json data = request("POST", "epics/" + std::to_string(epic) + "/related_userstories", {}, &payload);
  if (data.is_object() && data.empty()) return nullptr;
  return data;
}

json TaigaClient::listUserStories(const StoryFilter& filter) {
  httplib::Params params;
  params.emplace("project", std::to_string(filter.project));
  add_param(params, "epic", filter.epic);
  if (filter.q && !filter.q->empty()) params.emplace("q", *filter.q);
  for (const auto& tag : filter.tags) params.emplace("tags", tag);
  add_param(params, "page", filter.page);
  add_param(params, "page_size", filter.pageSize);
  return request("GET", "userstories", params);
}

json TaigaClient::getUserStory(int64_t id) {
  return request("GET", "userstories/" + std::to_string(id));
}

json TaigaClient::createUserStory(const json& payload) {
  return request("POST", "userstories", {}, &payload);
}

json TaigaClient::updateUserStory(int64_t id, const json& payload) {
  return request("PATCH", "userstories/" + std::to_string(id), {}, &payload);
}

void TaigaClient::deleteUserStory(int64_t id) {
  request("DELETE", "userstories/" + std::to_string(id));
}

json TaigaClient::listUserStoryStatuses(int64_t project) {
  return request("GET", "userstory-statuses", {{"project", std::to_string(project)}});
}

json TaigaClient::listTaskStatuses(int64_t project) {
  return request("GET", "task-statuses", {{"project", std::to_string(project)}});
}

Page TaigaClient::listTasks(const TaskFilter& filter) {
  httplib::Params params;
  add_param(params, "project", filter.project);
  add_param(params, "user_story", filter.userStory);
  add_param(params, "assigned_to", filter.assignedTo);
  if (filter.q && !filter.q->empty()) params.emplace("q", *filter.q);
  add_param(params, "status", filter.status);
  add_param(params, "page", filter.page);
  add_param(params, "page_size", filter.pageSize);

  httplib::Headers headers;
  json data = request("GET", "tasks", params, nullptr, &headers);
  Page page;
  if (data.is_array()) page.items = std::move(data);
  page.pagination = extract_pagination(headers);
  return page;
}

json TaigaClient::getTask(int64_t id) {
  return request("GET", "tasks/" + std::to_string(id));
}

json TaigaClient::createTask(const json& payload) {
  return request("POST", "tasks", {}, &payload);
}

json TaigaClient::updateTask(int64_t id, const json& payload) {
  return request("PATCH", "tasks/" + std::to_string(id), {}, &payload);
}

void TaigaClient::deleteTask(int64_t id) {
  request("DELETE", "tasks/" + std::to_string(id));
}

json TaigaClient::getIssue(int64_t id) {
  return request("GET", "issues/" + std::to_string(id));
}

json TaigaClient::createIssue(const json& payload) {
  return request("POST", "issues", {}, &payload);
}

json TaigaClient::updateIssue(int64_t id, const json& payload) {
  return request("PATCH", "issues/" + std::to_string(id), {}, &payload);
}

void TaigaClient::deleteIssue(int64_t id) {
  request("DELETE", "issues/" + std::to_string(id));
}

json TaigaClient::listUsers(std::optional<int64_t> project) {
  httplib::Params params;
  add_param(params, "project", project);
  return request("GET", "users", params);
}

json TaigaClient::listProjectUsers(int64_t project) {
  return request("GET", "projects/" + std::to_string(project) + "/users");
}

json TaigaClient::listMilestones(int64_t project) {
  return request("GET", "milestones", {{"project", std::to_string(project)}});
}

ClientFactory make_taiga_client_factory(TaigaSettings settings) {
  return [settings = std::move(settings)]() -> std::shared_ptr<TaigaApi> {
    if (!settings.complete()) {
      throw NotConfigured("TAIGA_BASE_URL, TAIGA_USERNAME and TAIGA_PASSWORD must be configured");
    }
    auto client = std::make_shared<TaigaClient>(settings);
    client->authenticate();
    return client;
  };
}

} // namespace tgw
