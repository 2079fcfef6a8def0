#pragma once
#include <memory>
#include <optional>
#include <string>

#include <httplib.h>

#include "core/config/Config.hpp"
#include "core/taiga/TaigaApi.hpp"

namespace tgw {

struct BaseUrl {
  std::string schemeHostPort;  // "https://api.taiga.io"
  std::string pathPrefix;      // "/api/v1", no trailing slash
};

// Splits TAIGA_BASE_URL into the part httplib connects to and the path prefix
// every request is issued under. Throws NotConfigured on a malformed URL.
BaseUrl split_base_url(const std::string& url);

// x-pagination-{page,page-size,total,pages} -> {page,page_size,total,total_pages}.
// Non-numeric values are kept as strings.
nlohmann::json extract_pagination(const httplib::Headers& headers);

// TaigaApi over cpp-httplib. One instance per inbound request; the bearer
// token and user id are cached for the instance's lifetime.
class TaigaClient : public TaigaApi {
public:
  explicit TaigaClient(TaigaSettings settings);

  // POST auth; no-op once a token is held.
  void authenticate();

  int64_t currentUserId() override;

  json listProjects(const std::multimap<std::string, std::string>& filters) override;
  json getProject(int64_t id) override;
  json getProjectBySlug(const std::string& slug) override;

  json listEpics(int64_t project) override;
  json getEpic(int64_t id) override;
  json createEpic(const json& payload) override;
  json updateEpic(int64_t id, const json& payload) override;
  void deleteEpic(int64_t id) override;
  json linkEpicUserStory(int64_t epic, int64_t userStory) override;

  json listUserStories(const StoryFilter& filter) override;
  json getUserStory(int64_t id) override;
  json createUserStory(const json& payload) override;
  json updateUserStory(int64_t id, const json& payload) override;
  void deleteUserStory(int64_t id) override;

  json listUserStoryStatuses(int64_t project) override;
  json listTaskStatuses(int64_t project) override;

  Page listTasks(const TaskFilter& filter) override;
  json getTask(int64_t id) override;
  json createTask(const json& payload) override;
  json updateTask(int64_t id, const json& payload) override;
  void deleteTask(int64_t id) override;

  json getIssue(int64_t id) override;
  json createIssue(const json& payload) override;
  json updateIssue(int64_t id, const json& payload) override;
  void deleteIssue(int64_t id) override;

  json listUsers(std::optional<int64_t> project) override;
  json listProjectUsers(int64_t project) override;

  json listMilestones(int64_t project) override;

private:
  json request(const std::string& method,
               const std::string& path,
               const httplib::Params& params = {},
               const json* body = nullptr,
               httplib::Headers* responseHeaders = nullptr);
  std::string urlFor(const std::string& path) const;

  TaigaSettings settings_;
  BaseUrl base_;
  std::unique_ptr<httplib::Client> http_;
  std::optional<std::string> token_;
  std::optional<int64_t> userId_;
};

// Factory that builds and authenticates a TaigaClient per call. Throws
// NotConfigured when the remote settings are incomplete.
ClientFactory make_taiga_client_factory(TaigaSettings settings);

} // namespace tgw
