#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tgw {

using nlohmann::json;

struct StoryFilter {
  int64_t project = 0;
  std::optional<int64_t> epic;
  std::optional<std::string> q;
  std::vector<std::string> tags;
  std::optional<int64_t> page;
  std::optional<int64_t> pageSize;
};

struct TaskFilter {
  std::optional<int64_t> project;
  std::optional<int64_t> userStory;
  std::optional<int64_t> assignedTo;
  std::optional<std::string> q;
  std::optional<int64_t> status;
  std::optional<int64_t> page;
  std::optional<int64_t> pageSize;
};

// A list response plus the x-pagination-* header values it carried.
struct Page {
  json items = json::array();
  json pagination = json::object();
};

// Authenticated CRUD access to the Taiga REST API. Methods return the decoded
// response body and throw RemoteApiError on a non-2xx response.
class TaigaApi {
public:
  virtual ~TaigaApi() = default;

  virtual int64_t currentUserId() = 0;

  virtual json listProjects(const std::multimap<std::string, std::string>& filters) = 0;
  virtual json getProject(int64_t id) = 0;
  virtual json getProjectBySlug(const std::string& slug) = 0;

  virtual json listEpics(int64_t project) = 0;
  virtual json getEpic(int64_t id) = 0;
  virtual json createEpic(const json& payload) = 0;
  virtual json updateEpic(int64_t id, const json& payload) = 0;
  virtual void deleteEpic(int64_t id) = 0;
  // Returns null when the remote answers with an empty body.
  virtual json linkEpicUserStory(int64_t epic, int64_t userStory) = 0;

  virtual json listUserStories(const StoryFilter& filter) = 0;
  virtual json getUserStory(int64_t id) = 0;
  virtual json createUserStory(const json& payload) = 0;
  virtual json updateUserStory(int64_t id, const json& payload) = 0;
  virtual void deleteUserStory(int64_t id) = 0;

  virtual json listUserStoryStatuses(int64_t project) = 0;
  virtual json listTaskStatuses(int64_t project) = 0;

  virtual Page listTasks(const TaskFilter& filter) = 0;
  virtual json getTask(int64_t id) = 0;
  virtual json createTask(const json& payload) = 0;
  virtual json updateTask(int64_t id, const json& payload) = 0;
  virtual void deleteTask(int64_t id) = 0;

  virtual json getIssue(int64_t id) = 0;
  virtual json createIssue(const json& payload) = 0;
  virtual json updateIssue(int64_t id, const json& payload) = 0;
  virtual void deleteIssue(int64_t id) = 0;

  virtual json listUsers(std::optional<int64_t> project) = 0;
  virtual json listProjectUsers(int64_t project) = 0;

  virtual json listMilestones(int64_t project) = 0;
};

// Produces one authenticated client per inbound request.
using ClientFactory = std::function<std::shared_ptr<TaigaApi>()>;

} // namespace tgw
