#pragma once
#include <memory>

#include <nlohmann/json.hpp>

#include "core/idempotency/IdempotencyStore.hpp"
#include "core/taiga/TaigaApi.hpp"
#include "core/update/UpdateOrchestrator.hpp"

namespace tgw {

// The gateway operations shared by the HTTP actions and the RPC tools.
// Each takes a JSON argument object (query parameters or body/tool
// arguments), validates it before any remote call, talks to a fresh client
// from the factory and returns the projected result. Errors are thrown as
// GatewayError subclasses.
class Gateway {
public:
  Gateway(ClientFactory factory, IdempotencyStore& idempotency);

  json listProjects(const json& args);
  json getProject(const json& args);

  json listEpics(const json& args);
  json createEpic(const json& args);
  json updateEpic(const json& args);
  json deleteEpic(const json& args);
  json addStoryToEpic(const json& args);

  json listStories(const json& args);
  json createStory(const json& args);
  json updateStory(const json& args);
  json deleteStory(const json& args);

  json listStatuses(const json& args);

  json listTasks(const json& args);
  json createTask(const json& args);
  json updateTask(const json& args);
  json deleteTask(const json& args);

  json createIssue(const json& args);
  json updateIssue(const json& args);
  json deleteIssue(const json& args);

  json listUsers(const json& args);
  json listMilestones(const json& args);

private:
  std::shared_ptr<TaigaApi> client();
  json runUpdate(EntityKind kind, const UpdateRequest& req);

  ClientFactory factory_;
  IdempotencyStore& idempotency_;
};

} // namespace tgw
