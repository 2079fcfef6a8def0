#include "ToolRegistry.hpp"

#include "core/validation/Params.hpp"
#include "services/gateway/Gateway.hpp"

namespace tgw {

using nlohmann::json;

namespace {

// -------- schema helpers --------

json StringProp(const std::string& desc) {
  return {{"type", "string"}, {"description", desc}};
}

json IntProp(const std::string& desc) {
  return {{"type", "integer"}, {"description", desc}};
}

json NullableIntProp(const std::string& desc) {
  return {{"type", json::array({"integer", "null"})}, {"description", desc}};
}

json NullableStringProp(const std::string& desc) {
  return {{"type", json::array({"string", "null"})}, {"description", desc}};
}

json StatusProp(const std::string& desc) {
  return {{"type", json::array({"integer", "string", "null"})}, {"description", desc}};
}

json TagsProp() {
  return {{"type", json::array({"array", "null"})}, {"items", {{"type", "string"}}},
          {"description", "Tag names"}};
}

json MakeSchema(const json& properties, const json& required = json::array()) {
  return {{"type", "object"}, {"properties", properties}, {"required", required}};
}

json ReadOnly() {
  return {{"openWorldHint", true}, {"readOnlyHint", true}, {"idempotentHint", true}};
}

json Mutating(bool destructive = false) {
  return {{"openWorldHint", true}, {"idempotentHint", false}, {"destructiveHint", destructive}};
}

using Method = json (Gateway::*)(const json&);

ToolHandler Bind(Gateway& gateway, Method method) {
  return [&gateway, method](const json& args) { return (gateway.*method)(args); };
}

} // anonymous namespace

void register_gateway_tools(ToolRegistry& registry, Gateway& gw) {
  // Connectivity check for RPC clients; never touches Taiga.
  registry.add({"echo",
                "Echo a message back to the caller.",
                MakeSchema({{"message", StringProp("Text to return")}}, {"message"}),
                {{"openWorldHint", true}}},
               [](const json& args) { return json(requireString(require(args, "message"), "message")); });

  // Projects
  registry.add({"taiga.projects.list",
                "Return the Taiga projects the service account is a member of.",
                MakeSchema({{"search", StringProp("Case-insensitive substring of the project name")}}),
                ReadOnly()},
               Bind(gw, &Gateway::listProjects));

  registry.add({"taiga.projects.get",
                "Fetch project details by numeric identifier or slug.",
                MakeSchema({{"project_id", IntProp("Project id")},
                            {"slug", StringProp("Project slug")}}),
                ReadOnly()},
               Bind(gw, &Gateway::getProject));

  // Epics
  registry.add({"taiga.epics.list",
                "List epics for a Taiga project.",
                MakeSchema({{"project_id", IntProp("Project id")}}, {"project_id"}),
                ReadOnly()},
               Bind(gw, &Gateway::listEpics));

  registry.add({"taiga.epics.create",
                "Create an epic.",
                MakeSchema({{"project_id", IntProp("Project id")},
                            {"subject", StringProp("Epic subject")},
                            {"description", StringProp("Epic description")},
                            {"status", IntProp("Epic status id")},
                            {"assigned_to", NullableIntProp("Assignee user id")},
                            {"tags", TagsProp()},
                            {"color", StringProp("Hex colour, e.g. #A5694F")}},
                           {"project_id", "subject"}),
                Mutating()},
               Bind(gw, &Gateway::createEpic));

  registry.add({"taiga.epics.update",
                "Update an epic with partial field semantics.",
                MakeSchema({{"epic_id", IntProp("Epic id")},
                            {"subject", NullableStringProp("New subject")},
                            {"description", NullableStringProp("New description")},
                            {"status", NullableIntProp("Epic status id")},
                            {"assigned_to", NullableIntProp("Assignee user id")},
                            {"tags", TagsProp()},
                            {"color", NullableStringProp("Hex colour")},
                            {"version", IntProp("Version to submit instead of the current one")}},
                           {"epic_id"}),
                Mutating()},
               Bind(gw, &Gateway::updateEpic));

  registry.add({"taiga.epics.delete",
                "Delete an epic.",
                MakeSchema({{"epic_id", IntProp("Epic id")}}, {"epic_id"}),
                Mutating(true)},
               Bind(gw, &Gateway::deleteEpic));

  registry.add({"taiga.epics.add_user_story",
                "Attach a user story to an epic.",
                MakeSchema({{"epic_id", IntProp("Epic id")},
                            {"user_story_id", IntProp("User story id")}},
                           {"epic_id", "user_story_id"}),
                Mutating()},
               Bind(gw, &Gateway::addStoryToEpic));

  // User stories
  registry.add({"taiga.stories.list",
                "List user stories for a Taiga project with optional filters.",
                MakeSchema({{"project_id", IntProp("Project id")},
                            {"search", StringProp("Full-text query")},
                            {"epic_id", IntProp("Only stories in this epic")},
                            {"tags", TagsProp()},
                            {"page", IntProp("Page number")},
                            {"page_size", IntProp("Page size")}},
                           {"project_id"}),
                ReadOnly()},
               Bind(gw, &Gateway::listStories));

  registry.add({"taiga.stories.create",
                "Create a user story and return the created record.",
                MakeSchema({{"project_id", IntProp("Project id")},
                            {"subject", StringProp("Story subject")},
                            {"description", StringProp("Story description")},
                            {"status", StatusProp("Status id, name or slug")},
                            {"tags", TagsProp()},
                            {"assigned_to", IntProp("Assignee user id")}},
                           {"project_id", "subject"}),
                Mutating()},
               Bind(gw, &Gateway::createStory));

  registry.add({"taiga.stories.update",
                "Update a user story with partial field semantics.",
                MakeSchema({{"user_story_id", IntProp("User story id")},
                            {"subject", NullableStringProp("New subject")},
                            {"description", NullableStringProp("New description")},
                            {"status", StatusProp("Status id, name or slug")},
                            {"tags", TagsProp()},
                            {"assigned_to", NullableIntProp("Assignee user id")},
                            {"epic_id", NullableIntProp("Epic id")},
                            {"milestone_id", NullableIntProp("Milestone id")},
                            {"custom_attributes", {{"type", json::array({"object", "null"})}}},
                            {"version", IntProp("Version to submit instead of the current one")}},
                           {"user_story_id"}),
                Mutating()},
               Bind(gw, &Gateway::updateStory));

  registry.add({"taiga.stories.delete",
                "Delete a user story.",
                MakeSchema({{"user_story_id", IntProp("User story id")}}, {"user_story_id"}),
                Mutating(true)},
               Bind(gw, &Gateway::deleteStory));

  registry.add({"taiga.statuses.list",
                "List the story or task statuses of a project.",
                MakeSchema({{"project_id", IntProp("Project id")},
                            {"kind", {{"type", "string"}, {"enum", {"story", "task"}}}},
                            {"search", StringProp("Substring of name or slug")}},
                           {"project_id"}),
                ReadOnly()},
               Bind(gw, &Gateway::listStatuses));

  // Tasks
  registry.add({"taiga.tasks.create",
                "Create a task for a user story. Supply idempotency_key to make retries safe.",
                MakeSchema({{"user_story_id", IntProp("Parent user story id")},
                            {"project_id", IntProp("Project id, when there is no parent story")},
                            {"subject", StringProp("Task subject")},
                            {"description", NullableStringProp("Task description")},
                            {"assigned_to", NullableIntProp("Assignee user id")},
                            {"status", StatusProp("Status id, name or slug")},
                            {"tags", TagsProp()},
                            {"due_date", NullableStringProp("Due date, YYYY-MM-DD")},
                            {"idempotency_key", StringProp("Caller token identifying retries")}},
                           {"subject"}),
                Mutating()},
               Bind(gw, &Gateway::createTask));

  registry.add({"taiga.tasks.update",
                "Update fields on an existing task.",
                MakeSchema({{"task_id", IntProp("Task id")},
                            {"subject", NullableStringProp("New subject")},
                            {"description", NullableStringProp("New description")},
                            {"assigned_to", NullableIntProp("Assignee user id")},
                            {"status", StatusProp("Status id, name or slug")},
                            {"tags", TagsProp()},
                            {"due_date", NullableStringProp("Due date, YYYY-MM-DD")},
                            {"user_story_id", NullableIntProp("Parent user story id")},
                            {"version", IntProp("Version to submit instead of the current one")}},
                           {"task_id"}),
                Mutating()},
               Bind(gw, &Gateway::updateTask));

  registry.add({"taiga.tasks.delete",
                "Delete a task.",
                MakeSchema({{"task_id", IntProp("Task id")}}, {"task_id"}),
                Mutating(true)},
               Bind(gw, &Gateway::deleteTask));

  registry.add({"taiga.tasks.list",
                "List tasks with optional filters and pagination metadata.",
                MakeSchema({{"project_id", IntProp("Project id")},
                            {"user_story_id", IntProp("Parent user story id")},
                            {"assigned_to", IntProp("Assignee user id")},
                            {"search", StringProp("Full-text query")},
                            {"status", StatusProp("Status id, or name when project_id is given")},
                            {"page", IntProp("Page number")},
                            {"page_size", IntProp("Page size")}}),
                ReadOnly()},
               Bind(gw, &Gateway::listTasks));

  // Issues
  registry.add({"taiga.issues.create",
                "Create an issue. Status, priority, severity and type take ids.",
                MakeSchema({{"project_id", IntProp("Project id")},
                            {"subject", StringProp("Issue subject")},
                            {"description", StringProp("Issue description")},
                            {"status", IntProp("Status id")},
                            {"priority", IntProp("Priority id")},
                            {"severity", IntProp("Severity id")},
                            {"type", IntProp("Issue type id")},
                            {"assigned_to", NullableIntProp("Assignee user id")},
                            {"tags", TagsProp()}},
                           {"project_id", "subject"}),
                Mutating()},
               Bind(gw, &Gateway::createIssue));

  registry.add({"taiga.issues.update",
                "Update an issue with partial field semantics.",
                MakeSchema({{"issue_id", IntProp("Issue id")},
                            {"subject", NullableStringProp("New subject")},
                            {"description", NullableStringProp("New description")},
                            {"status", NullableIntProp("Status id")},
                            {"priority", IntProp("Priority id")},
                            {"severity", IntProp("Severity id")},
                            {"type", IntProp("Issue type id")},
                            {"assigned_to", NullableIntProp("Assignee user id")},
                            {"tags", TagsProp()},
                            {"version", IntProp("Version to submit instead of the current one")}},
                           {"issue_id"}),
                Mutating()},
               Bind(gw, &Gateway::updateIssue));

  registry.add({"taiga.issues.delete",
                "Delete an issue.",
                MakeSchema({{"issue_id", IntProp("Issue id")}}, {"issue_id"}),
                Mutating(true)},
               Bind(gw, &Gateway::deleteIssue));

  // Users and milestones
  registry.add({"taiga.users.list",
                "List Taiga users to support id resolution.",
                MakeSchema({{"project_id", IntProp("Restrict to project members")},
                            {"search", StringProp("Substring of full name, username or email")}}),
                ReadOnly()},
               Bind(gw, &Gateway::listUsers));

  registry.add({"taiga.milestones.list",
                "List milestones for a project with optional search filtering.",
                MakeSchema({{"project_id", IntProp("Project id")},
                            {"search", StringProp("Substring of name or slug")}},
                           {"project_id"}),
                ReadOnly()},
               Bind(gw, &Gateway::listMilestones));
}

} // namespace tgw
