#include <gtest/gtest.h>

#include "FakeTaiga.hpp"
#include "core/idempotency/IdempotencyStore.hpp"
#include "services/gateway/Gateway.hpp"

using namespace tgw;
using nlohmann::json;

class GatewayTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        fake().stories[5] = {{"id", 5}, {"project", 3}, {"subject", "Mirror"}, {"version", 1}};
        fake().taskStatuses[3] = json::array({{{"id", 20}, {"name", "New"}, {"slug", "new"}},
                                              {{"id", 21}, {"name", "Doing"}, {"slug", "doing"}}});
        fake().storyStatuses[3] = json::array({{{"id", 10}, {"name", "Backlog"}, {"slug", "backlog"}},
                                               {{"id", 11}, {"name", "Done"}, {"slug", "done"}}});
    }

    FakeTaiga& fake() { return *clients.fake; }
    int built() const { return *clients.built; }

    FakeFactory clients;
    IdempotencyStore store;
    Gateway gateway{clients.factory(), store};
};

// -------- tasks --------

TEST_F(GatewayTest, CreateTaskResolvesProjectAndStatus)
{
    const json out = gateway.createTask({{"user_story_id", 5},
                                         {"subject", "Stand up mirror"},
                                         {"status", "Doing"}});

    ASSERT_EQ(fake().created.size(), 1u);
    EXPECT_EQ(fake().created[0],
              (json{{"project", 3}, {"user_story", 5}, {"subject", "Stand up mirror"}, {"status", 21}}));
    EXPECT_EQ(out["project"], 3);
    EXPECT_EQ(out["status"], 21);
    EXPECT_EQ(out["id"], 1000);
}

TEST_F(GatewayTest, CreateTaskReplaysWithinTtl)
{
    const json args = {{"user_story_id", 5}, {"subject", "Stand up mirror"},
                       {"status", "Doing"}, {"idempotency_key", "abc"}};
    const json first = gateway.createTask(args);
    const json second = gateway.createTask(args);

    EXPECT_EQ(first, second);
    EXPECT_EQ(fake().count("createTask"), 1);
    // The replay is answered before any client is built.
    EXPECT_EQ(built(), 1);
}

TEST_F(GatewayTest, CreateTaskSameTokenDifferentSubjectCreatesAgain)
{
    gateway.createTask({{"user_story_id", 5}, {"subject", "One"}, {"idempotency_key", "abc"}});
    gateway.createTask({{"user_story_id", 5}, {"subject", "Two"}, {"idempotency_key", "abc"}});

    EXPECT_EQ(fake().count("createTask"), 2);
}

TEST_F(GatewayTest, CreateTaskWithoutTokenNeverCaches)
{
    gateway.createTask({{"user_story_id", 5}, {"subject", "One"}});
    gateway.createTask({{"user_story_id", 5}, {"subject", "One"}});

    EXPECT_EQ(fake().count("createTask"), 2);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(GatewayTest, CreateTaskValidatesBeforeRemoteCalls)
{
    EXPECT_THROW(gateway.createTask({{"user_story_id", 5}}), ValidationError);
    EXPECT_THROW(gateway.createTask({{"subject", "x"}}), ValidationError);
    EXPECT_THROW(gateway.createTask({{"user_story_id", 5}, {"subject", "x"}, {"due_date", "2024-02-30"}}),
                 ValidationError);
    EXPECT_THROW(gateway.createTask({{"user_story_id", 5}, {"subject", "x"}, {"status", 1.5}}),
                 ValidationError);
    EXPECT_EQ(built(), 0);
}

TEST_F(GatewayTest, CreateTaskUnknownStatusCreatesNothing)
{
    EXPECT_THROW(gateway.createTask({{"user_story_id", 5}, {"subject", "x"}, {"status", "Blocked"}}),
                 NotFound);
    EXPECT_EQ(fake().count("createTask"), 0);
}

TEST_F(GatewayTest, ListTasksReturnsTasksAndPagination)
{
    fake().taskPage = json::array({{{"id", 1}, {"subject", "a"}, {"internal", true}}});
    fake().taskPagination = {{"page", 1}, {"total", 1}};

    const json out = gateway.listTasks({{"project_id", "3"}, {"status", "Doing"}, {"page", "1"}});

    EXPECT_EQ(out["tasks"], json::array({{{"id", 1}, {"subject", "a"}}}));
    EXPECT_EQ(out["pagination"], fake().taskPagination);
    EXPECT_EQ(fake().lastTaskFilter.status.value(), 21);
    EXPECT_EQ(fake().lastTaskFilter.project.value(), 3);
    EXPECT_EQ(fake().lastTaskFilter.page.value(), 1);
}

TEST_F(GatewayTest, ListTasksStatusNameNeedsProject)
{
    try {
        gateway.listTasks({{"status", "Doing"}});
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "project_id is required when filtering by status name");
    }
    EXPECT_EQ(built(), 0);
}

TEST_F(GatewayTest, ListTasksNumericStatusStringIsAnId)
{
    gateway.listTasks({{"status", "21"}});
    EXPECT_EQ(fake().lastTaskFilter.status.value(), 21);
    EXPECT_EQ(fake().count("listTaskStatuses"), 0);
}

TEST_F(GatewayTest, UpdateTaskConflict)
{
    fake().tasks[7] = {{"id", 7}, {"project", 3}, {"subject", "t"}, {"version", 1}};
    fake().failNextUpdate = RemoteApiError("Taiga API request failed with status 409: {}", 409);
    fake().versionAfterFailure = 2;

    try {
        gateway.updateTask({{"task_id", 7}, {"subject", "Renamed"}});
        FAIL() << "expected Conflict";
    } catch (const Conflict& e) {
        EXPECT_STREQ(e.what(), "conflict updating task 7: latest version is 2");
        EXPECT_EQ(e.httpStatus(), 400);
    }
}

TEST_F(GatewayTest, UpdateTaskWithoutFieldsFailsBeforeClient)
{
    EXPECT_THROW(gateway.updateTask({{"task_id", 7}}), ValidationError);
    EXPECT_EQ(built(), 0);
}

TEST_F(GatewayTest, DeleteTaskReturnsId)
{
    fake().tasks[7] = {{"id", 7}};
    EXPECT_EQ(gateway.deleteTask({{"task_id", "7"}}), (json{{"task_id", 7}}));
    EXPECT_EQ(fake().tasks.count(7), 0u);
}

// -------- stories --------

TEST_F(GatewayTest, CreateStoryOmitsEmptyDescriptionAndTags)
{
    gateway.createStory({{"project_id", 3}, {"subject", "S"}, {"description", ""},
                         {"tags", json::array()}, {"status", "done"}});

    ASSERT_EQ(fake().created.size(), 1u);
    EXPECT_EQ(fake().created[0], (json{{"project", 3}, {"subject", "S"}, {"status", 11}}));
}

TEST_F(GatewayTest, UpdateStoryAcceptsAliasAndClearsTags)
{
    const json out = gateway.updateStory({{"story_id", 5}, {"tags", nullptr}, {"status", "Backlog"}});

    ASSERT_EQ(fake().updates.size(), 1u);
    EXPECT_EQ(fake().updates[0].second,
              (json{{"tags", json::array()}, {"status", 10}, {"version", 1}}));
    EXPECT_EQ(out["version"], 2);
}

TEST_F(GatewayTest, DeleteStoryEnvelope)
{
    EXPECT_EQ(gateway.deleteStory({{"user_story_id", 5}}), (json{{"story_id", 5}}));
}

TEST_F(GatewayTest, ListStoriesPassesFilters)
{
    const json out = gateway.listStories({{"project_id", 3}, {"search", "mir"}, {"tags", "ops"}, {"epic_id", "9"}});

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0]["subject"], "Mirror");
    EXPECT_EQ(fake().lastStoryFilter.q.value(), "mir");
    EXPECT_EQ(fake().lastStoryFilter.tags, std::vector<std::string>{"ops"});
    EXPECT_EQ(fake().lastStoryFilter.epic.value(), 9);
}

// -------- projects --------

TEST_F(GatewayTest, ListProjectsDefaultsMemberAndFiltersByName)
{
    fake().projects = json::array({{{"id", 1}, {"name", "Apollo"}, {"slug", "apollo"}, {"owner", 4}},
                                   {{"id", 2}, {"name", "Gemini"}, {"slug", "gemini"}}});

    const json out = gateway.listProjects({{"search", "APOL"}});

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], (json{{"id", 1}, {"name", "Apollo"}, {"slug", "apollo"}}));
    ASSERT_EQ(fake().lastProjectFilters.count("member"), 1u);
    EXPECT_EQ(fake().lastProjectFilters.find("member")->second, "99");
    EXPECT_EQ(fake().lastProjectFilters.count("search"), 0u);
}

TEST_F(GatewayTest, ListProjectsKeepsExplicitMember)
{
    gateway.listProjects({{"member", 4}});
    EXPECT_EQ(fake().lastProjectFilters.find("member")->second, "4");
    EXPECT_EQ(fake().count("currentUserId"), 0);
}

TEST_F(GatewayTest, GetProjectRequiresExactlyOneSelector)
{
    EXPECT_THROW(gateway.getProject(json::object()), ValidationError);
    EXPECT_THROW(gateway.getProject({{"project_id", 1}, {"slug", "a"}}), ValidationError);

    fake().projects = json::array({{{"id", 1}, {"name", "Apollo"}, {"slug", "apollo"}}});
    EXPECT_EQ(gateway.getProject({{"slug", "apollo"}})["id"], 1);
    EXPECT_EQ(gateway.getProject({{"project_id", "1"}})["slug"], "apollo");
}

// -------- epics --------

TEST_F(GatewayTest, ListEpicsTagsEachWithProject)
{
    fake().epics[1] = {{"id", 1}, {"project", 3}, {"subject", "E1"}, {"color", "#fff"}};
    fake().epics[2] = {{"id", 2}, {"project", 4}, {"subject", "E2"}};

    const json out = gateway.listEpics({{"project_id", json::array({"3", "4"})}});

    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], (json{{"id", 1}, {"subject", "E1"}, {"project_id", 3}}));
    EXPECT_EQ(out[1]["project_id"], 4);
}

TEST_F(GatewayTest, EpicStatusMustBeInteger)
{
    EXPECT_THROW(gateway.createEpic({{"project_id", 3}, {"subject", "E"}, {"status", "New"}}), ValidationError);
    fake().epics[9] = {{"id", 9}, {"project", 3}, {"version", 1}};
    EXPECT_THROW(gateway.updateEpic({{"epic_id", 9}, {"status", "New"}}), ValidationError);
    EXPECT_EQ(fake().count("updateEpic"), 0);
}

TEST_F(GatewayTest, AddStoryToEpicReturnsLink)
{
    EXPECT_EQ(gateway.addStoryToEpic({{"epic_id", 9}, {"user_story_id", 5}}),
              (json{{"epic", 9}, {"user_story", 5}}));
}

// -------- issues --------

TEST_F(GatewayTest, CreateIssueMapsTypeField)
{
    gateway.createIssue({{"project_id", 3}, {"subject", "Bug"}, {"type", "2"}, {"priority", 3}});

    ASSERT_EQ(fake().created.size(), 1u);
    EXPECT_EQ(fake().created[0],
              (json{{"project", 3}, {"subject", "Bug"}, {"issue_type", 2}, {"priority", 3}}));
}

// -------- users, statuses, milestones --------

TEST_F(GatewayTest, ListUsersFallsBackToProjectMembers)
{
    fake().failUsers = RemoteApiError("Taiga API request failed with status 403: {}", 403);
    fake().projectUsers[3] = json::array({
        {{"id", 50}, {"user", {{"id", 8}, {"full_name", "Ann Lee"}, {"username", "ann"}, {"photo", "x"}}}},
        {{"id", 51}, {"user", {{"id", 9}, {"full_name", "Bo"}, {"username", "bo"}}}},
    });

    const json out = gateway.listUsers({{"project_id", 3}, {"search", "lee"}});

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], (json{{"id", 8}, {"full_name", "Ann Lee"}, {"username", "ann"}}));
    EXPECT_EQ(fake().count("listProjectUsers"), 1);
}

TEST_F(GatewayTest, ListUsersWithoutProjectPropagatesDenial)
{
    fake().failUsers = RemoteApiError("Taiga API request failed with status 401: {}", 401);
    EXPECT_THROW(gateway.listUsers(json::object()), RemoteApiError);
    EXPECT_EQ(fake().count("listProjectUsers"), 0);
}

TEST_F(GatewayTest, ListStatusesByKindAndSearch)
{
    const json tasks = gateway.listStatuses({{"project_id", 3}, {"kind", "task"}, {"search", "DOI"}});
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0]["id"], 21);

    const json stories = gateway.listStatuses({{"project_id", 3}});
    EXPECT_EQ(stories.size(), 2u);

    EXPECT_THROW(gateway.listStatuses({{"project_id", 3}, {"kind", "issue"}}), ValidationError);
}

TEST_F(GatewayTest, ListMilestonesSearchesNameAndSlug)
{
    fake().milestones[3] = json::array({
        {{"id", 1}, {"name", "Sprint 1"}, {"slug", "sprint-1"}, {"user_stories", json::array()}},
        {{"id", 2}, {"name", "Launch"}, {"slug", "go-live"}},
    });

    const json out = gateway.listMilestones({{"project_id", 3}, {"search", "LIVE"}});

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], (json{{"id", 2}, {"name", "Launch"}, {"slug", "go-live"}}));
}

TEST_F(GatewayTest, FactoryFailureSurfaces)
{
    IdempotencyStore local;
    Gateway unconfigured([]() -> std::shared_ptr<TaigaApi> {
        throw NotConfigured("TAIGA_BASE_URL, TAIGA_USERNAME and TAIGA_PASSWORD must be configured");
    }, local);

    try {
        unconfigured.listMilestones({{"project_id", 3}});
        FAIL() << "expected NotConfigured";
    } catch (const NotConfigured& e) {
        EXPECT_EQ(e.httpStatus(), 503);
    }
}
