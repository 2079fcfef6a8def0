#include <gtest/gtest.h>

#include "FakeTaiga.hpp"
#include "core/status/StatusResolver.hpp"

using namespace tgw;
using nlohmann::json;

class StatusResolverTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        api.storyStatuses[3] = json::array({
            {{"id", 10}, {"name", "New"}, {"slug", "new"}},
            {{"id", 11}, {"name", "Ready"}, {"slug", "ready-for-test"}},
        });
        api.taskStatuses[3] = json::array({
            {{"id", 20}, {"name", "New"}, {"slug", "new"}},
            {{"id", 21}, {"name", "Doing"}, {"slug", "in-progress"}},
            {{"id", 22}, {"name", "in-progress"}, {"slug", "other"}},
        });
    }

    FakeTaiga api;
    StatusResolver resolver{api};
};

TEST_F(StatusResolverTest, NullResolvesToNothing)
{
    EXPECT_FALSE(resolver.resolve(StatusKind::Task, 3, nullptr).has_value());
    EXPECT_TRUE(api.calls.empty());
}

TEST_F(StatusResolverTest, IntegerPassesThroughWithoutRemoteCall)
{
    EXPECT_EQ(resolver.resolve(StatusKind::UserStory, 3, 77).value(), 77);
    EXPECT_TRUE(api.calls.empty());
}

TEST_F(StatusResolverTest, MatchesNameOrSlugExactly)
{
    EXPECT_EQ(resolver.resolve(StatusKind::Task, 3, "Doing").value(), 21);
    EXPECT_EQ(resolver.resolve(StatusKind::UserStory, 3, "ready-for-test").value(), 11);
    EXPECT_EQ(api.count("listTaskStatuses"), 1);
    EXPECT_EQ(api.count("listUserStoryStatuses"), 1);
}

TEST_F(StatusResolverTest, FirstEntryInListOrderWins)
{
    // "in-progress" is the slug of 21 and the name of 22.
    EXPECT_EQ(resolver.resolve(StatusKind::Task, 3, "in-progress").value(), 21);
}

TEST_F(StatusResolverTest, MatchIsCaseSensitive)
{
    EXPECT_THROW(resolver.resolve(StatusKind::Task, 3, "doing"), NotFound);
}

TEST_F(StatusResolverTest, UnknownNameNamesKindAndProject)
{
    try {
        resolver.resolve(StatusKind::Task, 3, "Blocked");
        FAIL() << "expected NotFound";
    } catch (const NotFound& e) {
        EXPECT_STREQ(e.what(), "task status 'Blocked' not found for project 3");
    }
    try {
        resolver.resolve(StatusKind::UserStory, 3, "Blocked");
        FAIL() << "expected NotFound";
    } catch (const NotFound& e) {
        EXPECT_STREQ(e.what(), "status 'Blocked' not found for project 3");
    }
}

TEST_F(StatusResolverTest, OtherTypesAreRejected)
{
    EXPECT_THROW(resolver.resolve(StatusKind::Task, 3, 1.5), ValidationError);
    EXPECT_THROW(resolver.resolve(StatusKind::Task, 3, json::array()), ValidationError);
}
