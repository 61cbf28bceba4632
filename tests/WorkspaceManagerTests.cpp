#include <gtest/gtest.h>
#include "TestFakes.h"
#include "io/WorkspaceManager.h"

using namespace storyreel_test;

namespace {

// -----------------------------------------------------------------------------
TEST(WorkspaceManagerTest, SameJobIdGetsDistinctDirectories) {
  ScopedTempDirectory temp;
  WorkspaceManager manager(temp.get().getChildFile("work"));

  juce::File first, second;
  ASSERT_TRUE(manager.acquire("r1", first).wasOk());
  ASSERT_TRUE(manager.acquire("r1", second).wasOk());

  EXPECT_NE(first, second);
  EXPECT_TRUE(first.isDirectory());
  EXPECT_TRUE(second.isDirectory());
  EXPECT_TRUE(first.getFileName().startsWith("render_r1_"));
  EXPECT_TRUE(first.isAChildOf(manager.getRoot()));
}

TEST(WorkspaceManagerTest, ReleaseRemovesEverythingInside) {
  ScopedTempDirectory temp;
  WorkspaceManager manager(temp.get());

  juce::File workspace;
  ASSERT_TRUE(manager.acquire("r2", workspace).wasOk());
  ASSERT_TRUE(workspace.getChildFile("clip_000.mp4").replaceWithText("x"));
  ASSERT_TRUE(workspace.getChildFile("logs").createDirectory().wasOk());

  manager.release(workspace);

  EXPECT_FALSE(workspace.exists());
}

TEST(WorkspaceManagerTest, ReleaseRefusesPathsOutsideTheRoot) {
  ScopedTempDirectory temp;
  const auto outside = temp.get().getChildFile("elsewhere");
  ASSERT_TRUE(outside.createDirectory().wasOk());

  WorkspaceManager manager(temp.get().getChildFile("work"));
  manager.release(outside);

  EXPECT_TRUE(outside.isDirectory());
}

TEST(WorkspaceManagerTest, ScopedWorkspaceReleasesOnExit) {
  ScopedTempDirectory temp;
  WorkspaceManager manager(temp.get());
  juce::File directory;

  {
    ScopedWorkspace workspace(manager, "r3");
    ASSERT_TRUE(workspace.getResult().wasOk());
    directory = workspace.getDirectory();
    EXPECT_TRUE(directory.isDirectory());
  }

  EXPECT_FALSE(directory.exists());
}

TEST(WorkspaceManagerTest, SweepRemovesOnlyOldRenderDirectories) {
  ScopedTempDirectory temp;
  WorkspaceManager manager(temp.get());

  const auto stale = temp.get().getChildFile("render_old_1234abcd");
  const auto fresh = temp.get().getChildFile("render_new_1234abcd");
  const auto unrelated = temp.get().getChildFile("logs");

  for (auto& dir : { stale, fresh, unrelated })
    ASSERT_TRUE(dir.createDirectory().wasOk());

  const auto longAgo = juce::Time::getCurrentTime() - juce::RelativeTime::days(3);
  ASSERT_TRUE(stale.setLastModificationTime(longAgo));
  ASSERT_TRUE(unrelated.setLastModificationTime(longAgo));

  EXPECT_EQ(manager.sweepStaleWorkspaces(juce::RelativeTime::hours(24)), 1);
  EXPECT_FALSE(stale.exists());
  EXPECT_TRUE(fresh.isDirectory());
  EXPECT_TRUE(unrelated.isDirectory());
}

TEST(WorkspaceManagerTest, JobIdsAreSanitised) {
  EXPECT_EQ(WorkspaceManager::sanitiseJobId("abc-123_X"), "abc-123_X");
  EXPECT_EQ(WorkspaceManager::sanitiseJobId("../../etc"), "etc");
  EXPECT_EQ(WorkspaceManager::sanitiseJobId("///"), "job");
  EXPECT_EQ(WorkspaceManager::sanitiseJobId(juce::String::repeatedString("a", 100)).length(), 64);
}

}  // namespace
