#include "rendering/SessionWorkspace.h"
#include "utils/SessionLog.h"
#include "support/TestSupport.h"

#include <gtest/gtest.h>
#include <stdexcept>

using beatcut_test::TempDirectory;

// Test the directory exists while the workspace is alive and is gone afterwards
TEST(SessionWorkspaceTest, RemovedOnDestruction)
{
    TempDirectory temp;
    juce::File directory;

    {
        SessionWorkspace workspace(temp.get(), "session-a");
        ASSERT_TRUE(workspace.create().wasOk());

        directory = workspace.getDirectory();
        EXPECT_TRUE(directory.isDirectory());
        EXPECT_TRUE(workspace.isActive());

        workspace.getFile("segment_000.mp4").replaceWithText("data");
        workspace.getFile("nested").createDirectory();
        workspace.getFile("nested").getChildFile("deep.txt").replaceWithText("data");
    }

    EXPECT_FALSE(directory.exists());
}

// Test the creation time is taken when the directory is made
TEST(SessionWorkspaceTest, RecordsCreationTime)
{
    TempDirectory temp;
    SessionWorkspace workspace(temp.get(), "session-t");

    const auto before = juce::Time::getCurrentTime();
    ASSERT_TRUE(workspace.create().wasOk());
    const auto after = juce::Time::getCurrentTime();

    EXPECT_GE(workspace.getCreatedAt().toMilliseconds(), before.toMilliseconds());
    EXPECT_LE(workspace.getCreatedAt().toMilliseconds(), after.toMilliseconds());
}

// Test an exception unwinding through the session still removes the directory
TEST(SessionWorkspaceTest, RemovedWhenExceptionUnwinds)
{
    TempDirectory temp;
    const auto directory = temp.file("session-b");

    try
    {
        SessionWorkspace workspace(temp.get(), "session-b");
        ASSERT_TRUE(workspace.create().wasOk());
        workspace.getFile("partial.mp4").replaceWithText("half written");
        throw std::runtime_error("render blew up");
    }
    catch (const std::runtime_error& e)
    {
        EXPECT_STREQ(e.what(), "render blew up");
    }

    EXPECT_FALSE(directory.exists());
}

// Test remove is idempotent and leaves sibling sessions alone
TEST(SessionWorkspaceTest, RemoveOnlyTouchesOwnDirectory)
{
    TempDirectory temp;
    SessionWorkspace first(temp.get(), "first");
    SessionWorkspace second(temp.get(), "second");
    ASSERT_TRUE(first.create().wasOk());
    ASSERT_TRUE(second.create().wasOk());

    first.remove();
    first.remove();

    EXPECT_FALSE(first.isActive());
    EXPECT_FALSE(first.getDirectory().exists());
    EXPECT_TRUE(second.getDirectory().isDirectory());
}

// Test a workspace never adopts a directory it didn't create
TEST(SessionWorkspaceTest, RefusesExistingDirectory)
{
    TempDirectory temp;
    temp.file("taken").createDirectory();
    temp.file("taken").getChildFile("keep.txt").replaceWithText("someone else's");

    {
        SessionWorkspace workspace(temp.get(), "taken");
        EXPECT_TRUE(workspace.create().failed());
        EXPECT_FALSE(workspace.isActive());
    }

    EXPECT_TRUE(temp.file("taken").getChildFile("keep.txt").existsAsFile());
}

// Test session ids are unique
TEST(SessionWorkspaceTest, SessionIdsAreUnique)
{
    juce::StringArray ids;
    for (int i = 0; i < 50; ++i)
        EXPECT_TRUE(ids.addIfNotAlreadyThere(SessionWorkspace::createSessionId()));
}

// Test the session log layout and that lines reach session.log
TEST(SessionLogTest, WritesUnderSessionDirectory)
{
    TempDirectory temp;
    juce::File logFile;

    {
        SessionLog log(temp.get(), "abc");
        ASSERT_TRUE(log.open().wasOk());

        EXPECT_EQ(log.getSessionDirectory(), temp.file("session_abc"));
        EXPECT_TRUE(log.getFFmpegLogDirectory().isDirectory());

        auto callback = log.makeCallback();
        callback("first line");
        log.write("second line");
        logFile = log.getLogFile();
    }

    const auto text = logFile.loadFileAsString();
    EXPECT_TRUE(text.contains("first line"));
    EXPECT_TRUE(text.contains("second line"));
    EXPECT_LT(text.indexOf("first line"), text.indexOf("second line"));
}

// Test the application log file name embeds the start time
TEST(SessionLogTest, ApplicationLogFileName)
{
    const juce::Time start(2024, 2, 9, 13, 5, 7);
    EXPECT_EQ(SessionLog::getApplicationLogFileName(start), "BeatCut_20240309_130507.log");
}
