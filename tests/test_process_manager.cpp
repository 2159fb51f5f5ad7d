#include "core/ProcessManager.h"

#include <gtest/gtest.h>

// Test a managed process is tracked exactly as long as it exists
TEST(ProcessManagerTest, TracksManagedProcessLifetime)
{
    auto& manager = ProcessManager::getInstance();
    const int before = manager.getNumTracked();

    {
        ManagedChildProcess first("[s1] trimming segment 0");
        ManagedChildProcess second("[s2] probing a.mp4");

        EXPECT_EQ(manager.getNumTracked(), before + 2);

        const auto descriptions = manager.getDescriptions();
        EXPECT_TRUE(descriptions.contains("[s1] trimming segment 0"));
        EXPECT_TRUE(descriptions.contains("[s2] probing a.mp4"));
    }

    EXPECT_EQ(manager.getNumTracked(), before);
    EXPECT_FALSE(manager.getDescriptions().contains("[s1] trimming segment 0"));
}

// Test processes that never started are not counted as killed
TEST(ProcessManagerTest, TerminateSkipsIdleProcesses)
{
    ManagedChildProcess idle("[s3] idle");
    EXPECT_EQ(ProcessManager::getInstance().terminateAllProcesses(), 0);
}
