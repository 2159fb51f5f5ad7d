#include "rendering/ClipSplitter.h"
#include "support/TestSupport.h"

#include <gtest/gtest.h>
#include <vector>

using namespace BeatSyncTypes;
using beatcut_test::makeAsset;
using beatcut_test::makeProbeJson;
using beatcut_test::RecordingExecutor;
using beatcut_test::TempDirectory;

// Test whole clips only; the remainder is dropped
TEST(ClipSplitterTest, CountsWholeClips)
{
    EXPECT_EQ(ClipSplitter::countClips(10.0, 3.0), 3);
    EXPECT_EQ(ClipSplitter::countClips(6.0, 2.0), 3);
    EXPECT_EQ(ClipSplitter::countClips(0.6 * 10.0, 0.6), 10);
    EXPECT_EQ(ClipSplitter::countClips(1.9, 2.0), 0);
    EXPECT_EQ(ClipSplitter::countClips(5.0, 0.0), 0);
    EXPECT_EQ(ClipSplitter::countClips(-1.0, 1.0), 0);
}

namespace
{
    class ClipSplitterTest : public ::testing::Test
    {
    protected:
        ClipSplitterTest()
            : prober(&executor),
              splitter(&executor, &prober)
        {
            splitter.setStatusCallback([this](const juce::String& s) { statuses.add(s); });
        }

        MediaAsset asset(const juce::String& name, double duration, bool hasAudio = true)
        {
            auto a = makeAsset(name, duration, temp.touch(name + ".mp4"));
            executor.setProbeOutput(a.storagePath, makeProbeJson(duration, 1920, 1088, "24/1", "h264", hasAudio));
            return a;
        }

        TempDirectory temp;
        RecordingExecutor executor;
        AssetProber prober;
        ClipSplitter splitter;
        juce::StringArray statuses;
    };
}

// Test clips are named clip_<video>_<clip> and cut at consecutive offsets
TEST_F(ClipSplitterTest, NamesAndOffsets)
{
    const std::vector<MediaAsset> assets { asset("first", 7.0), asset("second", 4.0, false) };

    std::vector<ClipSplitter::Clip> clips;
    const auto result = splitter.split(assets, 2.0, temp.file("clips"), clips);

    ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
    ASSERT_EQ(clips.size(), 5u);

    EXPECT_EQ(clips[0].file.getFileName(), "clip_0_0.mp4");
    EXPECT_EQ(clips[2].file.getFileName(), "clip_0_2.mp4");
    EXPECT_EQ(clips[3].file.getFileName(), "clip_1_0.mp4");
    EXPECT_EQ(clips[4].file.getFileName(), "clip_1_1.mp4");
    EXPECT_DOUBLE_EQ(clips[2].startSeconds, 4.0);
    EXPECT_EQ(clips[4].assetIndex, 1);

    for (const auto& clip : clips)
        EXPECT_TRUE(clip.file.existsAsFile());

    const auto calls = executor.getFFmpegCalls();
    ASSERT_EQ(calls.size(), 5u);
    EXPECT_EQ(calls[1].valueAfter("-ss"), "2.000000");
    EXPECT_EQ(calls[1].valueAfter("-t"), "2.000000");
    EXPECT_TRUE(calls[4].contains("1:a:0"));
}

// Test the status messages a client sees while splitting
TEST_F(ClipSplitterTest, ReportsStatus)
{
    const std::vector<MediaAsset> assets { asset("only", 4.5) };

    std::vector<ClipSplitter::Clip> clips;
    ASSERT_TRUE(splitter.split(assets, 2.0, temp.file("clips"), clips).wasOk());

    ASSERT_EQ(statuses.size(), 4);
    EXPECT_EQ(statuses[0], "Processing video 1/1: only.mp4");
    EXPECT_EQ(statuses[1], "Generating clip 1/2 from only.mp4");
    EXPECT_EQ(statuses[2], "Generating clip 2/2 from only.mp4");
    EXPECT_EQ(statuses[3], "Clips generated successfully: 2");
}

// Test progress counts clips across every video
TEST_F(ClipSplitterTest, ProgressCountsAllClips)
{
    std::vector<ProgressEvent> events;
    ProgressReporter reporter;
    reporter.setEventCallback([&events](const ProgressEvent& e) { events.push_back(e); });
    reporter.beginSession();

    const std::vector<MediaAsset> assets { asset("a", 2.0), asset("b", 2.0) };
    std::vector<ClipSplitter::Clip> clips;
    ASSERT_TRUE(splitter.split(assets, 1.0, temp.file("clips"), clips, &reporter).wasOk());

    ASSERT_EQ(events.size(), 5u);
    EXPECT_DOUBLE_EQ(events[2].percent, 50.0);
    EXPECT_DOUBLE_EQ(events[4].percent, 100.0);
}

// Test invalid requests and unreadable inputs fail before any cut
TEST_F(ClipSplitterTest, RejectsBadInput)
{
    std::vector<ClipSplitter::Clip> clips;

    EXPECT_TRUE(splitter.split({ asset("a", 3.0) }, 0.0, temp.file("clips"), clips).failed());
    EXPECT_TRUE(splitter.split({}, 1.0, temp.file("clips"), clips).failed());

    const auto unreadable = makeAsset("broken", 3.0, temp.touch("broken.mp4"));
    EXPECT_TRUE(splitter.split({ asset("fine", 3.0), unreadable }, 1.0, temp.file("clips"), clips).failed());

    EXPECT_TRUE(executor.getFFmpegCalls().empty());
    EXPECT_TRUE(clips.empty());
}
