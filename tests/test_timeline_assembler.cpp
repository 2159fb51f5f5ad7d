#include "rendering/TimelineAssembler.h"
#include "support/TestSupport.h"

#include <gtest/gtest.h>

using namespace BeatSyncTypes;
using beatcut_test::RecordingExecutor;
using beatcut_test::TempDirectory;

// Test the list keeps segment order, one line per file
TEST(TimelineAssemblerTest, ConcatListKeepsOrder)
{
    const std::vector<juce::File> segments { juce::File("/work/segment_002.mp4"),
                                             juce::File("/work/segment_000.mp4"),
                                             juce::File("/work/segment_001.mp4") };

    const auto list = TimelineAssembler::buildConcatList(segments);
    juce::StringArray lines;
    lines.addLines(list.trimEnd());

    ASSERT_EQ(lines.size(), 3);
    EXPECT_EQ(lines[0], "file '" + segments[0].getFullPathName() + "'");
    EXPECT_EQ(lines[1], "file '" + segments[1].getFullPathName() + "'");
    EXPECT_EQ(lines[2], "file '" + segments[2].getFullPathName() + "'");
}

// Test single quotes in paths are escaped for the concat demuxer
TEST(TimelineAssemblerTest, QuotesAwkwardPaths)
{
    const juce::File file("/work/it's here.mp4");
    EXPECT_EQ(TimelineAssembler::quoteConcatPath(file), "'/work/it'\\''s here.mp4'");
}

// Test concat is a stream copy with regenerated timestamps
TEST(TimelineAssemblerTest, ConcatArgs)
{
    const auto args = TimelineAssembler::buildConcatArgs(juce::File("/work/list.txt"), juce::File("/work/merged.mp4"));

    EXPECT_EQ(args[args.indexOf("-f") + 1], "concat");
    EXPECT_EQ(args[args.indexOf("-safe") + 1], "0");
    EXPECT_EQ(args[args.indexOf("-fflags") + 1], "+genpts");
    EXPECT_EQ(args[args.indexOf("-c") + 1], "copy");
}

// Test the soundtrack replaces the video's audio and the shorter input wins
TEST(TimelineAssemblerTest, MuxArgs)
{
    EncodeSpec spec;
    const auto args = TimelineAssembler::buildMuxArgs(juce::File("/work/merged.mp4"), juce::File("/work/song.mp3"),
                                                      juce::File("/out/final.mp4"), spec);

    juce::StringArray expected;
    expected.addTokens("-i /work/merged.mp4 -i /work/song.mp3 -map 0:v:0 -map 1:a:0 -c:v copy -c:a aac -b:a 192k -shortest /out/final.mp4",
                       false);
    EXPECT_EQ(args.joinIntoString(" "), expected.joinIntoString(" "));
}

// Test concatenation writes the list, runs ffmpeg and removes the list
TEST(TimelineAssemblerTest, ConcatenatesExistingSegments)
{
    TempDirectory temp;
    RecordingExecutor executor;
    TimelineAssembler assembler(&executor);

    const std::vector<juce::File> segments { temp.touch("segment_000.mp4"), temp.touch("segment_001.mp4") };
    const auto output = temp.file("merged.mp4");

    ASSERT_TRUE(assembler.concatenateSegments(segments, output).wasOk());
    EXPECT_TRUE(output.existsAsFile());
    EXPECT_FALSE(temp.file("concat_merged.txt").exists());

    const auto calls = executor.getFFmpegCalls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].concatList, TimelineAssembler::buildConcatList(segments));
}

// Test empty or incomplete segment lists fail without running ffmpeg
TEST(TimelineAssemblerTest, RejectsMissingSegments)
{
    TempDirectory temp;
    RecordingExecutor executor;
    TimelineAssembler assembler(&executor);

    EXPECT_TRUE(assembler.concatenateSegments({}, temp.file("merged.mp4")).failed());
    EXPECT_TRUE(assembler.concatenateSegments({ temp.touch("a.mp4"), temp.file("gone.mp4") }, temp.file("merged.mp4")).failed());
    EXPECT_TRUE(executor.getFFmpegCalls().empty());
}

// Test a failed mux leaves no partial output and the error names the step
TEST(TimelineAssemblerTest, MuxFailureRemovesOutput)
{
    TempDirectory temp;
    RecordingExecutor executor;
    executor.failWhenDescriptionContains("muxing");
    TimelineAssembler assembler(&executor);

    const auto output = temp.touch("final.mp4");
    const auto result = assembler.muxAudio(temp.touch("merged.mp4"), temp.touch("song.mp3"), output);

    ASSERT_TRUE(result.failed());
    EXPECT_TRUE(result.getErrorMessage().contains("muxing audio failed"));
    EXPECT_FALSE(output.exists());

    EXPECT_TRUE(assembler.muxAudio(temp.file("merged.mp4"), temp.file("nosong.mp3"), output).failed());
}
