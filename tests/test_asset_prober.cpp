#include "rendering/AssetProber.h"
#include "support/TestSupport.h"

#include <gtest/gtest.h>

using namespace BeatSyncTypes;
using beatcut_test::makeProbeJson;
using beatcut_test::RecordingExecutor;
using beatcut_test::TempDirectory;

// Test the fields the pipeline relies on are read from ffprobe JSON
TEST(AssetProberTest, ParsesProbeOutput)
{
    AssetProber::Metadata metadata;
    const auto result = AssetProber::parseProbeOutput(makeProbeJson(7.5, 1280, 720, "30000/1001", "h264", true, "mp3"),
                                                      metadata);

    ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
    EXPECT_DOUBLE_EQ(metadata.durationSeconds, 7.5);
    EXPECT_EQ(metadata.width, 1280);
    EXPECT_EQ(metadata.height, 720);
    EXPECT_EQ(metadata.frameRate, FrameRate(30000, 1001));
    EXPECT_EQ(metadata.videoCodec, "h264");
    EXPECT_TRUE(metadata.hasAudio);
    EXPECT_EQ(metadata.audioCodec, "mp3");
}

// Test files without a video stream or with garbage output are rejected
TEST(AssetProberTest, RejectsAudioOnlyAndGarbage)
{
    AssetProber::Metadata metadata;

    const juce::String audioOnly = "{ \"streams\": [ { \"codec_type\": \"audio\", \"codec_name\": \"aac\" } ],"
                                   " \"format\": { \"duration\": \"3.0\" } }";
    EXPECT_TRUE(AssetProber::parseProbeOutput(audioOnly, metadata).failed());
    EXPECT_TRUE(AssetProber::parseProbeOutput("not json at all", metadata).failed());
}

// Test stream duration is used when the container reports N/A
TEST(AssetProberTest, FallsBackToStreamDuration)
{
    const juce::String json = "{ \"streams\": [ { \"codec_type\": \"video\", \"codec_name\": \"h264\", \"width\": 1920,"
                              " \"height\": 1088, \"r_frame_rate\": \"24/1\", \"duration\": \"4.25\" } ],"
                              " \"format\": { \"duration\": \"N/A\" } }";

    AssetProber::Metadata metadata;
    ASSERT_TRUE(AssetProber::parseProbeOutput(json, metadata).wasOk());
    EXPECT_DOUBLE_EQ(metadata.durationSeconds, 4.25);
    EXPECT_FALSE(metadata.hasAudio);
}

// Test conformance compares size, rate, video codec and present audio codec
TEST(AssetProberTest, NeedsReencode)
{
    EncodeSpec spec;

    AssetProber::Metadata metadata;
    ASSERT_TRUE(AssetProber::parseProbeOutput(makeProbeJson(5.0), metadata).wasOk());
    EXPECT_FALSE(AssetProber::needsReencode(metadata, spec));

    auto wrongSize = metadata;
    wrongSize.width = 1280;
    EXPECT_TRUE(AssetProber::needsReencode(wrongSize, spec));

    auto wrongRate = metadata;
    wrongRate.frameRate = FrameRate(30, 1);
    EXPECT_TRUE(AssetProber::needsReencode(wrongRate, spec));

    auto wrongAudio = metadata;
    wrongAudio.audioCodec = "opus";
    EXPECT_TRUE(AssetProber::needsReencode(wrongAudio, spec));

    auto silent = metadata;
    silent.hasAudio = false;
    silent.audioCodec.clear();
    EXPECT_FALSE(AssetProber::needsReencode(silent, spec));
}

// Test a conforming asset is accepted without transcoding
TEST(AssetProberTest, ValidatesConformingAssetInPlace)
{
    TempDirectory temp;
    RecordingExecutor executor;
    AssetProber prober(&executor);

    auto asset = beatcut_test::makeAsset("a", 0.0, temp.touch("a.mp4"));
    asset.isValid = false;
    executor.setProbeOutput(asset.storagePath, makeProbeJson(6.0));

    prober.validateAsset(asset, EncodeSpec(), temp.file("standardized"));

    EXPECT_TRUE(asset.isValid) << asset.validationError;
    EXPECT_DOUBLE_EQ(asset.durationSeconds, 6.0);
    EXPECT_EQ(asset.storagePath, temp.file("a.mp4"));
    EXPECT_TRUE(executor.getFFmpegCalls().empty());
}

// Test a non-conforming asset is replaced by a standardized copy
TEST(AssetProberTest, StandardizesNonConformingAsset)
{
    TempDirectory temp;
    RecordingExecutor executor;
    AssetProber prober(&executor);

    auto asset = beatcut_test::makeAsset("b", 0.0, temp.touch("b.mov"));
    executor.setProbeOutput(asset.storagePath, makeProbeJson(3.0, 640, 480, "30/1", "mpeg4"));
    executor.setDefaultProbeOutput(makeProbeJson(3.0));

    juce::StringArray statuses;
    prober.validateAsset(asset, EncodeSpec(), temp.file("standardized"),
                         [&statuses](const juce::String& s) { statuses.add(s); });

    ASSERT_TRUE(asset.isValid) << asset.validationError;
    EXPECT_TRUE(asset.storagePath.getFileName().startsWith("standardized_"));
    EXPECT_TRUE(asset.storagePath.existsAsFile());
    EXPECT_EQ(statuses.size(), 1);

    const auto calls = executor.getFFmpegCalls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].valueAfter("-s"), "1920x1088");
    EXPECT_EQ(calls[0].valueAfter("-r"), "24");
    EXPECT_EQ(calls[0].valueAfter("-c:v"), "libx264");
    EXPECT_EQ(calls[0].valueAfter("-crf"), "0");
    EXPECT_EQ(calls[0].valueAfter("-b:a"), "140k");
}

// Test an unreadable asset is marked invalid, not thrown
TEST(AssetProberTest, MarksUnreadableAssetInvalid)
{
    TempDirectory temp;
    RecordingExecutor executor;
    AssetProber prober(&executor);

    auto asset = beatcut_test::makeAsset("c", 0.0, temp.touch("c.mp4"));
    prober.validateAsset(asset, EncodeSpec(), temp.file("standardized"));

    EXPECT_FALSE(asset.isValid);
    EXPECT_TRUE(asset.validationError.isNotEmpty());

    auto missing = beatcut_test::makeAsset("d", 0.0, temp.file("missing.mp4"));
    prober.validateAsset(missing, EncodeSpec(), temp.file("standardized"));
    EXPECT_FALSE(missing.isValid);
    EXPECT_EQ(missing.validationError, "File not found");
}

// Test a failed transcode leaves no standardized copy behind
TEST(AssetProberTest, FailedTranscodeIsCleanedUp)
{
    TempDirectory temp;
    RecordingExecutor executor;
    executor.failWhenDescriptionContains("standardizing");
    AssetProber prober(&executor);

    auto asset = beatcut_test::makeAsset("e", 0.0, temp.touch("e.avi"));
    executor.setProbeOutput(asset.storagePath, makeProbeJson(3.0, 640, 480));

    prober.validateAsset(asset, EncodeSpec(), temp.file("standardized"));

    EXPECT_FALSE(asset.isValid);
    EXPECT_EQ(temp.file("standardized").getNumberOfChildFiles(juce::File::findFiles), 0);
}
