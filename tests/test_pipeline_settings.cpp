#include "core/PipelineSettings.h"
#include "support/TestSupport.h"

#include <gtest/gtest.h>

using beatcut_test::TempDirectory;

// Test defaults match the stock encode
TEST(PipelineSettingsTest, Defaults)
{
    PipelineSettings settings;

    EXPECT_TRUE(settings.validate().wasOk());
    EXPECT_EQ(settings.resolution, "1080p");
    EXPECT_EQ(settings.frameRate, FrameRate(24, 1));
    EXPECT_DOUBLE_EQ(settings.tailDurationSeconds, 2.0);
    EXPECT_FALSE(settings.failOnUnderrun);
    EXPECT_GE(settings.maxConcurrentSessions, 1);

    const auto spec = settings.makeEncodeSpec();
    EXPECT_EQ(spec.sizeString(), "1920x1088");
    EXPECT_EQ(spec.videoEncoder, "libx264");
    EXPECT_EQ(spec.audioBitrate, "140k");
    EXPECT_EQ(spec.deliveryAudioBitrate, "192k");
}

// Test resolution presets
TEST(PipelineSettingsTest, ResolutionPresets)
{
    PipelineSettings settings;
    EXPECT_EQ(settings.makeEncodeSpec("720p").sizeString(), "1280x720");
    EXPECT_EQ(settings.makeEncodeSpec("1080p").sizeString(), "1920x1088");
    EXPECT_EQ(settings.makeEncodeSpec("4k").sizeString(), "1920x1088");

    settings.resolution = "720p";
    EXPECT_EQ(settings.makeEncodeSpec().sizeString(), "1280x720");
}

// Test a partial JSON file overrides only what it names
TEST(PipelineSettingsTest, LoadsPartialJson)
{
    TempDirectory temp;
    const auto file = temp.file("settings.json");
    file.replaceWithText(R"({
        "resolution": "720p",
        "frameRate": "30000/1001",
        "workspaceRoot": "work",
        "outputDirectory": "/abs/out",
        "failOnUnderrun": true,
        "maxConcurrentSessions": 3,
        "progress": { "processingSecondsPerSegment": 4.5 },
        "somethingUnknown": 12
    })");

    PipelineSettings settings;
    const auto result = settings.loadFromFile(file);

    ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
    EXPECT_EQ(settings.resolution, "720p");
    EXPECT_EQ(settings.frameRate, FrameRate(30000, 1001));
    EXPECT_EQ(settings.workspaceRoot, temp.file("work"));
    EXPECT_EQ(settings.outputDirectory, juce::File("/abs/out"));
    EXPECT_TRUE(settings.failOnUnderrun);
    EXPECT_EQ(settings.maxConcurrentSessions, 3);
    EXPECT_DOUBLE_EQ(settings.progress.processingSecondsPerSegment, 4.5);
    EXPECT_DOUBLE_EQ(settings.progress.validationSecondsPerAsset, 5.0);
    EXPECT_EQ(settings.audioCodec, "aac");
}

// Test bad settings are reported, not silently accepted
TEST(PipelineSettingsTest, RejectsBadSettings)
{
    const juce::File base = juce::File::getCurrentWorkingDirectory();

    PipelineSettings a;
    EXPECT_TRUE(a.loadFromJson("{ not json", base).failed());

    PipelineSettings b;
    EXPECT_TRUE(b.loadFromJson("[1, 2]", base).failed());

    PipelineSettings c;
    EXPECT_TRUE(c.loadFromJson(R"({ "frameRate": "30/0" })", base).failed());

    PipelineSettings d;
    EXPECT_TRUE(d.loadFromJson(R"({ "maxConcurrentSessions": 0 })", base).failed());

    PipelineSettings e;
    EXPECT_TRUE(e.loadFromJson(R"({ "progress": { "validationEnd": 95, "trimEnd": 90 } })", base).failed());

    PipelineSettings f;
    EXPECT_TRUE(f.loadFromFile(base.getChildFile("definitely_missing_settings.json")).failed());
}

// Test a decimal frame rate, as a string or a JSON number, is accepted
TEST(PipelineSettingsTest, AcceptsDecimalFrameRate)
{
    const juce::File base = juce::File::getCurrentWorkingDirectory();

    PipelineSettings quoted;
    ASSERT_TRUE(quoted.loadFromJson(R"({ "frameRate": "23.976" })", base).wasOk());
    EXPECT_EQ(quoted.frameRate, FrameRate(24000, 1001));

    PipelineSettings number;
    ASSERT_TRUE(number.loadFromJson(R"({ "frameRate": 29.97 })", base).wasOk());
    EXPECT_EQ(number.frameRate, FrameRate(30000, 1001));
}

// Test the effective settings serialise back to JSON
TEST(PipelineSettingsTest, ToVar)
{
    PipelineSettings settings;
    settings.frameRate = FrameRate(25, 1);

    const auto v = settings.toVar();
    EXPECT_EQ(v["frameRate"].toString(), "25");
    EXPECT_EQ(v["resolution"].toString(), "1080p");
    EXPECT_DOUBLE_EQ((double) v["progress"]["trimEnd"], 90.0);
}
