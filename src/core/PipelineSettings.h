#pragma once
#include <juce_core/juce_core.h>
#include "../rendering/BeatSyncTypes.h"
#include "../rendering/ProgressReporter.h"

/**
 * Application-wide settings for the beat-sync pipeline.
 *
 * Defaults are usable as-is. A JSON settings file may override any subset of
 * them; keys it doesn't mention keep their defaults and unknown keys are
 * ignored. Relative paths in the file resolve against the file's directory.
 */
struct PipelineSettings
{
    PipelineSettings();

    //==========================================================================
    // External tools (empty = next to the executable, else PATH)
    juce::String ffmpegPath;
    juce::String ffprobePath;

    //==========================================================================
    // Locations
    juce::File workspaceRoot;
    juce::File outputDirectory;
    juce::File standardizedDirectory;
    juce::File logDirectory;

    //==========================================================================
    // Target encode
    juce::String resolution = "1080p";
    FrameRate frameRate { 24, 1 };
    juce::String videoCodec = "h264";
    juce::String videoEncoder = "libx264";
    juce::String videoEncoderArgs = "-crf 0";
    juce::String audioCodec = "aac";
    juce::String audioEncoder = "aac";
    int audioSampleRate = 48000;
    int audioChannels = 2;
    juce::String audioBitrate = "140k";
    juce::String deliveryAudioBitrate = "192k";

    //==========================================================================
    // Pipeline policy
    double tailDurationSeconds = 2.0;
    bool failOnUnderrun = false;
    int maxConcurrentSessions = 1;
    ProgressPlan progress;

    //==========================================================================
    /** The encode spec for a resolution preset; an empty preset means the configured one. */
    BeatSyncTypes::EncodeSpec makeEncodeSpec(const juce::String& resolutionPreset = {}) const;

    /** "720p" is 1280x720; anything else is 1920x1088. */
    static void getResolutionSize(const juce::String& resolutionPreset, int& width, int& height);

    /** Overrides fields from a settings file. */
    juce::Result loadFromFile(const juce::File& settingsFile);

    /** Overrides fields from JSON text; relative paths resolve against baseDirectory. */
    juce::Result loadFromJson(const juce::String& jsonText, const juce::File& baseDirectory);

    /** Checks cross-field constraints (positive rates, valid frame rate, ...). */
    juce::Result validate() const;

    /** The effective settings as a JSON object, as written to the application log. */
    juce::var toVar() const;
};
