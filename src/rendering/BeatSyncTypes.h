#pragma once
#include <juce_core/juce_core.h>
#include "FrameRate.h"

/**
 * Common types used across the beat-sync pipeline.
 * These types are shared by multiple components to ensure consistency.
 */
namespace BeatSyncTypes
{
    /** An uploaded source video and what the prober learned about it. */
    struct MediaAsset
    {
        juce::String id;
        juce::String originalName;
        juce::File storagePath;
        double durationSeconds = 0.0;
        bool hasAudio = false;
        bool isValid = false;
        juce::String validationError;
    };

    /** The encode every rendered segment must conform to. */
    struct EncodeSpec
    {
        int width = 1920;
        int height = 1088;
        FrameRate frameRate { 24, 1 };
        juce::String videoCodec = "h264";       // codec name as ffprobe reports it
        juce::String videoEncoder = "libx264";  // encoder name passed to ffmpeg
        juce::String videoEncoderArgs = "-crf 0";
        juce::String audioCodec = "aac";
        juce::String audioEncoder = "aac";
        int audioSampleRate = 48000;
        int audioChannels = 2;
        juce::String audioBitrate = "140k";
        juce::String deliveryAudioBitrate = "192k";

        juce::String sizeString() const { return juce::String(width) + "x" + juce::String(height); }
    };

    /** One required output duration, derived from two consecutive beats or the tail default. */
    struct Interval
    {
        int index = 0;
        double durationSeconds = 0.0;
        bool isTail = false;
    };

    /** interval_index -> asset_id. */
    struct Assignment
    {
        int intervalIndex = 0;
        juce::String assetId;
    };

    /** What the renderer produced for one interval. */
    struct SegmentReport
    {
        juce::File file;
        double requestedSeconds = 0.0;
        double renderedSeconds = 0.0;
        bool extended = false;   // boomerang path was used
        bool underrun = false;   // one doubling pass was not enough
    };

    /** Where a session's pipeline currently is. */
    enum class SessionState
    {
        Idle,
        Validating,
        Assigning,
        Rendering,
        Concatenating,
        Muxing,
        Completed,
        Failed
    };

    enum class ProgressPhase
    {
        Validation,
        Trim,
        Concat,
        Mux,
        Done
    };

    /** A value snapshot emitted on the status channel and then discarded. */
    struct ProgressEvent
    {
        ProgressPhase phase = ProgressPhase::Validation;
        double percent = 0.0;
        double elapsedSeconds = 0.0;
        double etaSeconds = 0.0;
        double overallPercent = 0.0;
        double overallElapsedSeconds = 0.0;
    };

    /** Everything a processing session needs, resolved to files on disk. */
    struct SessionRequest
    {
        juce::File audioFile;
        std::vector<MediaAsset> assets;
        std::vector<double> beats;
        bool randomized = false;
        juce::String resolution;
    };

    /** Terminal outcome of a session, as surfaced to the caller. */
    struct PipelineResult
    {
        juce::Result result { juce::Result::ok() };
        int statusCode = 200;
        juce::String sessionId;
        juce::File outputFile;
        std::vector<Interval> intervals;
        std::vector<Assignment> assignments;
        std::vector<SegmentReport> segments;
        std::vector<MediaAsset> assets;
    };

    /** Wire name of the phase ("validation" or "processing"). */
    inline juce::String phaseName(ProgressPhase phase)
    {
        return phase == ProgressPhase::Validation ? "validation" : "processing";
    }

    /** Finer-grained stage name within the processing phase. */
    inline juce::String stageName(ProgressPhase phase)
    {
        switch (phase)
        {
            case ProgressPhase::Validation: return "validation";
            case ProgressPhase::Trim:       return "trim";
            case ProgressPhase::Concat:     return "concat";
            case ProgressPhase::Mux:        return "mux";
            case ProgressPhase::Done:       return "done";
        }

        return {};
    }
}
