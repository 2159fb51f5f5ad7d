#pragma once
#include <juce_core/juce_core.h>
#include "BeatSyncTypes.h"
#include "FFmpegExecutor.h"
#include "TimelineAssembler.h"

/**
 * Turns one (clip, target duration) pair into a conformant segment of exactly
 * that duration.
 *
 * Clips at least as long as the target are trimmed to [0, target). Shorter
 * clips are extended once with a "boomerang": the whole clip forward, then the
 * same clip reversed (video and audio), joined and trimmed to the target.
 * Only one doubling pass is made; a clip shorter than half the target
 * under-runs and the report says so.
 */
class SegmentRenderer
{
public:
    /**
     * Creates a new SegmentRenderer.
     * @param ffmpegExecutor    The executor used for every transcode
     * @param timelineAssembler Used to join the forward and reversed halves
     */
    SegmentRenderer(FFmpegExecutor* ffmpegExecutor, TimelineAssembler* timelineAssembler);
    ~SegmentRenderer();

    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /** Called with a warning when a segment comes out shorter than requested. */
    void setWarningCallback(std::function<void(const juce::String&)> warningCallback);

    void setEncodeSpec(const BeatSyncTypes::EncodeSpec& spec);

    /** When set, an under-running segment fails the render instead of only being reported. */
    void setFailOnUnderrun(bool shouldFail);

    /**
     * Renders the segment for one interval.
     * @param asset           The assigned source clip
     * @param targetDuration  Required duration in seconds
     * @param segmentIndex    Interval index, used for file names
     * @param workDirectory   Where the segment and any intermediates are written
     * @param reportOut       Filled in on success
     * @return                ok, or the first failing transcode step
     */
    juce::Result renderSegment(const BeatSyncTypes::MediaAsset& asset,
                               double targetDuration,
                               int segmentIndex,
                               const juce::File& workDirectory,
                               BeatSyncTypes::SegmentReport& reportOut);

    /**
     * ffmpeg arguments that re-encode input to the target spec.
     * @param startSeconds   Input position to start from
     * @param durationLimit  Seconds to keep from there, or a negative value for all of it
     * @param videoFilter    Optional -vf chain (e.g. "reverse")
     * @param audioFilter    Optional -af chain (e.g. "areverse")
     * When the input has no audio, a silent track is generated so every segment
     * carries the same streams.
     */
    static juce::StringArray buildConformArgs(const juce::File& input,
                                              bool inputHasAudio,
                                              double startSeconds,
                                              double durationLimit,
                                              const juce::File& output,
                                              const BeatSyncTypes::EncodeSpec& spec,
                                              const juce::String& videoFilter = {},
                                              const juce::String& audioFilter = {});

private:
    juce::Result renderTrimmed(const BeatSyncTypes::MediaAsset& asset, double targetDuration, const juce::File& outputFile);
    juce::Result renderExtended(const BeatSyncTypes::MediaAsset& asset, double targetDuration, int segmentIndex,
                                const juce::File& workDirectory, const juce::File& outputFile);

    FFmpegExecutor* ffmpegExecutor;
    TimelineAssembler* timelineAssembler;

    BeatSyncTypes::EncodeSpec spec;
    bool failOnUnderrun = false;

    std::function<void(const juce::String&)> logCallback;
    std::function<void(const juce::String&)> warningCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SegmentRenderer)
};
