#pragma once
#include <juce_core/juce_core.h>
#include "BeatSyncTypes.h"
#include "AssetProber.h"
#include "FFmpegExecutor.h"
#include "ProgressReporter.h"

/**
 * Cuts source videos into back-to-back clips of one fixed length, each
 * re-encoded to the target spec. Whatever is left over after the last whole
 * clip is discarded.
 */
class ClipSplitter
{
public:
    /** One produced clip. */
    struct Clip
    {
        juce::File file;
        juce::String originalName;
        int assetIndex = 0;
        int clipIndex = 0;
        double startSeconds = 0.0;
    };

    ClipSplitter(FFmpegExecutor* ffmpegExecutor, AssetProber* assetProber);
    ~ClipSplitter();

    void setLogCallback(std::function<void(const juce::String&)> logCallback);
    void setStatusCallback(std::function<void(const juce::String&)> statusCallback);
    void setEncodeSpec(const BeatSyncTypes::EncodeSpec& spec);

    /**
     * Splits every asset into clip_<assetIndex>_<j>.mp4 files in outputDirectory.
     * Assets are probed first so the total clip count is known for progress;
     * a probe failure or a failed cut stops the run.
     *
     * @param progress Optional; receives one trim-phase unit per clip
     */
    juce::Result split(const std::vector<BeatSyncTypes::MediaAsset>& assets,
                       double clipDurationSeconds,
                       const juce::File& outputDirectory,
                       std::vector<Clip>& clipsOut,
                       ProgressReporter* progress = nullptr);

    /** floor(duration / clipDuration), or 0 when either is not positive. */
    static int countClips(double durationSeconds, double clipDurationSeconds);

private:
    FFmpegExecutor* ffmpegExecutor;
    AssetProber* assetProber;
    BeatSyncTypes::EncodeSpec spec;

    std::function<void(const juce::String&)> logCallback;
    std::function<void(const juce::String&)> statusCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ClipSplitter)
};
