#pragma once
#include <juce_core/juce_core.h>
#include "BeatSyncTypes.h"
#include "FFmpegExecutor.h"

/**
 * Inspects media files with ffprobe and decides whether an asset already
 * conforms to the target encode, transcoding a standardized copy when it doesn't.
 */
class AssetProber
{
public:
    /** What ffprobe told us about a file. */
    struct Metadata
    {
        double durationSeconds = 0.0;
        int width = 0;
        int height = 0;
        FrameRate frameRate;
        juce::String videoCodec;
        bool hasAudio = false;
        juce::String audioCodec;
    };

    explicit AssetProber(FFmpegExecutor* ffmpegExecutor);
    ~AssetProber();

    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * Probes a file.
     * @param file        The media file to inspect
     * @param metadataOut Filled in on success
     * @return            ok, or a failure naming why the file is unusable
     */
    juce::Result probe(const juce::File& file, Metadata& metadataOut);

    /**
     * Parses the JSON printed by "ffprobe -print_format json -show_format -show_streams".
     * Fails when the text is not JSON or has no video stream.
     */
    static juce::Result parseProbeOutput(const juce::String& jsonText, Metadata& metadataOut);

    /** True when any of size, frame rate, video codec or (present) audio codec differs from the spec. */
    static bool needsReencode(const Metadata& metadata, const BeatSyncTypes::EncodeSpec& spec);

    /**
     * Validates one asset in place: probes it, transcodes a standardized copy
     * into standardizedDirectory when it doesn't conform, and re-probes the copy.
     * Problems are recorded on the asset (isValid / validationError), never thrown.
     *
     * @param statusCallback Receives "Standardizing ..." when a transcode starts
     */
    void validateAsset(BeatSyncTypes::MediaAsset& asset,
                       const BeatSyncTypes::EncodeSpec& spec,
                       const juce::File& standardizedDirectory,
                       const std::function<void(const juce::String&)>& statusCallback = nullptr);

    /** ffmpeg arguments that transcode input to a standardized copy at output. */
    static juce::StringArray buildStandardizeArgs(const juce::File& input,
                                                  const juce::File& output,
                                                  const BeatSyncTypes::EncodeSpec& spec);

private:
    FFmpegExecutor* ffmpegExecutor;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AssetProber)
};
