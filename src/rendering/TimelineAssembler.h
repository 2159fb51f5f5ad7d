#pragma once
#include <juce_core/juce_core.h>
#include "BeatSyncTypes.h"
#include "FFmpegExecutor.h"

/**
 * Joins rendered segments into one timeline and lays the soundtrack under it.
 *
 * Segments are expected to share codec, resolution and frame rate already, so
 * concatenation is a stream copy through ffmpeg's concat demuxer.
 */
class TimelineAssembler
{
public:
    /**
     * Creates a new TimelineAssembler.
     * @param executor The FFmpeg executor to use for timeline assembly
     */
    explicit TimelineAssembler(FFmpegExecutor* executor);
    ~TimelineAssembler();

    /**
     * Sets a callback for receiving log messages.
     * @param callback Function called with log messages
     */
    void setLogCallback(std::function<void(const juce::String&)> callback);

    void setEncodeSpec(const BeatSyncTypes::EncodeSpec& spec);

    /**
     * Concatenates segments, in the given order, without re-encoding.
     * Timestamps are regenerated so the joined file plays continuously.
     * @param segments    Segment files in timeline order
     * @param outputFile  The file to save the joined timeline to
     * @param description Label used in logs and errors
     * @return            ok, or the reason the concat failed
     */
    juce::Result concatenateSegments(const std::vector<juce::File>& segments,
                                     const juce::File& outputFile,
                                     const juce::String& description = "concatenating segments");

    /**
     * Replaces the audio of a video with the soundtrack.
     * The video stream is copied, the audio is encoded to the delivery bitrate
     * and the output ends with whichever input ends first.
     */
    juce::Result muxAudio(const juce::File& videoFile, const juce::File& audioFile, const juce::File& outputFile);

    /** Contents of a concat demuxer list: one "file '<path>'" line per entry. */
    static juce::String buildConcatList(const std::vector<juce::File>& segments);

    /** Quotes a path for a concat list line, escaping embedded single quotes. */
    static juce::String quoteConcatPath(const juce::File& file);

    static juce::StringArray buildConcatArgs(const juce::File& listFile, const juce::File& outputFile);

    static juce::StringArray buildMuxArgs(const juce::File& videoFile,
                                          const juce::File& audioFile,
                                          const juce::File& outputFile,
                                          const BeatSyncTypes::EncodeSpec& spec);

private:
    FFmpegExecutor* ffmpegExecutor;
    BeatSyncTypes::EncodeSpec spec;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TimelineAssembler)
};
