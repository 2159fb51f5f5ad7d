#include "SegmentRenderer.h"

namespace
{
    juce::String formatSeconds(double seconds)
    {
        return juce::String(seconds, 6);
    }

    void deleteIntermediates(std::initializer_list<juce::File> files)
    {
        for (const auto& file : files)
            if (file.existsAsFile())
                file.deleteFile();
    }
}

SegmentRenderer::SegmentRenderer(FFmpegExecutor* executor, TimelineAssembler* assembler)
    : ffmpegExecutor(executor),
      timelineAssembler(assembler)
{
}

SegmentRenderer::~SegmentRenderer()
{
}

void SegmentRenderer::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

void SegmentRenderer::setWarningCallback(std::function<void(const juce::String&)> callback)
{
    warningCallback = std::move(callback);
}

void SegmentRenderer::setEncodeSpec(const BeatSyncTypes::EncodeSpec& newSpec)
{
    spec = newSpec;
}

void SegmentRenderer::setFailOnUnderrun(bool shouldFail)
{
    failOnUnderrun = shouldFail;
}

juce::StringArray SegmentRenderer::buildConformArgs(const juce::File& input,
                                                    bool inputHasAudio,
                                                    double startSeconds,
                                                    double durationLimit,
                                                    const juce::File& output,
                                                    const BeatSyncTypes::EncodeSpec& spec,
                                                    const juce::String& videoFilter,
                                                    const juce::String& audioFilter)
{
    juce::StringArray args;
    args.add("-fflags");
    args.add("+genpts");
    args.add("-ss");
    args.add(startSeconds > 0.0 ? formatSeconds(startSeconds) : juce::String("0"));
    args.add("-i");
    args.add(input.getFullPathName());

    if (! inputHasAudio)
    {
        args.add("-f");
        args.add("lavfi");
        args.add("-i");
        args.add("anullsrc=channel_layout=" + juce::String(spec.audioChannels == 1 ? "mono" : "stereo")
                 + ":sample_rate=" + juce::String(spec.audioSampleRate));
    }

    if (durationLimit >= 0.0)
    {
        args.add("-t");
        args.add(formatSeconds(durationLimit));
    }

    if (videoFilter.isNotEmpty())
    {
        args.add("-vf");
        args.add(videoFilter);
    }

    // A generated silent track has nothing worth filtering.
    if (audioFilter.isNotEmpty() && inputHasAudio)
    {
        args.add("-af");
        args.add(audioFilter);
    }

    args.add("-map");
    args.add("0:v:0");
    args.add("-map");
    args.add(inputHasAudio ? "0:a:0" : "1:a:0");

    args.add("-c:v");
    args.add(spec.videoEncoder);
    args.addTokens(spec.videoEncoderArgs, " ", "\"'");
    args.add("-r");
    args.add(spec.frameRate.toString());
    args.add("-s");
    args.add(spec.sizeString());
    args.add("-pix_fmt");
    args.add("yuv420p");

    args.add("-c:a");
    args.add(spec.audioEncoder);
    args.add("-ar");
    args.add(juce::String(spec.audioSampleRate));
    args.add("-ac");
    args.add(juce::String(spec.audioChannels));
    args.add("-b:a");
    args.add(spec.audioBitrate);

    args.add("-avoid_negative_ts");
    args.add("make_zero");

    if (! inputHasAudio)
        args.add("-shortest");

    args.add(output.getFullPathName());
    args.removeEmptyStrings();
    return args;
}

juce::Result SegmentRenderer::renderSegment(const BeatSyncTypes::MediaAsset& asset,
                                            double targetDuration,
                                            int segmentIndex,
                                            const juce::File& workDirectory,
                                            BeatSyncTypes::SegmentReport& reportOut)
{
    if (targetDuration <= 0.0)
        return juce::Result::fail("Segment " + juce::String(segmentIndex) + " has no duration");

    if (! asset.isValid || ! asset.storagePath.existsAsFile())
        return juce::Result::fail("Source clip for segment " + juce::String(segmentIndex) + " is not usable: " + asset.originalName);

    const juce::File outputFile = workDirectory.getChildFile(juce::String::formatted("segment_%03d.mp4", segmentIndex));

    BeatSyncTypes::SegmentReport report;
    report.file = outputFile;
    report.requestedSeconds = targetDuration;

    juce::Result result = juce::Result::ok();

    if (asset.durationSeconds >= targetDuration)
    {
        if (logCallback) logCallback("Segment " + juce::String(segmentIndex) + ": trimming " + asset.originalName
                                     + " to " + juce::String(targetDuration, 3) + "s");

        result = renderTrimmed(asset, targetDuration, outputFile);
        report.renderedSeconds = targetDuration;
    }
    else
    {
        const double doubledDuration = asset.durationSeconds * 2.0;
        report.extended = true;
        report.underrun = doubledDuration < targetDuration;
        report.renderedSeconds = juce::jmin(targetDuration, doubledDuration);

        if (report.underrun)
        {
            const juce::String message = "Clip " + asset.originalName + " (" + juce::String(asset.durationSeconds, 3)
                                       + "s) cannot fill segment " + juce::String(segmentIndex) + " ("
                                       + juce::String(targetDuration, 3) + "s) even when extended; segment will be "
                                       + juce::String(report.renderedSeconds, 3) + "s";

            if (failOnUnderrun)
                return juce::Result::fail(message);

            if (logCallback) logCallback("WARNING: " + message);
            if (warningCallback) warningCallback(message);
        }

        if (logCallback) logCallback("Segment " + juce::String(segmentIndex) + ": extending " + asset.originalName
                                     + " (" + juce::String(asset.durationSeconds, 3) + "s) to "
                                     + juce::String(targetDuration, 3) + "s");

        result = renderExtended(asset, targetDuration, segmentIndex, workDirectory, outputFile);
    }

    if (result.failed())
    {
        outputFile.deleteFile();
        return result;
    }

    if (! outputFile.existsAsFile() || outputFile.getSize() == 0)
    {
        outputFile.deleteFile();
        return juce::Result::fail("Segment " + juce::String(segmentIndex) + " was not written");
    }

    reportOut = report;
    return juce::Result::ok();
}

juce::Result SegmentRenderer::renderTrimmed(const BeatSyncTypes::MediaAsset& asset,
                                            double targetDuration,
                                            const juce::File& outputFile)
{
    return ffmpegExecutor->runFFmpeg(buildConformArgs(asset.storagePath, asset.hasAudio, 0.0, targetDuration, outputFile, spec),
                                     "trimming " + outputFile.getFileNameWithoutExtension());
}

juce::Result SegmentRenderer::renderExtended(const BeatSyncTypes::MediaAsset& asset,
                                             double targetDuration,
                                             int segmentIndex,
                                             const juce::File& workDirectory,
                                             const juce::File& outputFile)
{
    const juce::String stem = outputFile.getFileNameWithoutExtension();
    const juce::File forwardFile = workDirectory.getChildFile(stem + "_forward.mp4");
    const juce::File reverseFile = workDirectory.getChildFile(stem + "_reverse.mp4");
    const juce::File doubledFile = workDirectory.getChildFile(stem + "_doubled.mp4");

    // 1. Whole clip, conformed. From here on the intermediate always has audio.
    juce::Result result = ffmpegExecutor->runFFmpeg(buildConformArgs(asset.storagePath, asset.hasAudio, 0.0, -1.0, forwardFile, spec),
                                                    "boomerang forward pass for segment " + juce::String(segmentIndex));

    // 2. The same clip played backwards, picture and sound.
    if (result.wasOk())
        result = ffmpegExecutor->runFFmpeg(buildConformArgs(forwardFile, true, 0.0, -1.0, reverseFile, spec, "reverse", "areverse"),
                                           "boomerang reverse pass for segment " + juce::String(segmentIndex));

    // 3. forward + reverse
    if (result.wasOk())
        result = timelineAssembler->concatenateSegments({ forwardFile, reverseFile }, doubledFile,
                                                        "joining boomerang for segment " + juce::String(segmentIndex));

    // 4. Cut to the interval.
    if (result.wasOk())
        result = ffmpegExecutor->runFFmpeg(buildConformArgs(doubledFile, true, 0.0, targetDuration, outputFile, spec),
                                           "trimming " + stem);

    deleteIntermediates({ forwardFile, reverseFile, doubledFile });

    return result;
}
