#include "TimelineAssembler.h"

TimelineAssembler::TimelineAssembler(FFmpegExecutor* executor)
    : ffmpegExecutor(executor)
{
}

TimelineAssembler::~TimelineAssembler()
{
}

void TimelineAssembler::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

void TimelineAssembler::setEncodeSpec(const BeatSyncTypes::EncodeSpec& newSpec)
{
    spec = newSpec;
}

juce::String TimelineAssembler::quoteConcatPath(const juce::File& file)
{
    // Inside single quotes the concat demuxer only understands '\'' for a literal quote.
    const juce::String path = file.getFullPathName().replace("\\", "/");
    return "'" + path.replace("'", "'\\''") + "'";
}

juce::String TimelineAssembler::buildConcatList(const std::vector<juce::File>& segments)
{
    juce::String list;
    for (const auto& segment : segments)
        list << "file " << quoteConcatPath(segment) << "\n";
    return list;
}

juce::StringArray TimelineAssembler::buildConcatArgs(const juce::File& listFile, const juce::File& outputFile)
{
    juce::StringArray args;
    args.add("-f");
    args.add("concat");
    args.add("-safe");
    args.add("0");
    args.add("-fflags");
    args.add("+genpts");
    args.add("-i");
    args.add(listFile.getFullPathName());
    args.add("-c");
    args.add("copy");
    args.add(outputFile.getFullPathName());
    return args;
}

juce::StringArray TimelineAssembler::buildMuxArgs(const juce::File& videoFile,
                                                  const juce::File& audioFile,
                                                  const juce::File& outputFile,
                                                  const BeatSyncTypes::EncodeSpec& spec)
{
    juce::StringArray args;
    args.add("-i");
    args.add(videoFile.getFullPathName());
    args.add("-i");
    args.add(audioFile.getFullPathName());
    args.add("-map");
    args.add("0:v:0");
    args.add("-map");
    args.add("1:a:0");
    args.add("-c:v");
    args.add("copy");
    args.add("-c:a");
    args.add(spec.audioEncoder);
    args.add("-b:a");
    args.add(spec.deliveryAudioBitrate);
    args.add("-shortest");
    args.add(outputFile.getFullPathName());
    return args;
}

juce::Result TimelineAssembler::concatenateSegments(const std::vector<juce::File>& segments,
                                                    const juce::File& outputFile,
                                                    const juce::String& description)
{
    if (segments.empty())
        return juce::Result::fail("No segments to concatenate");

    for (const auto& segment : segments)
    {
        if (! segment.existsAsFile())
        {
            if (logCallback) logCallback("ERROR: Missing segment for concatenation: " + segment.getFullPathName());
            return juce::Result::fail("Missing segment " + segment.getFileName());
        }
    }

    if (logCallback) logCallback("Concatenating " + juce::String((int) segments.size()) + " file(s) into " + outputFile.getFileName());

    const juce::File listFile = outputFile.getParentDirectory()
                                          .getChildFile("concat_" + outputFile.getFileNameWithoutExtension() + ".txt");

    if (! listFile.replaceWithText(buildConcatList(segments), false, false, "\n"))
    {
        if (logCallback) logCallback("ERROR: Failed to create concat file " + listFile.getFullPathName());
        return juce::Result::fail("Could not write concat list " + listFile.getFileName());
    }

    const juce::Result result = ffmpegExecutor->runFFmpeg(buildConcatArgs(listFile, outputFile), description);

    // Clean up the temporary concat list file
    listFile.deleteFile();

    if (result.failed())
    {
        outputFile.deleteFile();
        return result;
    }

    if (logCallback) logCallback("Successfully concatenated: " + outputFile.getFileName());
    return juce::Result::ok();
}

juce::Result TimelineAssembler::muxAudio(const juce::File& videoFile, const juce::File& audioFile, const juce::File& outputFile)
{
    if (! videoFile.existsAsFile())
        return juce::Result::fail("Video track missing: " + videoFile.getFileName());

    if (! audioFile.existsAsFile())
        return juce::Result::fail("Audio file not found: " + audioFile.getFileName());

    if (logCallback) logCallback("Muxing " + audioFile.getFileName() + " under " + videoFile.getFileName());

    const juce::Result result = ffmpegExecutor->runFFmpeg(buildMuxArgs(videoFile, audioFile, outputFile, spec),
                                                          "muxing audio");
    if (result.failed())
    {
        outputFile.deleteFile();
        return result;
    }

    if (logCallback) logCallback("Output written to " + outputFile.getFullPathName());
    return juce::Result::ok();
}
