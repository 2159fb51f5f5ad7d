#include "AssetProber.h"

namespace
{
    double parseSeconds(const juce::var& value)
    {
        // ffprobe prints durations as strings ("12.345000"); "N/A" means unknown.
        if (value.isString())
        {
            const auto text = value.toString().trim();
            if (text.isEmpty() || ! text.containsOnly("0123456789.eE+-"))
                return 0.0;
            return text.getDoubleValue();
        }

        if (value.isDouble() || value.isInt() || value.isInt64())
            return (double) value;

        return 0.0;
    }
}

AssetProber::AssetProber(FFmpegExecutor* executor)
    : ffmpegExecutor(executor)
{
}

AssetProber::~AssetProber()
{
}

void AssetProber::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

juce::Result AssetProber::probe(const juce::File& file, Metadata& metadataOut)
{
    if (! file.existsAsFile())
        return juce::Result::fail("File not found");

    juce::StringArray args;
    args.add("-v");
    args.add("error");
    args.add("-print_format");
    args.add("json");
    args.add("-show_format");
    args.add("-show_streams");
    args.add(file.getFullPathName());

    const CommandResult result = ffmpegExecutor->runFFprobe(args);

    if (! result.started)
        return juce::Result::fail("Could not run ffprobe");

    if (result.exitCode != 0)
        return juce::Result::fail("ffprobe could not read the file (exit code " + juce::String(result.exitCode) + ")");

    return parseProbeOutput(result.output, metadataOut);
}

juce::Result AssetProber::parseProbeOutput(const juce::String& jsonText, Metadata& metadataOut)
{
    juce::var parsed;
    const juce::Result parseResult = juce::JSON::parse(jsonText, parsed);
    if (parseResult.failed() || ! parsed.isObject())
        return juce::Result::fail("Unreadable ffprobe output");

    Metadata metadata;
    bool foundVideo = false;
    double videoStreamDuration = 0.0;

    if (const auto* streams = parsed["streams"].getArray())
    {
        for (const auto& stream : *streams)
        {
            const juce::String codecType = stream["codec_type"].toString();

            if (codecType == "video" && ! foundVideo)
            {
                // Cover art is reported as a video stream with a single frame; skip it.
                const auto* disposition = stream["disposition"].getDynamicObject();
                if (disposition != nullptr && (int) disposition->getProperty("attached_pic") == 1)
                    continue;

                foundVideo = true;
                metadata.width = (int) stream["width"];
                metadata.height = (int) stream["height"];
                metadata.frameRate = FrameRate::fromString(stream["r_frame_rate"].toString());
                metadata.videoCodec = stream["codec_name"].toString();
                videoStreamDuration = parseSeconds(stream["duration"]);
            }
            else if (codecType == "audio" && ! metadata.hasAudio)
            {
                metadata.hasAudio = true;
                metadata.audioCodec = stream["codec_name"].toString();
            }
        }
    }

    if (! foundVideo)
        return juce::Result::fail("No video stream found");

    metadata.durationSeconds = parseSeconds(parsed["format"]["duration"]);
    if (metadata.durationSeconds <= 0.0)
        metadata.durationSeconds = videoStreamDuration;

    metadataOut = metadata;
    return juce::Result::ok();
}

bool AssetProber::needsReencode(const Metadata& metadata, const BeatSyncTypes::EncodeSpec& spec)
{
    return metadata.width != spec.width
        || metadata.height != spec.height
        || metadata.frameRate != spec.frameRate
        || metadata.videoCodec != spec.videoCodec
        || (metadata.hasAudio && metadata.audioCodec != spec.audioCodec);
}

juce::StringArray AssetProber::buildStandardizeArgs(const juce::File& input,
                                                    const juce::File& output,
                                                    const BeatSyncTypes::EncodeSpec& spec)
{
    juce::StringArray args;
    args.add("-i");
    args.add(input.getFullPathName());
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
    args.add(output.getFullPathName());
    args.removeEmptyStrings();
    return args;
}

void AssetProber::validateAsset(BeatSyncTypes::MediaAsset& asset,
                                const BeatSyncTypes::EncodeSpec& spec,
                                const juce::File& standardizedDirectory,
                                const std::function<void(const juce::String&)>& statusCallback)
{
    asset.isValid = false;
    asset.validationError.clear();
    asset.durationSeconds = 0.0;

    Metadata metadata;
    juce::Result result = probe(asset.storagePath, metadata);

    if (result.failed())
    {
        asset.validationError = result.getErrorMessage();
        if (logCallback)
            logCallback("Asset " + asset.originalName + " is invalid: " + asset.validationError);
        return;
    }

    if (needsReencode(metadata, spec))
    {
        if (statusCallback)
            statusCallback("Standardizing " + asset.originalName);

        if (! standardizedDirectory.isDirectory())
        {
            const auto created = standardizedDirectory.createDirectory();
            if (created.failed())
            {
                asset.validationError = "Cannot create standardized directory: " + created.getErrorMessage();
                return;
            }
        }

        const juce::File standardized = standardizedDirectory.getChildFile("standardized_" + juce::Uuid().toString() + ".mp4");

        result = ffmpegExecutor->runFFmpeg(buildStandardizeArgs(asset.storagePath, standardized, spec),
                                           "standardizing " + asset.originalName);

        if (result.failed())
        {
            standardized.deleteFile();
            asset.validationError = result.getErrorMessage();
            return;
        }

        Metadata standardizedMetadata;
        result = probe(standardized, standardizedMetadata);
        if (result.failed())
        {
            standardized.deleteFile();
            asset.validationError = "Standardized copy is unreadable: " + result.getErrorMessage();
            return;
        }

        if (logCallback)
            logCallback("Standardized " + asset.originalName + " -> " + standardized.getFileName());

        asset.storagePath = standardized;
        metadata = standardizedMetadata;
    }

    if (metadata.durationSeconds <= 0.0)
    {
        asset.validationError = "Unknown duration";
        return;
    }

    asset.durationSeconds = metadata.durationSeconds;
    asset.hasAudio = metadata.hasAudio;
    asset.isValid = true;
}
