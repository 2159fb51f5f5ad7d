#include "PipelineSettings.h"

namespace
{
    void readString(const juce::var& object, const juce::Identifier& key, juce::String& target)
    {
        if (object.hasProperty(key))
            target = object[key].toString();
    }

    void readFile(const juce::var& object, const juce::Identifier& key, const juce::File& baseDirectory, juce::File& target)
    {
        if (object.hasProperty(key))
        {
            const auto path = object[key].toString().trim();
            if (path.isNotEmpty())
                target = baseDirectory.getChildFile(path);
        }
    }

    void readDouble(const juce::var& object, const juce::Identifier& key, double& target)
    {
        if (object.hasProperty(key))
            target = (double) object[key];
    }

    void readInt(const juce::var& object, const juce::Identifier& key, int& target)
    {
        if (object.hasProperty(key))
            target = (int) object[key];
    }

    void readBool(const juce::var& object, const juce::Identifier& key, bool& target)
    {
        if (object.hasProperty(key))
            target = (bool) object[key];
    }
}

PipelineSettings::PipelineSettings()
{
    const auto base = juce::File::getSpecialLocation(juce::File::tempDirectory).getChildFile("BeatCut");

    workspaceRoot = base.getChildFile("workspaces");
    outputDirectory = juce::File::getCurrentWorkingDirectory().getChildFile("output");
    standardizedDirectory = base.getChildFile("standardized");
    logDirectory = base.getChildFile("logs");

    maxConcurrentSessions = juce::jmax(1, juce::SystemStats::getNumCpus());
}

void PipelineSettings::getResolutionSize(const juce::String& resolutionPreset, int& width, int& height)
{
    if (resolutionPreset.trim().equalsIgnoreCase("720p"))
    {
        width = 1280;
        height = 720;
    }
    else
    {
        // 1088 keeps the height a multiple of 16.
        width = 1920;
        height = 1088;
    }
}

BeatSyncTypes::EncodeSpec PipelineSettings::makeEncodeSpec(const juce::String& resolutionPreset) const
{
    BeatSyncTypes::EncodeSpec spec;
    getResolutionSize(resolutionPreset.isNotEmpty() ? resolutionPreset : resolution, spec.width, spec.height);
    spec.frameRate = frameRate;
    spec.videoCodec = videoCodec;
    spec.videoEncoder = videoEncoder;
    spec.videoEncoderArgs = videoEncoderArgs;
    spec.audioCodec = audioCodec;
    spec.audioEncoder = audioEncoder;
    spec.audioSampleRate = audioSampleRate;
    spec.audioChannels = audioChannels;
    spec.audioBitrate = audioBitrate;
    spec.deliveryAudioBitrate = deliveryAudioBitrate;
    return spec;
}

juce::Result PipelineSettings::loadFromFile(const juce::File& settingsFile)
{
    if (! settingsFile.existsAsFile())
        return juce::Result::fail("Settings file not found: " + settingsFile.getFullPathName());

    return loadFromJson(settingsFile.loadFileAsString(), settingsFile.getParentDirectory());
}

juce::Result PipelineSettings::loadFromJson(const juce::String& jsonText, const juce::File& baseDirectory)
{
    juce::var parsed;
    const auto parseResult = juce::JSON::parse(jsonText, parsed);
    if (parseResult.failed())
        return juce::Result::fail("Malformed settings: " + parseResult.getErrorMessage());

    if (! parsed.isObject())
        return juce::Result::fail("Malformed settings: expected a JSON object");

    readString(parsed, "ffmpegPath", ffmpegPath);
    readString(parsed, "ffprobePath", ffprobePath);

    readFile(parsed, "workspaceRoot", baseDirectory, workspaceRoot);
    readFile(parsed, "outputDirectory", baseDirectory, outputDirectory);
    readFile(parsed, "standardizedDirectory", baseDirectory, standardizedDirectory);
    readFile(parsed, "logDirectory", baseDirectory, logDirectory);

    readString(parsed, "resolution", resolution);

    if (parsed.hasProperty("frameRate"))
    {
        const auto& rateValue = parsed["frameRate"];
        const auto parsedRate = FrameRate::fromString(rateValue.isDouble() ? juce::String((double) rateValue, 3)
                                                                            : rateValue.toString());
        if (! parsedRate.isValid())
            return juce::Result::fail("Invalid frameRate: " + parsed["frameRate"].toString());
        frameRate = parsedRate;
    }

    readString(parsed, "videoCodec", videoCodec);
    readString(parsed, "videoEncoder", videoEncoder);
    readString(parsed, "videoEncoderArgs", videoEncoderArgs);
    readString(parsed, "audioCodec", audioCodec);
    readString(parsed, "audioEncoder", audioEncoder);
    readInt(parsed, "audioSampleRate", audioSampleRate);
    readInt(parsed, "audioChannels", audioChannels);
    readString(parsed, "audioBitrate", audioBitrate);
    readString(parsed, "deliveryAudioBitrate", deliveryAudioBitrate);

    readDouble(parsed, "tailDurationSeconds", tailDurationSeconds);
    readBool(parsed, "failOnUnderrun", failOnUnderrun);
    readInt(parsed, "maxConcurrentSessions", maxConcurrentSessions);

    const juce::var progressObject = parsed["progress"];
    if (progressObject.isObject())
    {
        readDouble(progressObject, "validationSecondsPerAsset", progress.validationSecondsPerAsset);
        readDouble(progressObject, "processingSecondsPerSegment", progress.processingSecondsPerSegment);
        readDouble(progressObject, "finalisationSeconds", progress.finalisationSeconds);
        readDouble(progressObject, "validationEnd", progress.validationEnd);
        readDouble(progressObject, "trimEnd", progress.trimEnd);
        readDouble(progressObject, "concatEnd", progress.concatEnd);
    }

    return validate();
}

juce::Result PipelineSettings::validate() const
{
    if (! frameRate.isValid())
        return juce::Result::fail("Invalid frame rate");

    if (audioSampleRate <= 0 || audioChannels <= 0)
        return juce::Result::fail("Audio sample rate and channel count must be positive");

    if (tailDurationSeconds <= 0.0)
        return juce::Result::fail("tailDurationSeconds must be positive");

    if (maxConcurrentSessions < 1)
        return juce::Result::fail("maxConcurrentSessions must be at least 1");

    if (! (0.0 <= progress.validationEnd && progress.validationEnd <= progress.trimEnd
           && progress.trimEnd <= progress.concatEnd && progress.concatEnd <= 100.0))
        return juce::Result::fail("Progress split must be increasing within 0-100");

    return juce::Result::ok();
}

juce::var PipelineSettings::toVar() const
{
    auto* object = new juce::DynamicObject();
    object->setProperty("ffmpegPath", ffmpegPath);
    object->setProperty("ffprobePath", ffprobePath);
    object->setProperty("workspaceRoot", workspaceRoot.getFullPathName());
    object->setProperty("outputDirectory", outputDirectory.getFullPathName());
    object->setProperty("standardizedDirectory", standardizedDirectory.getFullPathName());
    object->setProperty("logDirectory", logDirectory.getFullPathName());
    object->setProperty("resolution", resolution);
    object->setProperty("frameRate", frameRate.toString());
    object->setProperty("videoCodec", videoCodec);
    object->setProperty("videoEncoder", videoEncoder);
    object->setProperty("videoEncoderArgs", videoEncoderArgs);
    object->setProperty("audioCodec", audioCodec);
    object->setProperty("audioEncoder", audioEncoder);
    object->setProperty("audioSampleRate", audioSampleRate);
    object->setProperty("audioChannels", audioChannels);
    object->setProperty("audioBitrate", audioBitrate);
    object->setProperty("deliveryAudioBitrate", deliveryAudioBitrate);
    object->setProperty("tailDurationSeconds", tailDurationSeconds);
    object->setProperty("failOnUnderrun", failOnUnderrun);
    object->setProperty("maxConcurrentSessions", maxConcurrentSessions);

    auto* progressObject = new juce::DynamicObject();
    progressObject->setProperty("validationSecondsPerAsset", progress.validationSecondsPerAsset);
    progressObject->setProperty("processingSecondsPerSegment", progress.processingSecondsPerSegment);
    progressObject->setProperty("finalisationSeconds", progress.finalisationSeconds);
    progressObject->setProperty("validationEnd", progress.validationEnd);
    progressObject->setProperty("trimEnd", progress.trimEnd);
    progressObject->setProperty("concatEnd", progress.concatEnd);
    object->setProperty("progress", juce::var(progressObject));

    return juce::var(object);
}
