#include "JobFile.h"

namespace
{
    bool isNumber(const juce::var& value)
    {
        return value.isDouble() || value.isInt() || value.isInt64();
    }

    BeatSyncTypes::MediaAsset makeAsset(const juce::File& path, const juce::String& name, int index)
    {
        BeatSyncTypes::MediaAsset asset;
        asset.id = "asset_" + juce::String(index);
        asset.storagePath = path;
        asset.originalName = name.isNotEmpty() ? name : path.getFileName();
        return asset;
    }
}

namespace JobFile
{
    juce::Result load(const juce::File& jobFile, BeatSyncTypes::SessionRequest& requestOut)
    {
        if (! jobFile.existsAsFile())
            return juce::Result::fail("Job file not found: " + jobFile.getFullPathName());

        return parse(jobFile.loadFileAsString(), jobFile.getParentDirectory(), requestOut);
    }

    juce::Result parse(const juce::String& jsonText, const juce::File& baseDirectory,
                       BeatSyncTypes::SessionRequest& requestOut)
    {
        juce::var parsed;
        const auto parseResult = juce::JSON::parse(jsonText, parsed);
        if (parseResult.failed())
            return juce::Result::fail("Malformed job file: " + parseResult.getErrorMessage());

        if (! parsed.isObject())
            return juce::Result::fail("Malformed job file: expected a JSON object");

        BeatSyncTypes::SessionRequest request;

        const auto audioPath = parsed["audio"].toString().trim();
        if (audioPath.isEmpty())
            return juce::Result::fail("Job file has no \"audio\" entry");
        request.audioFile = baseDirectory.getChildFile(audioPath);

        const auto* videos = parsed["videos"].getArray();
        if (videos == nullptr)
            return juce::Result::fail("Job file has no \"videos\" list");

        int index = 0;
        for (const auto& entry : *videos)
        {
            juce::String path;
            juce::String name;

            if (entry.isString())
            {
                path = entry.toString();
            }
            else if (entry.isObject())
            {
                path = entry["path"].toString();
                name = entry["name"].toString();
            }

            if (path.trim().isEmpty())
                return juce::Result::fail("Video entry " + juce::String(index + 1) + " has no path");

            request.assets.push_back(makeAsset(baseDirectory.getChildFile(path.trim()), name, index));
            ++index;
        }

        const auto* beats = parsed["beats"].getArray();
        if (beats == nullptr)
            return juce::Result::fail("Job file has no \"beats\" list");

        for (const auto& beat : *beats)
        {
            if (! isNumber(beat))
                return juce::Result::fail("Beat timestamps must be numbers");
            request.beats.push_back((double) beat);
        }

        if (parsed.hasProperty("randomized"))
            request.randomized = (bool) parsed["randomized"];

        request.resolution = parsed["resolution"].toString();

        requestOut = std::move(request);
        return juce::Result::ok();
    }

    juce::Result parseBeatList(const juce::StringArray& tokens, std::vector<double>& beatsOut)
    {
        std::vector<double> beats;

        for (const auto& token : tokens)
        {
            juce::StringArray parts;
            parts.addTokens(token, ", ", "");
            parts.removeEmptyStrings();

            for (const auto& part : parts)
            {
                if (! part.containsOnly("0123456789.eE+-"))
                    return juce::Result::fail("Not a timestamp: " + part);
                beats.push_back(part.getDoubleValue());
            }
        }

        beatsOut = std::move(beats);
        return juce::Result::ok();
    }
}
