#pragma once
#include <juce_core/juce_core.h>
#include "../rendering/BeatSyncTypes.h"

/**
 * Reads processing requests from JSON job files:
 *
 *   {
 *     "audio": "track.mp3",
 *     "videos": [ "a.mp4", { "path": "b.mov", "name": "Beach" } ],
 *     "beats": [ 0.0, 0.52, 1.04 ],
 *     "randomized": false,
 *     "resolution": "720p"
 *   }
 *
 * Relative paths resolve against the job file's directory. Only the shape of
 * the document is checked here; the pipeline validates beats and files.
 */
namespace JobFile
{
    juce::Result load(const juce::File& jobFile, BeatSyncTypes::SessionRequest& requestOut);

    juce::Result parse(const juce::String& jsonText, const juce::File& baseDirectory,
                       BeatSyncTypes::SessionRequest& requestOut);

    /** Parses a list of beat timestamps such as "0 1.0 3.5" or "0,1.0,3.5". */
    juce::Result parseBeatList(const juce::StringArray& tokens, std::vector<double>& beatsOut);
}
