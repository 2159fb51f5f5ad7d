#include "ClipSplitter.h"
#include "SegmentRenderer.h"
#include <cmath>

ClipSplitter::ClipSplitter(FFmpegExecutor* executor, AssetProber* prober)
    : ffmpegExecutor(executor),
      assetProber(prober)
{
}

ClipSplitter::~ClipSplitter()
{
}

void ClipSplitter::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

void ClipSplitter::setStatusCallback(std::function<void(const juce::String&)> callback)
{
    statusCallback = std::move(callback);
}

void ClipSplitter::setEncodeSpec(const BeatSyncTypes::EncodeSpec& newSpec)
{
    spec = newSpec;
}

int ClipSplitter::countClips(double durationSeconds, double clipDurationSeconds)
{
    if (durationSeconds <= 0.0 || clipDurationSeconds <= 0.0)
        return 0;

    // A hair of tolerance so 6.0 / 2.0 stored as 5.9999999 still yields 3.
    return (int) std::floor(durationSeconds / clipDurationSeconds + 1.0e-9);
}

juce::Result ClipSplitter::split(const std::vector<BeatSyncTypes::MediaAsset>& assets,
                                 double clipDurationSeconds,
                                 const juce::File& outputDirectory,
                                 std::vector<Clip>& clipsOut,
                                 ProgressReporter* progress)
{
    clipsOut.clear();

    if (! (clipDurationSeconds > 0.0))
        return juce::Result::fail("Invalid clip duration");

    if (assets.empty())
        return juce::Result::fail("No video files given");

    if (! outputDirectory.isDirectory())
    {
        const auto created = outputDirectory.createDirectory();
        if (created.failed())
            return juce::Result::fail("Cannot create " + outputDirectory.getFullPathName() + ": " + created.getErrorMessage());
    }

    // First pass: durations and the total clip count.
    std::vector<AssetProber::Metadata> metadata(assets.size());
    int totalClips = 0;

    for (size_t i = 0; i < assets.size(); ++i)
    {
        const auto result = assetProber->probe(assets[i].storagePath, metadata[i]);
        if (result.failed())
            return juce::Result::fail(assets[i].originalName + ": " + result.getErrorMessage());

        totalClips += countClips(metadata[i].durationSeconds, clipDurationSeconds);
    }

    if (logCallback) logCallback("Splitting " + juce::String((int) assets.size()) + " video(s) into "
                                 + juce::String(totalClips) + " clip(s) of " + juce::String(clipDurationSeconds, 3) + "s");

    if (progress != nullptr)
        progress->beginPhase(BeatSyncTypes::ProgressPhase::Trim, totalClips);

    std::vector<Clip> clips;
    int processedClips = 0;

    for (size_t i = 0; i < assets.size(); ++i)
    {
        const auto& asset = assets[i];
        const int clipCount = countClips(metadata[i].durationSeconds, clipDurationSeconds);

        if (statusCallback)
            statusCallback("Processing video " + juce::String((int) i + 1) + "/" + juce::String((int) assets.size())
                           + ": " + asset.originalName);

        for (int j = 0; j < clipCount; ++j)
        {
            Clip clip;
            clip.originalName = asset.originalName;
            clip.assetIndex = (int) i;
            clip.clipIndex = j;
            clip.startSeconds = j * clipDurationSeconds;
            clip.file = outputDirectory.getChildFile("clip_" + juce::String((int) i) + "_" + juce::String(j) + ".mp4");

            if (statusCallback)
                statusCallback("Generating clip " + juce::String(j + 1) + "/" + juce::String(clipCount)
                               + " from " + asset.originalName);

            const auto args = SegmentRenderer::buildConformArgs(asset.storagePath, metadata[i].hasAudio,
                                                                clip.startSeconds, clipDurationSeconds,
                                                                clip.file, spec);

            const auto result = ffmpegExecutor->runFFmpeg(args, "cutting " + clip.file.getFileName());
            if (result.failed())
            {
                clip.file.deleteFile();
                return result;
            }

            clips.push_back(clip);
            ++processedClips;

            if (progress != nullptr)
                progress->unitsCompleted(processedClips);
        }
    }

    if (statusCallback)
        statusCallback("Clips generated successfully: " + juce::String(processedClips));

    clipsOut = std::move(clips);
    return juce::Result::ok();
}
