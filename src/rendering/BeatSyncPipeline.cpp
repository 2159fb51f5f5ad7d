#include "BeatSyncPipeline.h"
#include <algorithm>

using namespace BeatSyncTypes;

namespace
{
    /** Points the pipeline and its executor at a session log for as long as the session runs. */
    class ScopedSessionLog
    {
    public:
        ScopedSessionLog(SessionLog*& slotToUse, FFmpegExecutor& executorToUse, SessionLog& log, bool logOpened)
            : slot(slotToUse), executor(executorToUse)
        {
            if (logOpened)
                executor.setSessionLogDirectory(log.getFFmpegLogDirectory());

            slot = &log;
        }

        ~ScopedSessionLog()
        {
            executor.setSessionLogDirectory(juce::File());
            slot = nullptr;
        }

    private:
        SessionLog*& slot;
        FFmpegExecutor& executor;

        JUCE_DECLARE_NON_COPYABLE(ScopedSessionLog)
    };
}

BeatSyncPipeline::BeatSyncPipeline(const PipelineSettings& s,
                                   StatusPublisher p,
                                   std::unique_ptr<FFmpegExecutor> executor)
    : settings(s),
      publisher(std::move(p)),
      ffmpegExecutor(std::move(executor)),
      progressReporter(s.progress)
{
    // Create component instances
    if (ffmpegExecutor == nullptr)
        ffmpegExecutor = std::make_unique<FFmpegExecutor>();

    assetProber = std::make_unique<AssetProber>(ffmpegExecutor.get());
    clipAssigner = std::make_unique<ClipAssigner>();
    timelineAssembler = std::make_unique<TimelineAssembler>(ffmpegExecutor.get());
    segmentRenderer = std::make_unique<SegmentRenderer>(ffmpegExecutor.get(), timelineAssembler.get());

    if (settings.ffmpegPath.isNotEmpty() || settings.ffprobePath.isNotEmpty())
        ffmpegExecutor->setExecutablePaths(settings.ffmpegPath, settings.ffprobePath);

    auto logFunction = [this](const juce::String& message) { log(message); };
    ffmpegExecutor->setLogCallback(logFunction);
    assetProber->setLogCallback(logFunction);
    clipAssigner->setLogCallback(logFunction);
    timelineAssembler->setLogCallback(logFunction);
    segmentRenderer->setLogCallback(logFunction);

    segmentRenderer->setWarningCallback([this](const juce::String& message) { status("Warning: " + message); });
    segmentRenderer->setFailOnUnderrun(settings.failOnUnderrun);

    progressReporter.setEventCallback([this](const ProgressEvent& event) { publisher.progress(event); });
}

BeatSyncPipeline::~BeatSyncPipeline()
{
    // The renderer refers to the assembler, both refer to the executor.
    segmentRenderer.reset();
    timelineAssembler.reset();
    clipAssigner.reset();
    assetProber.reset();
    ffmpegExecutor.reset();
}

void BeatSyncPipeline::setRandomSeed(juce::int64 seed)
{
    random.setSeed(seed);
}

void BeatSyncPipeline::setSessionId(const juce::String& sessionId)
{
    presetSessionId = sessionId;
}

//==============================================================================
void BeatSyncPipeline::log(const juce::String& message)
{
    if (sessionLog != nullptr)
        sessionLog->write(message);
    else
        juce::Logger::writeToLog("[pipeline] " + message);
}

void BeatSyncPipeline::status(const juce::String& message)
{
    publisher.status(message);
    log("STATUS: " + message);
}

void BeatSyncPipeline::updateState(SessionState newState, const juce::String& statusMessage)
{
    state = newState;

    if (statusMessage.isNotEmpty())
        status(statusMessage);
}

void BeatSyncPipeline::fail(PipelineResult& result, int statusCode, const juce::String& message)
{
    result.result = juce::Result::fail(message);
    result.statusCode = statusCode;
    result.outputFile = juce::File();

    state = SessionState::Failed;
    status("Error: " + message);
}

//==============================================================================
juce::Result BeatSyncPipeline::checkRequest(const SessionRequest& request)
{
    if (request.assets.empty())
        return juce::Result::fail("No video files given");

    if (request.audioFile == juce::File())
        return juce::Result::fail("No audio file given");

    if (! request.audioFile.existsAsFile())
        return juce::Result::fail("Audio file not found: " + request.audioFile.getFullPathName());

    return ClipAssigner::validateBeats(request.beats);
}

int BeatSyncPipeline::validateAssets(std::vector<MediaAsset>& assets,
                                     const EncodeSpec& spec,
                                     const juce::File& standardizedDirectory)
{
    const int total = (int) assets.size();
    int validCount = 0;

    updateState(SessionState::Validating, "Validating and standardizing video files to " + spec.sizeString() + "...");
    progressReporter.beginPhase(ProgressPhase::Validation, total);

    for (int i = 0; i < total; ++i)
    {
        auto& asset = assets[(size_t) i];
        const juce::String position = juce::String(i + 1) + "/" + juce::String(total);

        status("Checking file " + position + ": " + asset.originalName);

        assetProber->validateAsset(asset, spec, standardizedDirectory,
                                   [this, &position, &asset](const juce::String&)
                                   {
                                       status("Standardizing file " + position + ": " + asset.originalName);
                                   });

        if (asset.isValid)
        {
            ++validCount;
            log("Asset " + asset.id + " (" + asset.originalName + ") valid, "
                + juce::String(asset.durationSeconds, 3) + "s" + (asset.hasAudio ? "" : ", no audio"));
        }
        else
        {
            status("File " + position + " is invalid: " + asset.validationError);
        }

        progressReporter.unitsCompleted(i + 1);
    }

    status("Validation complete: " + juce::String(validCount) + "/" + juce::String(total) + " files are valid");
    return validCount;
}

juce::Result BeatSyncPipeline::process(const SessionRequest& request,
                                       const std::vector<MediaAsset>& assets,
                                       const EncodeSpec& spec,
                                       SessionWorkspace& workspace,
                                       PipelineResult& result)
{
    segmentRenderer->setEncodeSpec(spec);
    timelineAssembler->setEncodeSpec(spec);

    updateState(SessionState::Assigning, "Starting video processing...");

    result.intervals = ClipAssigner::deriveIntervals(request.beats, settings.tailDurationSeconds);

    auto assigned = clipAssigner->assign(result.intervals, assets, request.randomized, random, result.assignments);
    if (assigned.failed())
        return assigned;

    for (const auto& assignment : result.assignments)
        log("Interval " + juce::String(assignment.intervalIndex) + " ("
            + juce::String(result.intervals[(size_t) assignment.intervalIndex].durationSeconds, 3)
            + "s) -> " + assignment.assetId);

    // Segments
    const int totalSegments = (int) result.intervals.size();
    updateState(SessionState::Rendering, {});
    progressReporter.beginPhase(ProgressPhase::Trim, totalSegments);

    std::vector<juce::File> segmentFiles;

    for (int i = 0; i < totalSegments; ++i)
    {
        const auto& interval = result.intervals[(size_t) i];
        const auto& assetId = result.assignments[(size_t) i].assetId;

        const auto it = std::find_if(assets.begin(), assets.end(),
                                     [&assetId](const MediaAsset& a) { return a.id == assetId; });
        if (it == assets.end())
            return juce::Result::fail("Assigned asset " + assetId + " is missing from the pool");

        status("Processing clip " + juce::String(i + 1) + "/" + juce::String(totalSegments) + ": "
               + it->originalName + " (" + juce::String(interval.durationSeconds, 3) + "s)");

        SegmentReport report;
        auto rendered = segmentRenderer->renderSegment(*it, interval.durationSeconds, i, workspace.getDirectory(), report);
        if (rendered.failed())
            return rendered;

        result.segments.push_back(report);
        segmentFiles.push_back(report.file);

        progressReporter.unitsCompleted(i + 1);
    }

    // Concat
    updateState(SessionState::Concatenating, "Merging video clips...");
    progressReporter.beginPhase(ProgressPhase::Concat, 1);

    const juce::File mergedFile = workspace.getFile("merged.mp4");
    auto merged = timelineAssembler->concatenateSegments(segmentFiles, mergedFile);
    if (merged.failed())
        return merged;

    progressReporter.unitsCompleted(1);

    // Mux
    updateState(SessionState::Muxing, "Adding original audio track...");
    progressReporter.beginPhase(ProgressPhase::Mux, 1);

    if (! settings.outputDirectory.isDirectory())
    {
        auto created = settings.outputDirectory.createDirectory();
        if (created.failed())
            return juce::Result::fail("Cannot create output directory " + settings.outputDirectory.getFullPathName()
                                      + ": " + created.getErrorMessage());
    }

    const juce::File finalFile = settings.outputDirectory.getChildFile("final_" + workspace.getSessionId() + ".mp4");
    auto muxed = timelineAssembler->muxAudio(mergedFile, request.audioFile, finalFile);
    if (muxed.failed())
        return muxed;

    progressReporter.unitsCompleted(1);

    result.outputFile = finalFile;
    return juce::Result::ok();
}

//==============================================================================
PipelineResult BeatSyncPipeline::run(const SessionRequest& request)
{
    PipelineResult result;
    result.assets = request.assets;

    auto requestCheck = checkRequest(request);
    if (requestCheck.failed())
    {
        fail(result, 400, requestCheck.getErrorMessage());
        return result;
    }

    const juce::String sessionId = presetSessionId.isNotEmpty() ? presetSessionId : SessionWorkspace::createSessionId();
    presetSessionId.clear();
    result.sessionId = sessionId;

    SessionLog runLog(settings.logDirectory, sessionId);
    auto logOpened = runLog.open();
    if (logOpened.failed())
        juce::Logger::writeToLog("WARNING: session log unavailable: " + logOpened.getErrorMessage());

    const ScopedSessionLog scopedLog(sessionLog, *ffmpegExecutor, runLog, logOpened.wasOk());
    ffmpegExecutor->setSessionId(sessionId);

    SessionWorkspace workspace(settings.workspaceRoot, sessionId);

    try
    {
        auto created = workspace.create();
        if (created.failed())
        {
            fail(result, 500, created.getErrorMessage());
        }
        else
        {
            log("Workspace: " + workspace.getDirectory().getFullPathName()
                + " (created " + workspace.getCreatedAt().toString(true, true) + ")");
            progressReporter.beginSession();

            const EncodeSpec spec = settings.makeEncodeSpec(request.resolution);
            validateAssets(result.assets, spec, workspace.getFile("standardized"));

            auto processed = process(request, result.assets, spec, workspace, result);
            if (processed.failed())
            {
                fail(result, 500, processed.getErrorMessage());
            }
            else
            {
                progressReporter.finish();
                updateState(SessionState::Completed, "Video processing complete!");
                result.result = juce::Result::ok();
                result.statusCode = 200;
            }
        }
    }
    catch (const std::exception& e)
    {
        fail(result, 500, "Unexpected error: " + juce::String(e.what()));
    }

    log("Session ran for " + (juce::Time::getCurrentTime() - workspace.getCreatedAt()).getDescription());
    workspace.remove();

    return result;
}

PipelineResult BeatSyncPipeline::validateOnly(const SessionRequest& request)
{
    PipelineResult result;
    result.assets = request.assets;

    if (request.assets.empty())
    {
        fail(result, 400, "No video files given");
        return result;
    }

    try
    {
        progressReporter.beginSession();
        const EncodeSpec spec = settings.makeEncodeSpec(request.resolution);
        validateAssets(result.assets, spec, settings.standardizedDirectory);
        state = SessionState::Completed;
    }
    catch (const std::exception& e)
    {
        fail(result, 500, "Unexpected error: " + juce::String(e.what()));
    }

    return result;
}
