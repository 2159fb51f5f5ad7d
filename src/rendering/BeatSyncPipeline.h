#pragma once
#include <juce_core/juce_core.h>
#include "BeatSyncTypes.h"
#include "FFmpegExecutor.h"
#include "AssetProber.h"
#include "ClipAssigner.h"
#include "SegmentRenderer.h"
#include "TimelineAssembler.h"
#include "ProgressReporter.h"
#include "ClientRegistry.h"
#include "SessionWorkspace.h"
#include "../core/PipelineSettings.h"
#include "../utils/SessionLog.h"

/**
 * Runs one beat-sync session from start to finish:
 * validation -> assignment -> segment rendering -> concat -> mux.
 *
 * Every stage runs strictly after the previous one on the calling thread; the
 * external processes each stage starts are awaited before moving on. One
 * instance handles one session; concurrent sessions use separate instances
 * (see SessionRunner). There is no way to abort a session once run() has started.
 */
class BeatSyncPipeline
{
public:
    using SessionState = BeatSyncTypes::SessionState;

    /**
     * Creates a new BeatSyncPipeline.
     * @param settings  Application settings (copied)
     * @param publisher Where status and progress events for this session go
     * @param executor  The executor to run ffmpeg/ffprobe through; a default one is created when null
     */
    BeatSyncPipeline(const PipelineSettings& settings,
                     StatusPublisher publisher,
                     std::unique_ptr<FFmpegExecutor> executor = nullptr);
    ~BeatSyncPipeline();

    /**
     * Runs a full processing session.
     *
     * Malformed requests are rejected with status 400 before any workspace is
     * created. Otherwise a per-session workspace and log are created, assets are
     * validated, and the pipeline runs; the workspace is removed on every exit path.
     * The final file is written to <outputDirectory>/final_<sessionId>.mp4.
     */
    BeatSyncTypes::PipelineResult run(const BeatSyncTypes::SessionRequest& request);

    /**
     * Validates the request's assets only. Standardized copies go to the
     * configured standardized directory and are kept.
     */
    BeatSyncTypes::PipelineResult validateOnly(const BeatSyncTypes::SessionRequest& request);

    /**
     * Probes and conforms every asset in order, emitting status and one
     * validation progress unit per asset. Failures are recorded on the assets.
     * @return the number of valid assets
     */
    int validateAssets(std::vector<BeatSyncTypes::MediaAsset>& assets,
                       const BeatSyncTypes::EncodeSpec& spec,
                       const juce::File& standardizedDirectory);

    /**
     * Assigns, renders, concatenates and muxes. Assets must already be validated.
     * Fills result's intervals, assignments, segments and outputFile as it goes.
     */
    juce::Result process(const BeatSyncTypes::SessionRequest& request,
                         const std::vector<BeatSyncTypes::MediaAsset>& assets,
                         const BeatSyncTypes::EncodeSpec& spec,
                         SessionWorkspace& workspace,
                         BeatSyncTypes::PipelineResult& result);

    /** Rejects requests that can't be processed at all (status 400). */
    static juce::Result checkRequest(const BeatSyncTypes::SessionRequest& request);

    /** Fixes the shuffle seed used for randomized assignment. */
    void setRandomSeed(juce::int64 seed);

    /** Uses the given id instead of a fresh one for the next session. */
    void setSessionId(const juce::String& sessionId);

    SessionState getState() const noexcept { return state; }

private:
    void updateState(SessionState newState, const juce::String& statusMessage);
    void status(const juce::String& message);
    void log(const juce::String& message);
    void fail(BeatSyncTypes::PipelineResult& result, int statusCode, const juce::String& message);

    PipelineSettings settings;
    StatusPublisher publisher;

    // Component instances
    std::unique_ptr<FFmpegExecutor> ffmpegExecutor;
    std::unique_ptr<AssetProber> assetProber;
    std::unique_ptr<ClipAssigner> clipAssigner;
    std::unique_ptr<TimelineAssembler> timelineAssembler;
    std::unique_ptr<SegmentRenderer> segmentRenderer;
    ProgressReporter progressReporter;

    juce::Random random;
    juce::String presetSessionId;
    SessionState state = SessionState::Idle;

    SessionLog* sessionLog = nullptr;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(BeatSyncPipeline)
};
