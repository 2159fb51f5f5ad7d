#pragma once
#include <juce_core/juce_core.h>
#include "BeatSyncTypes.h"
#include "BeatSyncPipeline.h"
#include "ClientRegistry.h"
#include "../core/PipelineSettings.h"

/**
 * Runs independent sessions side by side.
 *
 * Each submitted request becomes a job on a thread pool sized by
 * maxConcurrentSessions; extra requests wait for a free thread. Every job gets
 * its own pipeline, executor, workspace and log, and publishes to the client id
 * it was submitted with.
 */
class SessionRunner
{
public:
    using CompletionCallback = std::function<void(const juce::String& jobName, const BeatSyncTypes::PipelineResult&)>;
    using ExecutorFactory = std::function<std::unique_ptr<FFmpegExecutor>()>;

    SessionRunner(const PipelineSettings& settings, ClientRegistry& registry);
    ~SessionRunner();

    /** Called on the session's thread when it ends, successfully or not. */
    void setCompletionCallback(CompletionCallback callback);

    /**
     * Supplies executors for sessions that start after this call; the default
     * creates a plain FFmpegExecutor.
     */
    void setExecutorFactory(ExecutorFactory factory);

    /** Queues a session. Returns immediately. */
    void submit(const juce::String& jobName,
                const BeatSyncTypes::SessionRequest& request,
                const juce::String& clientId);

    /** Blocks until every submitted session has finished. */
    void waitForAll();

    int getMaxConcurrentSessions() const noexcept { return maxSessions; }

private:
    class SessionJob;

    PipelineSettings settings;
    ClientRegistry& registry;
    int maxSessions;

    // Guards both callbacks; jobs copy them out before use.
    juce::CriticalSection callbackLock;
    CompletionCallback completionCallback;
    ExecutorFactory executorFactory;

    juce::ThreadPool pool;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SessionRunner)
};
