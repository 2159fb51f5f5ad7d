#include "SessionRunner.h"

//==============================================================================
class SessionRunner::SessionJob : public juce::ThreadPoolJob
{
public:
    SessionJob(SessionRunner& r, const juce::String& name,
               const BeatSyncTypes::SessionRequest& req, const juce::String& id)
        : juce::ThreadPoolJob("session " + name),
          runner(r),
          jobName(name),
          request(req),
          clientId(id)
    {
    }

    JobStatus runJob() override
    {
        ExecutorFactory factory;
        {
            const juce::ScopedLock sl(runner.callbackLock);
            factory = runner.executorFactory;
        }

        std::unique_ptr<FFmpegExecutor> executor;
        if (factory)
            executor = factory();

        BeatSyncPipeline pipeline(runner.settings, StatusPublisher(runner.registry, clientId), std::move(executor));

        juce::Logger::writeToLog("Session job started: " + jobName);
        const auto result = pipeline.run(request);
        juce::Logger::writeToLog("Session job finished: " + jobName + " (status " + juce::String(result.statusCode) + ")");

        CompletionCallback callback;
        {
            const juce::ScopedLock sl(runner.callbackLock);
            callback = runner.completionCallback;
        }

        if (callback)
            callback(jobName, result);

        return jobHasFinished;
    }

private:
    SessionRunner& runner;
    juce::String jobName;
    BeatSyncTypes::SessionRequest request;
    juce::String clientId;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SessionJob)
};

//==============================================================================
SessionRunner::SessionRunner(const PipelineSettings& s, ClientRegistry& r)
    : settings(s),
      registry(r),
      maxSessions(juce::jmax(1, s.maxConcurrentSessions)),
      pool(maxSessions)
{
}

SessionRunner::~SessionRunner()
{
    // Sessions can't be interrupted; let running ones finish.
    waitForAll();
}

void SessionRunner::setCompletionCallback(CompletionCallback callback)
{
    const juce::ScopedLock sl(callbackLock);
    completionCallback = std::move(callback);
}

void SessionRunner::setExecutorFactory(ExecutorFactory factory)
{
    const juce::ScopedLock sl(callbackLock);
    executorFactory = std::move(factory);
}

void SessionRunner::submit(const juce::String& jobName,
                           const BeatSyncTypes::SessionRequest& request,
                           const juce::String& clientId)
{
    pool.addJob(new SessionJob(*this, jobName, request, clientId), true);
}

void SessionRunner::waitForAll()
{
    while (pool.getNumJobs() > 0)
        juce::Thread::sleep(50);
}
