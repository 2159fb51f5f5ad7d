#pragma once
#include <juce_core/juce_core.h>
#include <algorithm>
#include <vector>

/**
 * Table of every ffmpeg/ffprobe child process currently alive, across all
 * sessions of this process.
 *
 * Sessions have no cancellation primitive. The table is only consulted at
 * application shutdown so that no encoder outlives the server.
 */
class ProcessManager
{
public:
    struct Entry
    {
        juce::ChildProcess* process = nullptr;
        juce::String description;
        juce::Time startTime;
    };

    static ProcessManager& getInstance()
    {
        static ProcessManager instance;
        return instance;
    }

    void add(juce::ChildProcess& process, const juce::String& description)
    {
        const juce::ScopedLock sl(lock);
        entries.push_back({ &process, description, juce::Time::getCurrentTime() });
    }

    void remove(juce::ChildProcess& process)
    {
        const juce::ScopedLock sl(lock);
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [&process](const Entry& e) { return e.process == &process; }),
                      entries.end());
    }

    int getNumTracked() const
    {
        const juce::ScopedLock sl(lock);
        return (int) entries.size();
    }

    /** Descriptions of the tracked processes, oldest first. */
    juce::StringArray getDescriptions() const
    {
        const juce::ScopedLock sl(lock);
        juce::StringArray descriptions;

        for (const auto& e : entries)
            descriptions.add(e.description);

        return descriptions;
    }

    /** Kills whatever is still running and returns how many were killed. */
    int terminateAllProcesses()
    {
        const juce::ScopedLock sl(lock);
        const auto now = juce::Time::getCurrentTime();
        int killed = 0;

        for (auto& e : entries)
        {
            if (! e.process->isRunning())
                continue;

            juce::Logger::writeToLog("Killing " + e.description + " (running for "
                                     + (now - e.startTime).getDescription() + ")");
            e.process->kill();
            ++killed;
        }

        return killed;
    }

private:
    ProcessManager() = default;

    std::vector<Entry> entries;
    juce::CriticalSection lock;

    JUCE_DECLARE_NON_COPYABLE(ProcessManager)
};

/**
 * ChildProcess that stays in the ProcessManager table for its whole lifetime
 * and never outlives its owner.
 */
class ManagedChildProcess : public juce::ChildProcess
{
public:
    explicit ManagedChildProcess(const juce::String& description)
    {
        ProcessManager::getInstance().add(*this, description);
    }

    ~ManagedChildProcess()
    {
        ProcessManager::getInstance().remove(*this);

        if (isRunning())
            kill();
    }

private:
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ManagedChildProcess)
};
