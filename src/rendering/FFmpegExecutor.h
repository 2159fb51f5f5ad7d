#pragma once
#include <juce_core/juce_core.h>

//==============================================================================
/**
 * @file FFmpegExecutor.h
 *
 * This file declares the FFmpegExecutor class which is responsible for running
 * ffmpeg and ffprobe as child processes on behalf of one session.
 *
 * The class handles:
 * - Running each external command on its own worker thread and waiting for it
 * - Per-command and aggregate command logs in the session log directory
 * - Turning exit codes and captured output into juce::Result failures
 * - Locating the ffmpeg/ffprobe executables
 */

/** Exit status and captured output of one external process. */
struct CommandResult
{
    bool started = false;
    int exitCode = -1;
    juce::String output;

    bool succeeded() const noexcept { return started && exitCode == 0; }
};

//==============================================================================
/**
 * Worker thread that owns one external process from start to exit.
 *
 * The calling session thread blocks in waitForResult() until the process has
 * finished, so a session's pipeline stays a strict sequence of such tasks while
 * other sessions keep running on their own threads.
 */
class ProcessTask : private juce::Thread
{
public:
    ProcessTask(const juce::StringArray& arguments, int streamFlags, const juce::String& description);
    ~ProcessTask() override;

    /** Starts the worker and blocks until the process has exited. */
    CommandResult runAndWait();

private:
    void run() override;

    juce::StringArray arguments;
    int streamFlags;
    juce::String description;
    CommandResult result;
    juce::WaitableEvent finished;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ProcessTask)
};

//==============================================================================
/**
 * The FFmpegExecutor class handles all interaction with ffmpeg as an external process.
 *
 * @note This class doesn't look at video/audio data itself - it only runs
 *       commands and reports results. The media logic lives in the components
 *       that use this as a service. One instance belongs to one session.
 */
class FFmpegExecutor
{
public:
    FFmpegExecutor();
    virtual ~FFmpegExecutor();

    /** Sets a callback function that will be called with log messages. */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /** Overrides the executables; empty strings keep the automatic lookup. */
    void setExecutablePaths(const juce::String& ffmpegPath, const juce::String& ffprobePath);

    /** Used to label processes registered with ProcessManager. */
    void setSessionId(const juce::String& sessionId);

    /**
     * Sets the directory where command output should be recorded.
     * A per-command log file plus an aggregate log will be created in this directory.
     * Pass juce::File() to stop recording.
     */
    void setSessionLogDirectory(const juce::File& directory);

    /**
     * Runs ffmpeg with the given arguments (the executable is prepended).
     *
     * @param args        ffmpeg arguments, one token per element
     * @param description Short human-readable label used in logs and errors
     * @return            ok, or a failure carrying the exit code and the tail of ffmpeg's output
     */
    juce::Result runFFmpeg(const juce::StringArray& args, const juce::String& description);

    /** Runs ffprobe and captures stdout only. */
    CommandResult runFFprobe(const juce::StringArray& args);

    /** Checks that "ffmpeg -version" runs and exits cleanly. */
    bool checkFFmpegAvailability();

    juce::String getFFmpegPath() const;
    juce::String getFFprobePath() const;

    /** Joins argv into a loggable command line, quoting tokens with spaces. */
    static juce::String formatCommand(const juce::StringArray& argv);

protected:
    /**
     * Starts the process and waits for it. This is the only place a real
     * process is spawned; tests override it to stand in for ffmpeg.
     */
    virtual CommandResult runProcess(const juce::StringArray& argv, int streamFlags, const juce::String& description);

private:
    CommandResult runLogged(const juce::StringArray& argv, int streamFlags, const juce::String& description);
    juce::File getNextCommandLogFile(int& outIndex);
    void writeToAggregateLog(const juce::String& message);
    void log(const juce::String& message) const;

    juce::String ffmpegOverride;
    juce::String ffprobeOverride;
    juce::String sessionId;

    std::function<void(const juce::String&)> logCallback;

    //==========================================================================
    // Logging helpers
    juce::CriticalSection logDirectoryLock;
    juce::File sessionLogDirectory;
    juce::File sessionAggregateLogFile;
    bool sessionLoggingEnabled { false };
    int sessionCommandIndex { 0 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FFmpegExecutor)
};
