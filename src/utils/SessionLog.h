#pragma once
#include <juce_core/juce_core.h>

/**
 * The log of one processing session.
 *
 * Layout under the log root:
 *   session_<id>/session.log   timestamped pipeline messages
 *   session_<id>/ffmpeg/       one log per external command plus ffmpeg.log
 *
 * Every line is also forwarded to the application logger, prefixed with the
 * session id, so interleaved sessions stay attributable there. Sessions never
 * swap the process-wide juce::Logger; several of them run at once.
 */
class SessionLog
{
public:
    SessionLog(const juce::File& logRoot, const juce::String& sessionId);
    ~SessionLog();

    /** Creates the directories and session.log. On failure messages still reach the application logger. */
    juce::Result open();

    void write(const juce::String& message);

    /** A log callback suitable for the pipeline components. */
    std::function<void(const juce::String&)> makeCallback();

    const juce::String& getSessionId() const noexcept { return sessionId; }
    juce::File getSessionDirectory() const { return sessionDirectory; }
    juce::File getFFmpegLogDirectory() const { return ffmpegLogDirectory; }
    juce::File getLogFile() const { return logFile; }

    /** Name of the application log file for a given start time: BeatCut_<yyyymmdd_hhmmss>.log */
    static juce::String getApplicationLogFileName(const juce::Time& startTime);

private:
    juce::String sessionId;
    juce::File sessionDirectory;
    juce::File ffmpegLogDirectory;
    juce::File logFile;

    juce::CriticalSection writeLock;
    std::unique_ptr<juce::FileOutputStream> stream;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SessionLog)
};
