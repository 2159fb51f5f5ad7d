#include "SessionLog.h"

SessionLog::SessionLog(const juce::File& logRoot, const juce::String& id)
    : sessionId(id),
      sessionDirectory(logRoot.getChildFile("session_" + id)),
      ffmpegLogDirectory(sessionDirectory.getChildFile("ffmpeg")),
      logFile(sessionDirectory.getChildFile("session.log"))
{
}

SessionLog::~SessionLog()
{
    juce::ScopedLock lock(writeLock);
    if (stream && stream->openedOk())
    {
        stream->writeText("Session finished at " + juce::Time::getCurrentTime().toString(true, true) + "\n", false, false, nullptr);
        stream->flush();
    }
}

juce::Result SessionLog::open()
{
    auto result = ffmpegLogDirectory.createDirectory();
    if (result.failed())
        return juce::Result::fail("Cannot create session log directory " + sessionDirectory.getFullPathName()
                                  + ": " + result.getErrorMessage());

    juce::ScopedLock lock(writeLock);

    if (logFile.existsAsFile())
        logFile.deleteFile();

    stream = std::make_unique<juce::FileOutputStream>(logFile);
    if (! stream->openedOk())
    {
        stream.reset();
        return juce::Result::fail("Cannot open " + logFile.getFullPathName());
    }

    stream->writeText("Session " + sessionId + " started at " + juce::Time::getCurrentTime().toString(true, true) + "\n",
                      false, false, nullptr);
    stream->flush();
    return juce::Result::ok();
}

void SessionLog::write(const juce::String& message)
{
    {
        juce::ScopedLock lock(writeLock);
        if (stream && stream->openedOk())
        {
            const juce::String line = juce::Time::getCurrentTime().toString(true, true) + " | " + message + "\n";
            stream->writeText(line, false, false, nullptr);
            stream->flush();
        }
    }

    juce::Logger::writeToLog("[session " + sessionId + "] " + message);
}

std::function<void(const juce::String&)> SessionLog::makeCallback()
{
    return [this](const juce::String& message) { write(message); };
}

juce::String SessionLog::getApplicationLogFileName(const juce::Time& startTime)
{
    return "BeatCut_" + startTime.formatted("%Y%m%d_%H%M%S") + ".log";
}
