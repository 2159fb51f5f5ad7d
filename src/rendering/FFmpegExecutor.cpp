//==============================================================================
/**
 * @file FFmpegExecutor.cpp
 *
 * Implementation file for the FFmpegExecutor class, which handles running
 * ffmpeg/ffprobe as external processes and recording what they did.
 */

#include "FFmpegExecutor.h"
#include "../core/ProcessManager.h"

namespace
{
    // Number of trailing output lines quoted in a failure message.
    constexpr int failureTailLines = 8;

    juce::String tailOfOutput(const juce::String& output)
    {
        juce::StringArray lines;
        lines.addLines(output.replace("\r", "\n"));
        lines.removeEmptyStrings();

        const int first = juce::jmax(0, lines.size() - failureTailLines);
        juce::StringArray tail;
        for (int i = first; i < lines.size(); ++i)
            tail.add(lines[i].trim());

        return tail.joinIntoString("\n");
    }

    juce::String findExecutable(const juce::String& name)
    {
        // Look next to our own executable first, then fall back to PATH.
        juce::File appDir = juce::File::getSpecialLocation(juce::File::currentExecutableFile).getParentDirectory();

       #if JUCE_WINDOWS
        juce::File local = appDir.getChildFile(name + ".exe");
       #else
        juce::File local = appDir.getChildFile(name);
       #endif

        if (local.existsAsFile())
            return local.getFullPathName();

       #if JUCE_WINDOWS
        return name + ".exe";
       #else
        return name;
       #endif
    }
}

//==============================================================================
ProcessTask::ProcessTask(const juce::StringArray& argumentsToUse, int flags, const juce::String& descriptionToUse)
    : juce::Thread("ProcessTask"),
      arguments(argumentsToUse),
      streamFlags(flags),
      description(descriptionToUse)
{
}

ProcessTask::~ProcessTask()
{
    // run() never returns before its process has exited, so this does not block for long.
    stopThread(-1);
}

CommandResult ProcessTask::runAndWait()
{
    finished.reset();

    if (! startThread())
    {
        CommandResult failed;
        failed.output = "Failed to start worker thread";
        return failed;
    }

    finished.wait(-1);
    return result;
}

void ProcessTask::run()
{
    ManagedChildProcess process(description);

    if (! process.start(arguments, streamFlags))
    {
        result.started = false;
        result.output = "Failed to start process: " + FFmpegExecutor::formatCommand(arguments);
        finished.signal();
        return;
    }

    result.started = true;

    // Drain the pipe until the process closes it, otherwise a chatty ffmpeg
    // can block on a full pipe and never exit.
    result.output = process.readAllProcessOutput();
    process.waitForProcessToFinish(-1);
    result.exitCode = (int) process.getExitCode();

    finished.signal();
}

//==============================================================================
FFmpegExecutor::FFmpegExecutor()
{
}

FFmpegExecutor::~FFmpegExecutor()
{
}

void FFmpegExecutor::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

void FFmpegExecutor::setExecutablePaths(const juce::String& ffmpegPath, const juce::String& ffprobePath)
{
    ffmpegOverride = ffmpegPath.trim();
    ffprobeOverride = ffprobePath.trim();
}

void FFmpegExecutor::setSessionId(const juce::String& id)
{
    sessionId = id;
}

//==============================================================================
void FFmpegExecutor::setSessionLogDirectory(const juce::File& directory)
{
    juce::ScopedLock sl(logDirectoryLock);

    sessionLoggingEnabled = false;
    sessionLogDirectory = juce::File();
    sessionAggregateLogFile = juce::File();
    sessionCommandIndex = 0;

    if (directory == juce::File())
        return;

    if (! directory.isDirectory() && directory.createDirectory().failed())
        return;

    sessionLogDirectory = directory;
    sessionAggregateLogFile = sessionLogDirectory.getChildFile("ffmpeg.log");
    if (sessionAggregateLogFile.existsAsFile())
        sessionAggregateLogFile.deleteFile();

    sessionLoggingEnabled = sessionLogDirectory.isDirectory();
}

juce::File FFmpegExecutor::getNextCommandLogFile(int& outIndex)
{
    juce::ScopedLock sl(logDirectoryLock);

    if (! sessionLoggingEnabled)
    {
        outIndex = -1;
        return juce::File();
    }

    ++sessionCommandIndex;
    outIndex = sessionCommandIndex;
    return sessionLogDirectory.getChildFile(juce::String::formatted("ffmpeg_%03d.log", sessionCommandIndex));
}

void FFmpegExecutor::writeToAggregateLog(const juce::String& message)
{
    juce::ScopedLock sl(logDirectoryLock);

    if (! sessionLoggingEnabled)
        return;

    sessionAggregateLogFile.appendText(message + "\n", false, false, nullptr);
}

void FFmpegExecutor::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

//==============================================================================
CommandResult FFmpegExecutor::runLogged(const juce::StringArray& argv, int streamFlags, const juce::String& description)
{
    const juce::String commandLine = formatCommand(argv);
    const juce::String startTimeString = juce::Time::getCurrentTime().toString(true, true);

    int commandLogIndex = -1;
    const juce::File commandLogFile = getNextCommandLogFile(commandLogIndex);
    const juce::String commandIndexLabel = (commandLogIndex > 0)
        ? juce::String::formatted("#%03d", commandLogIndex)
        : juce::String("#---");

    writeToAggregateLog(commandIndexLabel + " [" + startTimeString + "] START " + description + ": " + commandLine);

    const juce::String processDescription = (sessionId.isNotEmpty() ? "[" + sessionId + "] " : juce::String())
                                          + description;
    CommandResult result = runProcess(argv, streamFlags, processDescription);

    const juce::String finishTimeString = juce::Time::getCurrentTime().toString(true, true);

    if (commandLogFile != juce::File())
    {
        juce::String text;
        text << "Started: " << startTimeString << "\n"
             << "Command: " << commandLine << "\n"
             << "------------------------------------------------------------\n"
             << result.output.replace("\r", "\n") << "\n"
             << "------------------------------------------------------------\n"
             << "Finished: " << finishTimeString << "\n"
             << "Exit code: " << (result.started ? juce::String(result.exitCode) : juce::String("not started")) << "\n";
        commandLogFile.replaceWithText(text);
    }

    writeToAggregateLog(commandIndexLabel + " [" + finishTimeString + "] "
                        + (result.started ? "END exitCode=" + juce::String(result.exitCode) : juce::String("START_FAILED")));

    return result;
}

juce::Result FFmpegExecutor::runFFmpeg(const juce::StringArray& args, const juce::String& description)
{
    juce::StringArray argv;
    argv.add(getFFmpegPath());
    argv.add("-hide_banner");
    argv.add("-nostdin");
    argv.add("-y");
    argv.addArray(args);

    log("ffmpeg: " + description);

    const CommandResult result = runLogged(argv, juce::ChildProcess::wantStdOut | juce::ChildProcess::wantStdErr, description);

    if (! result.started)
    {
        log("ERROR: could not start ffmpeg for " + description);
        return juce::Result::fail(description + " failed: could not start ffmpeg (" + getFFmpegPath() + ")");
    }

    if (result.exitCode != 0)
    {
        log("FFmpeg error (exit code: " + juce::String(result.exitCode) + ") during " + description);

        juce::String message = description + " failed (ffmpeg exit code " + juce::String(result.exitCode) + ")";
        const juce::String tail = tailOfOutput(result.output);
        if (tail.isNotEmpty())
            message << "\n" << tail;

        return juce::Result::fail(message);
    }

    return juce::Result::ok();
}

CommandResult FFmpegExecutor::runFFprobe(const juce::StringArray& args)
{
    juce::StringArray argv;
    argv.add(getFFprobePath());
    argv.addArray(args);

    return runLogged(argv, juce::ChildProcess::wantStdOut, "ffprobe");
}

bool FFmpegExecutor::checkFFmpegAvailability()
{
    juce::StringArray argv;
    argv.add(getFFmpegPath());
    argv.add("-version");

    return runLogged(argv, juce::ChildProcess::wantStdOut, "ffmpeg -version").succeeded();
}

CommandResult FFmpegExecutor::runProcess(const juce::StringArray& argv, int streamFlags, const juce::String& description)
{
    ProcessTask task(argv, streamFlags, description);
    return task.runAndWait();
}

//==============================================================================
juce::String FFmpegExecutor::getFFmpegPath() const
{
    return ffmpegOverride.isNotEmpty() ? ffmpegOverride : findExecutable("ffmpeg");
}

juce::String FFmpegExecutor::getFFprobePath() const
{
    return ffprobeOverride.isNotEmpty() ? ffprobeOverride : findExecutable("ffprobe");
}

juce::String FFmpegExecutor::formatCommand(const juce::StringArray& argv)
{
    juce::StringArray parts;
    for (auto arg : argv)
    {
        if (arg.isEmpty() || arg.containsAnyOf(" \"'"))
            parts.add("\"" + arg.replace("\"", "\\\"") + "\"");
        else
            parts.add(arg);
    }
    return parts.joinIntoString(" ");
}
