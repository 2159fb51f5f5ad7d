/*
  ==============================================================================
    Main.cpp - Application Entry Point
  ==============================================================================
*/

#include <juce_core/juce_core.h>
#include "ProcessManager.h"
#include "PipelineSettings.h"
#include "JobFile.h"
#include "../rendering/AssetProber.h"
#include "../rendering/BeatSyncPipeline.h"
#include "../rendering/ClientRegistry.h"
#include "../rendering/ClipAssigner.h"
#include "../rendering/ClipSplitter.h"
#include "../rendering/SessionRunner.h"
#include "../utils/SessionLog.h"

#ifndef BEATCUT_VERSION
 #define BEATCUT_VERSION "1.0.0"
#endif

namespace
{
    const char* const valueOptions[] = { "--settings", "--resolution", "--output", "--workspace" };

    //==========================================================================
    /** Installs the application file logger for the lifetime of a command. */
    class ScopedApplicationLog
    {
    public:
        explicit ScopedApplicationLog(const juce::File& logDirectory)
        {
            juce::File logsDirectory = logDirectory;
            if (! logsDirectory.isDirectory() && logsDirectory.createDirectory().failed())
                logsDirectory = juce::File::getSpecialLocation(juce::File::tempDirectory);

            juce::File logFile = logsDirectory.getChildFile(SessionLog::getApplicationLogFileName(juce::Time::getCurrentTime()));

            fileLogger.reset(new juce::FileLogger(logFile, "BeatCut Session Log", 0));
            juce::Logger::setCurrentLogger(fileLogger.get());

            juce::Logger::writeToLog("----------------------------------------------------");
            juce::Logger::writeToLog("Application started: " + juce::Time::getCurrentTime().toString(true, true));
            juce::Logger::writeToLog("Version: " BEATCUT_VERSION);
            juce::Logger::writeToLog("----------------------------------------------------");
        }

        ~ScopedApplicationLog()
        {
            juce::Logger::writeToLog("----------------------------------------------------");
            juce::Logger::writeToLog("Application shutting down: " + juce::Time::getCurrentTime().toString(true, true));
            juce::Logger::writeToLog("----------------------------------------------------");

            const int terminated = ProcessManager::getInstance().terminateAllProcesses();
            if (terminated > 0)
                juce::Logger::writeToLog("Terminated " + juce::String(terminated) + " leftover process(es)");

            juce::Logger::setCurrentLogger(nullptr);
            fileLogger = nullptr;
        }

    private:
        std::unique_ptr<juce::FileLogger> fileLogger;

        JUCE_DECLARE_NON_COPYABLE(ScopedApplicationLog)
    };

    //==========================================================================
    /** Applies --settings and the override options, removing them from the list. */
    PipelineSettings loadSettings(juce::ArgumentList& args)
    {
        PipelineSettings settings;

        if (args.containsOption("--settings"))
        {
            const auto settingsFile = juce::File::getCurrentWorkingDirectory().getChildFile(args.removeValueForOption("--settings"));
            const auto loaded = settings.loadFromFile(settingsFile);
            if (loaded.failed())
                juce::ConsoleApplication::fail(loaded.getErrorMessage());
        }

        if (args.containsOption("--resolution"))
            settings.resolution = args.removeValueForOption("--resolution");

        if (args.containsOption("--output"))
            settings.outputDirectory = juce::File::getCurrentWorkingDirectory().getChildFile(args.removeValueForOption("--output"));

        if (args.containsOption("--workspace"))
            settings.workspaceRoot = juce::File::getCurrentWorkingDirectory().getChildFile(args.removeValueForOption("--workspace"));

        const auto valid = settings.validate();
        if (valid.failed())
            juce::ConsoleApplication::fail(valid.getErrorMessage());

        return settings;
    }

    /** The arguments after the command option itself, with value options already removed. */
    juce::StringArray getPositionalArguments(const juce::ArgumentList& args, const juce::String& commandOption)
    {
        juce::StringArray positional;

        for (const auto& arg : args.arguments)
        {
            if (arg == commandOption)
                continue;

            for (auto* option : valueOptions)
                if (arg.isLongOption(option))
                    juce::ConsoleApplication::fail("Missing value for " + juce::String(option));

            positional.add(arg.text);
        }

        return positional;
    }

    juce::File resolvePath(const juce::String& path)
    {
        return juce::File::getCurrentWorkingDirectory().getChildFile(path);
    }

    void print(const juce::var& object)
    {
        ConsoleStatusChannel().deliver(juce::JSON::toString(object, true));
    }

    //==========================================================================
    juce::var makeAssetVar(const BeatSyncTypes::MediaAsset& asset)
    {
        auto* object = new juce::DynamicObject();
        object->setProperty("id", asset.id);
        object->setProperty("name", asset.originalName);
        object->setProperty("path", asset.storagePath.getFullPathName());
        object->setProperty("valid", asset.isValid);
        object->setProperty("duration", asset.durationSeconds);
        object->setProperty("hasAudio", asset.hasAudio);
        if (asset.validationError.isNotEmpty())
            object->setProperty("error", asset.validationError);
        return juce::var(object);
    }

    juce::var makeResultVar(const juce::String& jobName, const BeatSyncTypes::PipelineResult& result)
    {
        auto* object = new juce::DynamicObject();
        object->setProperty("type", "result");
        object->setProperty("job", jobName);
        object->setProperty("sessionId", result.sessionId);
        object->setProperty("success", result.result.wasOk());
        object->setProperty("status", result.statusCode);
        object->setProperty("message", result.result.wasOk() ? juce::String("Video processing complete")
                                                             : result.result.getErrorMessage());

        if (result.outputFile != juce::File())
            object->setProperty("outputFile", result.outputFile.getFullPathName());

        juce::Array<juce::var> assignments;
        for (size_t i = 0; i < result.assignments.size(); ++i)
        {
            const auto& assignment = result.assignments[i];
            auto* entry = new juce::DynamicObject();
            entry->setProperty("interval", assignment.intervalIndex);
            entry->setProperty("duration", result.intervals[(size_t) assignment.intervalIndex].durationSeconds);
            entry->setProperty("assetId", assignment.assetId);

            for (const auto& asset : result.assets)
                if (asset.id == assignment.assetId)
                    entry->setProperty("assetName", asset.originalName);

            if (i < result.segments.size())
            {
                entry->setProperty("extended", result.segments[i].extended);
                entry->setProperty("underrun", result.segments[i].underrun);
                entry->setProperty("renderedDuration", result.segments[i].renderedSeconds);
            }

            assignments.add(juce::var(entry));
        }
        object->setProperty("assignments", assignments);

        return juce::var(object);
    }

    //==========================================================================
    void runProcessCommand(const juce::ArgumentList& commandArgs)
    {
        juce::ArgumentList args(commandArgs);
        const auto settings = loadSettings(args);
        const auto jobFiles = getPositionalArguments(args, "--process");

        if (jobFiles.isEmpty())
            juce::ConsoleApplication::fail("No job files given");

        ScopedApplicationLog applicationLog(settings.logDirectory);
        juce::Logger::writeToLog("Settings: " + juce::JSON::toString(settings.toVar(), true));

        auto channel = std::make_shared<ConsoleStatusChannel>();
        ClientRegistry registry;
        std::atomic<int> failures { 0 };

        SessionRunner runner(settings, registry);
        runner.setCompletionCallback([&failures](const juce::String& jobName, const BeatSyncTypes::PipelineResult& result)
        {
            if (result.result.failed())
                ++failures;

            print(makeResultVar(jobName, result));
        });

        for (const auto& jobPath : jobFiles)
        {
            BeatSyncTypes::SessionRequest request;
            const auto loaded = JobFile::load(resolvePath(jobPath), request);

            if (loaded.failed())
            {
                BeatSyncTypes::PipelineResult rejected;
                rejected.result = loaded;
                rejected.statusCode = 400;
                ++failures;
                print(makeResultVar(jobPath, rejected));
                continue;
            }

            const auto clientId = registry.connect(channel);
            runner.submit(jobPath, request, clientId);
        }

        runner.waitForAll();

        if (failures.load() > 0)
            juce::ConsoleApplication::fail(juce::String(failures.load()) + " of " + juce::String(jobFiles.size()) + " session(s) failed");
    }

    void runValidateCommand(const juce::ArgumentList& commandArgs)
    {
        juce::ArgumentList args(commandArgs);
        const auto settings = loadSettings(args);
        const auto positional = getPositionalArguments(args, "--validate");

        if (positional.size() != 1)
            juce::ConsoleApplication::fail("Expected exactly one job file");

        ScopedApplicationLog applicationLog(settings.logDirectory);

        BeatSyncTypes::SessionRequest request;
        const auto loaded = JobFile::load(resolvePath(positional[0]), request);
        if (loaded.failed())
            juce::ConsoleApplication::fail(loaded.getErrorMessage());

        ClientRegistry registry;
        const auto clientId = registry.connect(std::make_shared<ConsoleStatusChannel>());

        BeatSyncPipeline pipeline(settings, StatusPublisher(registry, clientId));
        const auto result = pipeline.validateOnly(request);

        auto* object = new juce::DynamicObject();
        object->setProperty("type", "validation");
        object->setProperty("success", result.result.wasOk());
        object->setProperty("status", result.statusCode);

        juce::Array<juce::var> files;
        for (const auto& asset : result.assets)
            files.add(makeAssetVar(asset));
        object->setProperty("files", files);

        print(juce::var(object));

        if (result.result.failed())
            juce::ConsoleApplication::fail(result.result.getErrorMessage());
    }

    void runProbeCommand(const juce::ArgumentList& commandArgs)
    {
        juce::ArgumentList args(commandArgs);
        const auto settings = loadSettings(args);
        const auto positional = getPositionalArguments(args, "--probe");

        if (positional.isEmpty())
            juce::ConsoleApplication::fail("No media file given");

        FFmpegExecutor executor;
        executor.setExecutablePaths(settings.ffmpegPath, settings.ffprobePath);
        AssetProber prober(&executor);

        const auto spec = settings.makeEncodeSpec();
        int failed = 0;

        for (const auto& path : positional)
        {
            AssetProber::Metadata metadata;
            const auto file = resolvePath(path);
            const auto probed = prober.probe(file, metadata);

            auto* object = new juce::DynamicObject();
            object->setProperty("type", "probe");
            object->setProperty("file", file.getFullPathName());
            object->setProperty("success", probed.wasOk());

            if (probed.wasOk())
            {
                object->setProperty("duration", metadata.durationSeconds);
                object->setProperty("width", metadata.width);
                object->setProperty("height", metadata.height);
                object->setProperty("frameRate", metadata.frameRate.toString());
                object->setProperty("videoCodec", metadata.videoCodec);
                object->setProperty("hasAudio", metadata.hasAudio);
                object->setProperty("audioCodec", metadata.audioCodec);
                object->setProperty("needsReencode", AssetProber::needsReencode(metadata, spec));
            }
            else
            {
                object->setProperty("error", probed.getErrorMessage());
                ++failed;
            }

            print(juce::var(object));
        }

        if (failed > 0)
            juce::ConsoleApplication::fail(juce::String(failed) + " file(s) could not be probed");
    }

    void runIntervalsCommand(const juce::ArgumentList& commandArgs)
    {
        juce::ArgumentList args(commandArgs);
        const auto settings = loadSettings(args);

        std::vector<double> beats;
        const auto parsed = JobFile::parseBeatList(getPositionalArguments(args, "--intervals"), beats);
        if (parsed.failed())
            juce::ConsoleApplication::fail(parsed.getErrorMessage());

        const auto valid = ClipAssigner::validateBeats(beats);
        if (valid.failed())
            juce::ConsoleApplication::fail(valid.getErrorMessage());

        juce::Array<juce::var> list;
        for (const auto& interval : ClipAssigner::deriveIntervals(beats, settings.tailDurationSeconds))
        {
            auto* entry = new juce::DynamicObject();
            entry->setProperty("index", interval.index);
            entry->setProperty("duration", interval.durationSeconds);
            entry->setProperty("tail", interval.isTail);
            list.add(juce::var(entry));
        }

        auto* object = new juce::DynamicObject();
        object->setProperty("type", "intervals");
        object->setProperty("intervals", list);
        print(juce::var(object));
    }

    void runSplitCommand(const juce::ArgumentList& commandArgs)
    {
        juce::ArgumentList args(commandArgs);
        const auto settings = loadSettings(args);
        const auto positional = getPositionalArguments(args, "--split");

        if (positional.size() < 2)
            juce::ConsoleApplication::fail("Usage: --split <seconds> <video> [<video> ...]");

        if (! positional[0].containsOnly("0123456789.") || positional[0].getDoubleValue() <= 0.0)
            juce::ConsoleApplication::fail("Invalid clip duration: " + positional[0]);

        const double clipDuration = positional[0].getDoubleValue();

        ScopedApplicationLog applicationLog(settings.logDirectory);

        std::vector<BeatSyncTypes::MediaAsset> assets;
        for (int i = 1; i < positional.size(); ++i)
        {
            BeatSyncTypes::MediaAsset asset;
            asset.id = "asset_" + juce::String(i - 1);
            asset.storagePath = resolvePath(positional[i]);
            asset.originalName = asset.storagePath.getFileName();
            assets.push_back(asset);
        }

        ClientRegistry registry;
        const auto clientId = registry.connect(std::make_shared<ConsoleStatusChannel>());
        StatusPublisher publisher(registry, clientId);

        const auto sessionId = juce::Uuid().toString();
        SessionLog sessionLog(settings.logDirectory, sessionId);
        const auto logOpened = sessionLog.open();
        if (logOpened.failed())
            juce::Logger::writeToLog("WARNING: session log unavailable: " + logOpened.getErrorMessage());

        FFmpegExecutor executor;
        executor.setExecutablePaths(settings.ffmpegPath, settings.ffprobePath);
        executor.setSessionId(sessionId);
        executor.setLogCallback(sessionLog.makeCallback());
        if (logOpened.wasOk())
            executor.setSessionLogDirectory(sessionLog.getFFmpegLogDirectory());

        AssetProber prober(&executor);
        ClipSplitter splitter(&executor, &prober);
        splitter.setEncodeSpec(settings.makeEncodeSpec());
        splitter.setLogCallback(sessionLog.makeCallback());
        splitter.setStatusCallback([&publisher](const juce::String& message) { publisher.status(message); });

        ProgressReporter progress(settings.progress);
        progress.setEventCallback([&publisher](const BeatSyncTypes::ProgressEvent& event) { publisher.progress(event); });
        progress.beginSession();

        const juce::File outputDirectory = settings.outputDirectory.getChildFile("clips_" + sessionId);
        std::vector<ClipSplitter::Clip> clips;
        const auto split = splitter.split(assets, clipDuration, outputDirectory, clips, &progress);

        if (split.failed())
            publisher.status("Error: " + split.getErrorMessage());
        else
            progress.finish();

        executor.setSessionLogDirectory(juce::File());

        auto* object = new juce::DynamicObject();
        object->setProperty("type", "result");
        object->setProperty("success", split.wasOk());
        object->setProperty("status", split.wasOk() ? 200 : 500);
        object->setProperty("message", split.wasOk() ? juce::String("Clips generated successfully") : split.getErrorMessage());
        object->setProperty("outputDirectory", outputDirectory.getFullPathName());

        juce::Array<juce::var> clipList;
        for (const auto& clip : clips)
        {
            auto* entry = new juce::DynamicObject();
            entry->setProperty("filename", clip.file.getFileName());
            entry->setProperty("originalName", clip.originalName);
            entry->setProperty("start", clip.startSeconds);
            clipList.add(juce::var(entry));
        }
        object->setProperty("clips", clipList);
        print(juce::var(object));

        if (split.failed())
            juce::ConsoleApplication::fail(split.getErrorMessage());
    }
}

//==============================================================================
int main(int argc, char* argv[])
{
    juce::ConsoleApplication app;

    app.addHelpCommand("--help|-h", "BeatCut - cuts source clips onto a beat track and lays the track under them.\n"
                                    "Global options: --settings <file> --resolution <720p|1080p> --output <dir> --workspace <dir>", true);
    app.addVersionCommand("--version|-v", "BeatCut " BEATCUT_VERSION);

    app.addCommand({ "--process",
                     "--process <job.json> [<job.json> ...]",
                     "Runs full sessions, one per job file, concurrently.",
                     "Validates the job's videos, assigns one clip per beat interval, renders, concatenates and muxes the audio.\n"
                     "Status and progress events stream to stdout as JSON lines; each session ends with a result line.",
                     runProcessCommand });

    app.addCommand({ "--validate",
                     "--validate <job.json>",
                     "Probes and standardizes the job's videos only.",
                     {},
                     runValidateCommand });

    app.addCommand({ "--probe",
                     "--probe <media file> [<media file> ...]",
                     "Prints what ffprobe reports for each file.",
                     {},
                     runProbeCommand });

    app.addCommand({ "--intervals",
                     "--intervals <beat> <beat> [...]",
                     "Prints the beat intervals a beat track produces.",
                     {},
                     runIntervalsCommand });

    app.addCommand({ "--split",
                     "--split <seconds> <video> [<video> ...]",
                     "Cuts videos into back-to-back clips of a fixed length.",
                     {},
                     runSplitCommand });

    return app.findAndRunCommand(argc, argv);
}
