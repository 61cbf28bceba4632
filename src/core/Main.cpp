/*
  ==============================================================================
    Main.cpp - Worker Entry Point
  ==============================================================================
*/

#include <JuceHeader.h>
#include <csignal>
#include "ProcessManager.h"
#include "WorkerConfig.h"
#include "../delivery/CallbackNotifier.h"
#include "../delivery/ObjectStorage.h"
#include "../io/HttpClient.h"
#include "../io/WorkspaceManager.h"
#include "../rendering/FFmpegExecutor.h"
#include "../rendering/RenderManager.h"
#include "../server/RenderServer.h"
#include "../utils/WorkerLogger.h"

namespace
{
    // How long running jobs may take to finish after SIGINT/SIGTERM before their encoders are killed
    constexpr int shutdownGraceMs = 15 * 60 * 1000;

    // Only the flag is touched inside the handler
    volatile std::sig_atomic_t shutdownRequested = 0;

    void signalHandler(int)
    {
        shutdownRequested = 1;
    }

    void printUsage()
    {
        std::cout << "Usage: storyreel-worker [--port=N] [--workspace=DIR] [--log-dir=DIR]\n"
                     "                        [--format=horizontal|vertical|square]\n"
                     "                        [--quality=basic|standard|pro] [--nvenc]\n";
    }

    int runWorker(const WorkerConfig& config)
    {
        auto validation = config.validate();
        if (validation.failed())
        {
            juce::Logger::writeToLog("ERROR: " + validation.getErrorMessage());
            return 1;
        }

        for (const auto& warning : config.describeWarnings())
            juce::Logger::writeToLog("WARNING: " + warning);

        ProcessManager processManager;
        JuceHttpClient httpClient;
        WorkspaceManager workspaces(config.workspaceRoot);
        S3ObjectStorage storage(httpClient, config.storage);
        CallbackNotifier notifier(httpClient, config.internalSecret);

        const int swept = workspaces.sweepStaleWorkspaces(juce::RelativeTime::hours(config.staleWorkspaceHours));
        if (swept > 0)
            juce::Logger::writeToLog("Removed " + juce::String(swept) + " stale workspaces");

        auto createExecutor = [&processManager, config]
        {
            auto executor = std::make_unique<FFmpegExecutor>(&processManager);
            executor->setToolPaths(config.ffmpegPath, config.ffprobePath);
            return executor;
        };

        {
            auto executor = createExecutor();
            if (!executor->checkFFmpegAvailability())
                juce::Logger::writeToLog("WARNING: FFmpeg was not found at " + executor->getFFmpegPath());
            else if (config.useNvidiaAcceleration && !executor->isNVENCAvailable())
                juce::Logger::writeToLog("WARNING: NVENC requested but unavailable; clips will fall back to libx264");
        }

        RenderEnvironment environment;
        environment.workspaces = &workspaces;
        environment.httpClient = &httpClient;
        environment.storage = &storage;
        environment.notifier = &notifier;
        environment.createExecutor = createExecutor;
        environment.internalSecret = config.internalSecret;
        environment.defaultFormat = config.getOutputFormat();
        environment.defaultQuality = config.getQualityPreset();
        environment.useNvidiaAcceleration = config.useNvidiaAcceleration;
        environment.clipNvidiaParams = config.clipNvidiaParams;
        environment.clipCpuParams = config.clipCpuParams;
        environment.logRoot = config.logDirectory.getChildFile("renders");

        RenderManager renderManager(environment);

        RenderServer::Settings serverSettings;
        serverSettings.port = config.port;
        serverSettings.workerToken = config.workerToken;
        serverSettings.internalSecret = config.internalSecret;

        RenderServer server(renderManager, serverSettings);

        auto started = server.start();
        if (started.failed())
        {
            juce::Logger::writeToLog("ERROR: " + started.getErrorMessage());
            return 1;
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        while (shutdownRequested == 0)
            juce::Thread::sleep(200);

        juce::Logger::writeToLog("Shutdown requested; " + juce::String(renderManager.getActiveJobCount())
                                 + " jobs still running");
        server.stop();

        if (!renderManager.shutdown(shutdownGraceMs))
        {
            processManager.terminateAllProcesses();
            renderManager.shutdown(-1);
        }

        return 0;
    }
}

int main(int argc, char* argv[])
{
    juce::ArgumentList arguments(argc, argv);

    if (arguments.containsOption("--help|-h"))
    {
        printUsage();
        return 0;
    }

    auto config = WorkerConfig::fromEnvironment();
    config.applyArguments(arguments);

    if (config.logDirectory == juce::File())
        config.logDirectory = config.workspaceRoot.getChildFile("logs");

    WorkerLogger logger(config.logDirectory);
    juce::Logger::setCurrentLogger(&logger);

    juce::Logger::writeToLog("----------------------------------------------------");
    juce::Logger::writeToLog("Worker started: " + juce::Time::getCurrentTime().toString(true, true));
    juce::Logger::writeToLog("Version: " + juce::String(ProjectInfo::versionString));
    juce::Logger::writeToLog("Workspace root: " + config.workspaceRoot.getFullPathName());
    juce::Logger::writeToLog("Defaults: " + config.formatName + ", " + config.qualityName
                             + (config.useNvidiaAcceleration ? ", NVENC" : ""));
    juce::Logger::writeToLog("----------------------------------------------------");

    const int exitCode = runWorker(config);

    juce::Logger::writeToLog("Worker stopped: " + juce::Time::getCurrentTime().toString(true, true));
    juce::Logger::setCurrentLogger(nullptr);
    return exitCode;
}
