//==============================================================================
/**
 * @file FFmpegExecutor.cpp
 *
 * Implementation file for the FFmpegExecutor class, which handles running
 * FFmpeg and FFprobe as external processes and recording their output.
 */

#include "FFmpegExecutor.h"

namespace
{
    /**
     * Kills a child process if it is still running when the timeout expires.
     * Destroying the watchdog disarms it.
     */
    class ProcessWatchdog : private juce::Thread
    {
    public:
        ProcessWatchdog(juce::ChildProcess& processToWatch, int timeoutMs)
            : Thread("ProcessWatchdog"),
              process(processToWatch),
              timeoutMs(timeoutMs)
        {
            startThread();
        }

        ~ProcessWatchdog() override
        {
            signalThreadShouldExit();
            notify();
            stopThread(2000);
        }

        bool hasFired() const { return fired.load(); }

    private:
        void run() override
        {
            if (wait(timeoutMs) || threadShouldExit())
                return;

            fired.store(true);
            process.kill();
        }

        juce::ChildProcess& process;
        const int timeoutMs;
        std::atomic<bool> fired { false };
    };

    juce::String findToolBinary(const juce::String& overridePath, const juce::String& toolName)
    {
        if (overridePath.isNotEmpty())
            return overridePath;

        // A binary shipped next to the worker wins over the system PATH
        juce::File appDir = juce::File::getSpecialLocation(juce::File::currentExecutableFile).getParentDirectory();
       #if JUCE_WINDOWS
        juce::File localTool = appDir.getChildFile(toolName + ".exe");
       #else
        juce::File localTool = appDir.getChildFile(toolName);
       #endif

        if (localTool.existsAsFile())
            return localTool.getFullPathName();

        return toolName;
    }
}

//==============================================================================
FFmpegExecutor::FFmpegExecutor(ProcessManager* processManager)
    : processManager(processManager)
{
}

FFmpegExecutor::~FFmpegExecutor()
{
}

//==============================================================================
void FFmpegExecutor::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

void FFmpegExecutor::setToolPaths(const juce::String& ffmpegPath, const juce::String& ffprobePath)
{
    ffmpegPathOverride = ffmpegPath.trim();
    ffprobePathOverride = ffprobePath.trim();
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

    if (!directory.isDirectory() && !directory.createDirectory())
        return;

    sessionLogDirectory = directory;
    sessionAggregateLogFile = sessionLogDirectory.getChildFile("ffmpeg.log");
    if (sessionAggregateLogFile.existsAsFile())
        sessionAggregateLogFile.deleteFile();

    sessionLoggingEnabled = sessionLogDirectory.isDirectory();
}

//==============================================================================
juce::File FFmpegExecutor::getNextCommandLogFile(int& outIndex)
{
    juce::ScopedLock sl(logDirectoryLock);

    if (!sessionLoggingEnabled)
    {
        outIndex = -1;
        return juce::File();
    }

    ++sessionCommandIndex;
    outIndex = sessionCommandIndex;
    return sessionLogDirectory.getChildFile(juce::String::formatted("ffmpeg_%03d.log", sessionCommandIndex));
}

//==============================================================================
void FFmpegExecutor::writeToAggregateLog(const juce::String& message)
{
    juce::ScopedLock sl(logDirectoryLock);

    if (!sessionLoggingEnabled)
        return;

    juce::FileOutputStream stream(sessionAggregateLogFile, 1024);
    if (stream.openedOk())
        stream.writeText(message + "\n", false, false, nullptr);
}

//==============================================================================
void FFmpegExecutor::appendToDiagnosticTail(const juce::String& text)
{
    juce::ScopedLock sl(tailLock);

    diagnosticTail += text.replace("\r", "\n");
    if (diagnosticTail.length() > diagnosticTailLength)
        diagnosticTail = diagnosticTail.getLastCharacters(diagnosticTailLength);
}

void FFmpegExecutor::clearDiagnosticTail()
{
    juce::ScopedLock sl(tailLock);
    diagnosticTail.clear();
}

juce::String FFmpegExecutor::getLastDiagnosticTail() const
{
    juce::ScopedLock sl(tailLock);
    return diagnosticTail;
}

//==============================================================================
juce::String FFmpegExecutor::formatCommandLine(const juce::String& program, const juce::StringArray& arguments)
{
    juce::StringArray printable;
    printable.add(program);

    for (const auto& argument : arguments)
    {
        if (argument.isEmpty() || argument.containsAnyOf(" \t\"'[];,"))
            printable.add(argument.quoted());
        else
            printable.add(argument);
    }

    return printable.joinIntoString(" ");
}

//==============================================================================
bool FFmpegExecutor::executeCommand(const juce::StringArray& arguments)
{
    const juce::String program = getFFmpegPath();
    const juce::String printableCommand = formatCommandLine(program, arguments);
    const juce::String startTimeString = juce::Time::getCurrentTime().toString(true, true);

    {
        juce::ScopedLock sl(tailLock);
        diagnosticTail.clear();
        lastExitCode = -1;
    }

    int commandLogIndex = -1;
    juce::File commandLogFile = getNextCommandLogFile(commandLogIndex);
    std::unique_ptr<juce::FileOutputStream> commandLogStream;
    const juce::String commandIndexLabel = (commandLogIndex > 0)
        ? juce::String::formatted("#%03d", commandLogIndex)
        : juce::String("#---");

    if (commandLogFile != juce::File())
    {
        auto stream = std::make_unique<juce::FileOutputStream>(commandLogFile);
        if (stream->openedOk())
        {
            stream->writeText("Started: " + startTimeString + "\n", false, false, nullptr);
            stream->writeText("Command: " + printableCommand + "\n", false, false, nullptr);
            stream->writeText("------------------------------------------------------------\n", false, false, nullptr);
            stream->flush();
            commandLogStream = std::move(stream);
        }
    }

    writeToAggregateLog(commandIndexLabel + " [" + startTimeString + "] START " + printableCommand);

    if (logCallback)
        logCallback("FFmpeg " + commandIndexLabel + ": " + printableCommand);

    juce::StringArray commandLine;
    commandLine.add(program);
    commandLine.addArray(arguments);

    ManagedChildProcess process(processManager, "ffmpeg " + commandIndexLabel);

    if (!process.start(commandLine))
    {
        appendToDiagnosticTail("Failed to start " + program);

        if (commandLogStream != nullptr)
        {
            commandLogStream->writeText("Failed to start FFmpeg process\n", false, false, nullptr);
            commandLogStream->flush();
        }

        writeToAggregateLog(commandIndexLabel + " [" + juce::Time::getCurrentTime().toString(true, true) + "] START_FAILED");

        if (logCallback)
            logCallback("ERROR: could not start " + program);

        return false;
    }

    bool timedOut = false;
    int exitCode = -1;

    {
        ProcessWatchdog watchdog(process, commandTimeoutMs);

        // Reads until FFmpeg closes its output, which happens when it exits or is killed
        char buffer[1024];
        for (;;)
        {
            const int bytesRead = process.readProcessOutput(buffer, (int) sizeof(buffer));
            if (bytesRead <= 0)
                break;

            const juce::String output = UTF8String::fromRawBuffer(buffer, bytesRead);
            appendToDiagnosticTail(output);

            if (commandLogStream != nullptr)
                commandLogStream->writeText(output.replace("\r", "\n"), false, false, nullptr);
        }

        process.waitForProcessToFinish(5000);
        timedOut = watchdog.hasFired();
    }

    if (timedOut)
    {
        appendToDiagnosticTail("\nFFmpeg timed out after " + juce::String(commandTimeoutMs / 1000) + " seconds");
    }
    else if (!process.isRunning())
    {
        exitCode = (int) process.getExitCode();
    }
    else
    {
        process.kill();
        appendToDiagnosticTail("\nFFmpeg did not exit after closing its output");
    }

    {
        juce::ScopedLock sl(tailLock);
        lastExitCode = exitCode;
    }

    if (exitCode != 0 && logCallback)
    {
        logCallback("ERROR: FFmpeg failed (exit code: " + juce::String(exitCode) + ")");
        if (exitCode == 28)
            logCallback("No space left on device");
    }

    const juce::String finishTimeString = juce::Time::getCurrentTime().toString(true, true);
    if (commandLogStream != nullptr)
    {
        commandLogStream->writeText("\n------------------------------------------------------------\n", false, false, nullptr);
        commandLogStream->writeText("Finished: " + finishTimeString + "\n", false, false, nullptr);
        commandLogStream->writeText("Exit code: " + juce::String(exitCode) + (timedOut ? " (timed out)" : "") + "\n", false, false, nullptr);
        commandLogStream->flush();
    }
    writeToAggregateLog(commandIndexLabel + " [" + finishTimeString + "] END exitCode=" + juce::String(exitCode));

    if (exitCode == 0)
        clearDiagnosticTail();

    return exitCode == 0;
}

//==============================================================================
juce::String FFmpegExecutor::executeProbe(const juce::StringArray& arguments)
{
    juce::StringArray commandLine;
    commandLine.add(getFFprobePath());
    commandLine.addArray(arguments);

    ManagedChildProcess process(processManager, "ffprobe");

    // Probe diagnostics are not interesting, only what ffprobe prints to stdout
    if (!process.start(commandLine, juce::ChildProcess::wantStdOut))
    {
        if (logCallback)
            logCallback("WARNING: could not start " + commandLine[0]);
        return {};
    }

    ProcessWatchdog watchdog(process, probeTimeoutMs);
    const juce::String output = UTF8String::readAllProcessOutput(process);
    process.waitForProcessToFinish(5000);

    if (watchdog.hasFired())
    {
        if (logCallback)
            logCallback("WARNING: ffprobe timed out: " + formatCommandLine(commandLine[0], arguments));
        return {};
    }

    return output;
}

//==============================================================================
juce::String FFmpegExecutor::getFFmpegPath() const
{
    return findToolBinary(ffmpegPathOverride, "ffmpeg");
}

juce::String FFmpegExecutor::getFFprobePath() const
{
    return findToolBinary(ffprobePathOverride, "ffprobe");
}

//==============================================================================
bool FFmpegExecutor::checkFFmpegAvailability()
{
    juce::ChildProcess process;

    if (process.start(juce::StringArray { getFFmpegPath(), "-version" }))
    {
        const juce::String output = UTF8String::readAllProcessOutput(process);
        process.waitForProcessToFinish(2000);
        return process.getExitCode() == 0 && output.containsIgnoreCase("ffmpeg");
    }

    return false;
}

//==============================================================================
bool FFmpegExecutor::isNVENCAvailable()
{
    juce::ChildProcess process;

    if (process.start(juce::StringArray { getFFmpegPath(), "-hide_banner", "-encoders" }))
    {
        const juce::String output = UTF8String::readAllProcessOutput(process);
        process.waitForProcessToFinish(2000);
        return output.contains("h264_nvenc");
    }

    return false;
}

//==============================================================================
double FFmpegExecutor::getFileDuration(const juce::File& file)
{
    if (!file.existsAsFile())
        return 0.0;

    const juce::String output = executeProbe({ "-v", "error",
                                               "-show_entries", "format=duration",
                                               "-of", "default=noprint_wrappers=1:nokey=1",
                                               file.getFullPathName() }).trim();

    const double duration = output.getDoubleValue();
    return (duration > 0.0) ? duration : 0.0;
}

juce::String FFmpegExecutor::describeVideoStream(const juce::File& file)
{
    if (!file.existsAsFile())
        return {};

    return executeProbe({ "-v", "error",
                          "-select_streams", "v:0",
                          "-show_entries", "stream=r_frame_rate,avg_frame_rate,time_base",
                          "-of", "default=nk=1:nw=1",
                          file.getFullPathName() }).trim();
}
