#pragma once
#include <JuceHeader.h>
#include "../core/ProcessManager.h"

//==============================================================================
/**
 * @file FFmpegExecutor.h
 *
 * This file declares the FFmpegExecutor class which is responsible for running
 * FFmpeg and FFprobe as child processes and capturing what they print.
 *
 * The class handles:
 * - FFmpeg command execution from an explicit argument list
 * - A bounded wall-clock timeout per command
 * - Capturing a trailing excerpt of the tool output for failure reports
 * - Per-command log files inside the job's log directory
 * - Querying durations and stream parameters via FFprobe
 */

/**
 * Utility for turning raw process output into JUCE strings.
 *
 * FFmpeg output can contain non-ASCII bytes (file names, metadata) and JUCE's String
 * asserts on 8-bit data unless the encoding is stated, so everything goes through UTF-8.
 */
class UTF8String
{
public:
    static juce::String fromRawBuffer(const char* buffer, int bufferLength)
    {
        if (buffer == nullptr || bufferLength <= 0)
            return juce::String();

        return juce::String::fromUTF8(buffer, bufferLength);
    }

    /**
     * Read all output from a JUCE ChildProcess until it closes its pipe.
     *
     * @param process The JUCE ChildProcess to read output from
     * @return        A UTF-8 encoded JUCE String containing all available output
     */
    static juce::String readAllProcessOutput(juce::ChildProcess& process)
    {
        juce::MemoryOutputStream output;
        char buffer[4096];

        for (;;)
        {
            const int bytesRead = process.readProcessOutput(buffer, (int) sizeof(buffer));
            if (bytesRead <= 0)
                break;

            output.write(buffer, (size_t) bytesRead);
        }

        return fromRawBuffer(static_cast<const char*>(output.getData()), (int) output.getDataSize());
    }
};

//==============================================================================
/**
 * The FFmpegExecutor class handles all interaction with FFmpeg as an external process.
 *
 * @note This class doesn't touch video/audio data. It only runs the tools and reports
 *       results; ClipProcessor and TimelineAssembler decide what the commands are.
 *
 * The command and probe entry points are virtual so tests can substitute a recorder
 * that never launches a real encoder.
 */
class FFmpegExecutor
{
public:
    /** Number of trailing output characters kept for failure reports */
    static constexpr int diagnosticTailLength = 2000;

    /**
     * @param processManager Registry that can terminate running encoders on shutdown (may be null)
     */
    explicit FFmpegExecutor(ProcessManager* processManager = nullptr);

    virtual ~FFmpegExecutor();

    /**
     * Sets a callback function that will be called with log messages.
     */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * Sets the directory where FFmpeg command output should be recorded.
     * A per-command log file plus an aggregate log will be created in this directory.
     */
    void setSessionLogDirectory(const juce::File& directory);

    /**
     * Overrides the tool locations. Empty strings keep the default lookup.
     */
    void setToolPaths(const juce::String& ffmpegPath, const juce::String& ffprobePath);

    /** Wall-clock limit for a single FFmpeg invocation */
    void setCommandTimeoutMs(int timeoutMs) { commandTimeoutMs = timeoutMs; }

    /**
     * Runs FFmpeg with the given arguments (the program itself is prepended).
     *
     * The call blocks until the process exits or the timeout expires. When it fails, the
     * trailing output is available from getLastDiagnosticTail(); a successful run clears it.
     *
     * @param arguments FFmpeg arguments, one token per element
     * @return          true if FFmpeg exited with code 0
     */
    virtual bool executeCommand(const juce::StringArray& arguments);

    /**
     * Runs FFprobe with the given arguments and returns what it printed.
     */
    virtual juce::String executeProbe(const juce::StringArray& arguments);

    /** Trailing output of the last FFmpeg invocation if it failed, otherwise empty */
    juce::String getLastDiagnosticTail() const;

    /** Exit code of the last FFmpeg invocation, or -1 if it never started or timed out */
    int getLastExitCode() const { return lastExitCode; }

    /**
     * Gets the path to the FFmpeg executable.
     *
     * @return The configured path, a binary next to the worker, or "ffmpeg" from PATH
     */
    juce::String getFFmpegPath() const;

    /**
     * Gets the path to the FFprobe executable.
     */
    juce::String getFFprobePath() const;

    /**
     * Checks if FFmpeg is available on the system.
     */
    bool checkFFmpegAvailability();

    /**
     * Checks if NVIDIA hardware encoding (NVENC) is available.
     */
    bool isNVENCAvailable();

    /**
     * Gets the container duration of a media file in seconds using FFprobe.
     *
     * @param file The media file to check
     * @return     The duration in seconds, or 0 if unavailable
     */
    virtual double getFileDuration(const juce::File& file);

    /**
     * Returns FFprobe's r_frame_rate, avg_frame_rate and time_base lines for the first
     * video stream, as printed.
     */
    virtual juce::String describeVideoStream(const juce::File& file);

    /** Joins an argument list into a printable command line, quoting where needed */
    static juce::String formatCommandLine(const juce::String& program, const juce::StringArray& arguments);

protected:
    /** Appends tool output to the tail, keeping only the last diagnosticTailLength characters */
    void appendToDiagnosticTail(const juce::String& text);
    void clearDiagnosticTail();

private:
    juce::File getNextCommandLogFile(int& outIndex);
    void writeToAggregateLog(const juce::String& message);

    ProcessManager* processManager;

    /** Thread-safe mutex for protecting the diagnostic tail */
    juce::CriticalSection tailLock;
    juce::String diagnosticTail;
    int lastExitCode { -1 };

    int commandTimeoutMs { 30 * 60 * 1000 };
    int probeTimeoutMs { 30 * 1000 };

    juce::String ffmpegPathOverride;
    juce::String ffprobePathOverride;

    /** Callback function for reporting log messages */
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
