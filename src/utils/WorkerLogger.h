#pragma once
#include <JuceHeader.h>

/**
 * Process-wide logger: every line is timestamped into worker.log inside the log
 * directory and mirrored to stderr.
 *
 * Install it with juce::Logger::setCurrentLogger() for the lifetime of main().
 */
class WorkerLogger : public juce::Logger
{
public:
    /**
     * @param logDirectory Created if needed; when it cannot be written, only stderr is used
     */
    explicit WorkerLogger(const juce::File& logDirectory);
    ~WorkerLogger() override;

    void logMessage(const juce::String& message) override;

    /** The file being written, or a non-existent File when file logging is off */
    const juce::File& getLogFile() const { return logFile; }

private:
    juce::File logFile;
    std::unique_ptr<juce::FileOutputStream> fileStream;
    juce::CriticalSection writeLock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(WorkerLogger)
};
