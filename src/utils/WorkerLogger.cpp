#include "WorkerLogger.h"

WorkerLogger::WorkerLogger(const juce::File& logDirectory)
{
    if (logDirectory == juce::File() || logDirectory.createDirectory().failed())
        return;

    logFile = logDirectory.getChildFile("worker.log");
    fileStream = std::make_unique<juce::FileOutputStream>(logFile);

    if (fileStream->openedOk())
    {
        const juce::String header = "Worker log started at " + juce::Time::getCurrentTime().toString(true, true) + "\n";
        fileStream->writeText(header, false, false, nullptr);
        fileStream->flush();
    }
    else
    {
        fileStream.reset();
        logFile = juce::File();
    }
}

WorkerLogger::~WorkerLogger()
{
    juce::ScopedLock lock(writeLock);
    if (fileStream != nullptr && fileStream->openedOk())
        fileStream->flush();
}

void WorkerLogger::logMessage(const juce::String& message)
{
    const juce::String line = juce::Time::getCurrentTime().toString(true, true) + " | " + message;

    juce::ScopedLock lock(writeLock);

    if (fileStream != nullptr && fileStream->openedOk())
    {
        fileStream->writeText(line + "\n", false, false, nullptr);
        fileStream->flush();
    }

    juce::Logger::outputDebugString(line);
}
