#pragma once
#include <JuceHeader.h>

/**
 * Keeps track of every encoder process the worker has spawned.
 *
 * Jobs are never cancelled mid-encode, so the only caller of terminateAllProcesses()
 * is the shutdown path once its grace period for running jobs has expired.
 * One instance is created in main() and handed to every FFmpegExecutor.
 */
class ProcessManager
{
public:
    ProcessManager() = default;

    /**
     * Registers a process with the manager
     * @param process A pointer to the process to register
     * @param description Optional description for logging
     */
    void registerProcess(juce::ChildProcess* process, const juce::String& description = "")
    {
        juce::ScopedLock lock(criticalSection);
        activeProcesses.addIfNotAlreadyThere(process);
        processDescriptions.set(process, description);
    }

    /**
     * Unregisters a process when it's being destroyed
     * @param process The process to unregister
     */
    void unregisterProcess(juce::ChildProcess* process)
    {
        juce::ScopedLock lock(criticalSection);
        activeProcesses.removeFirstMatchingValue(process);
        processDescriptions.remove(process);
    }

    int getNumActiveProcesses() const
    {
        juce::ScopedLock lock(criticalSection);
        return activeProcesses.size();
    }

    /**
     * Terminates all registered processes
     */
    void terminateAllProcesses()
    {
        juce::ScopedLock lock(criticalSection);
        int count = 0;

        juce::Logger::writeToLog("Terminating all processes (" + juce::String(activeProcesses.size()) + " total)");

        for (auto* process : activeProcesses)
        {
            if (process != nullptr && process->isRunning())
            {
                juce::Logger::writeToLog("Terminating process: " + processDescriptions[process]);
                process->kill();
                count++;
            }
        }

        activeProcesses.clear();
        processDescriptions.clear();

        juce::Logger::writeToLog("Terminated " + juce::String(count) + " processes");
    }

private:
    juce::Array<juce::ChildProcess*> activeProcesses;
    juce::HashMap<juce::ChildProcess*, juce::String> processDescriptions;
    juce::CriticalSection criticalSection;

    JUCE_DECLARE_NON_COPYABLE(ProcessManager)
};

/**
 * Wrapper for ChildProcess that registers/unregisters itself with a ProcessManager
 * for its whole lifetime. A null manager makes it a plain ChildProcess.
 */
class ManagedChildProcess : public juce::ChildProcess
{
public:
    ManagedChildProcess(ProcessManager* manager, const juce::String& description = "")
        : manager(manager)
    {
        if (manager != nullptr)
            manager->registerProcess(this, description);
    }

    ~ManagedChildProcess()
    {
        if (isRunning())
            kill();

        if (manager != nullptr)
            manager->unregisterProcess(this);
    }

private:
    ProcessManager* manager;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ManagedChildProcess)
};
