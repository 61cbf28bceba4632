#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"
#include "RenderManagerCore.h"

/**
 * Accepts render jobs and runs each one on its own RenderManagerCore thread.
 *
 * There is no admission limit: every accepted job starts immediately. Finished jobs
 * are reaped on the next submission and their reports are kept for waitForJob().
 */
class RenderManager
{
public:
    using RenderState = RenderTypes::RenderState;

    enum class SubmitStatus
    {
        Queued,
        Invalid,
        Duplicate,
        ShuttingDown
    };

    /** Number of finished reports remembered for waitForJob() */
    static constexpr int maxFinishedReports = 256;

    explicit RenderManager(const RenderEnvironment& environment);

    /** Waits for every running job. */
    ~RenderManager();

    /**
     * Places the job in the Queued state and starts it. Returns once the job is queued;
     * the pipeline runs on the job's own thread.
     * @param error Receives the reason when the job is not queued
     */
    SubmitStatus submit(const RenderTypes::RenderJob& job, juce::String& error);

    /** True while a job with this id has not reached a terminal state */
    bool isJobRunning(const juce::String& renderId) const;

    int getActiveJobCount() const;

    /**
     * Blocks until the job finishes, then copies its report.
     * @param timeoutMs Maximum wait, or -1 to wait forever
     * @return false if the id is unknown or the job did not finish in time
     */
    bool waitForJob(const juce::String& renderId, int timeoutMs, RenderTypes::CallbackReport& report);

    /** States the job has entered so far; empty for unknown or reaped ids */
    std::vector<RenderState> getStateHistory(const juce::String& renderId) const;

    /**
     * Refuses new jobs and waits for the running ones.
     * @return true if every job finished within the timeout
     */
    bool shutdown(int timeoutMs);

    /** Checks the job fields a render request must carry */
    static juce::Result validateJob(const RenderTypes::RenderJob& job);

private:
    std::shared_ptr<RenderManagerCore> findJob(const juce::String& renderId) const;

    /** Moves finished jobs' reports into finishedReports and drops the jobs. */
    void reapFinishedJobs();

    RenderEnvironment environment;

    mutable juce::CriticalSection lock;
    std::vector<std::shared_ptr<RenderManagerCore>> jobs;
    std::map<juce::String, RenderTypes::CallbackReport> finishedReports;
    juce::StringArray finishedOrder;
    bool acceptingJobs = true;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RenderManager)
};
