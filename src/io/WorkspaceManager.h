#pragma once
#include <JuceHeader.h>

/**
 * Allocates per-job scratch directories under a shared root and removes them again.
 *
 * Each acquisition gets a fresh directory named render_<jobId>_<random>, so two jobs
 * never share one, even when a caller reuses a job id. Removal failures are logged,
 * never returned.
 */
class WorkspaceManager
{
public:
    explicit WorkspaceManager(const juce::File& rootDirectory);

    /**
     * Creates an empty directory owned by this job.
     * @param workspace Receives the new directory on success
     */
    juce::Result acquire(const juce::String& jobId, juce::File& workspace);

    /** Recursively deletes a directory previously returned by acquire(). */
    void release(const juce::File& workspace);

    /**
     * Removes render_* directories older than maxAge, left behind by a process that
     * died mid-job. Returns the number removed.
     */
    int sweepStaleWorkspaces(juce::RelativeTime maxAge);

    const juce::File& getRoot() const { return root; }

    /** Reduces a job id to characters that are safe in a directory name */
    static juce::String sanitiseJobId(const juce::String& jobId);

private:
    juce::File root;
    juce::CriticalSection lock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(WorkspaceManager)
};

//==============================================================================
/**
 * Holds an acquired workspace and releases it when it goes out of scope.
 */
class ScopedWorkspace
{
public:
    ScopedWorkspace(WorkspaceManager& manager, const juce::String& jobId)
        : manager(manager),
          result(manager.acquire(jobId, directory))
    {
    }

    ~ScopedWorkspace()
    {
        release();
    }

    /** Releases early; later calls and the destructor do nothing. */
    void release()
    {
        if (directory != juce::File())
        {
            manager.release(directory);
            directory = juce::File();
        }
    }

    const juce::Result& getResult() const { return result; }
    const juce::File& getDirectory() const { return directory; }

private:
    WorkspaceManager& manager;
    juce::File directory;
    juce::Result result;

    JUCE_DECLARE_NON_COPYABLE(ScopedWorkspace)
};
