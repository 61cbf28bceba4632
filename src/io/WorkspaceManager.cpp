#include "WorkspaceManager.h"

WorkspaceManager::WorkspaceManager(const juce::File& rootDirectory)
    : root(rootDirectory)
{
}

juce::String WorkspaceManager::sanitiseJobId(const juce::String& jobId)
{
    const juce::String cleaned = jobId.retainCharacters("abcdefghijklmnopqrstuvwxyz"
                                                        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                                        "0123456789-_").substring(0, 64);

    return cleaned.isNotEmpty() ? cleaned : juce::String("job");
}

juce::Result WorkspaceManager::acquire(const juce::String& jobId, juce::File& workspace)
{
    juce::ScopedLock sl(lock);

    if (!root.isDirectory())
    {
        auto created = root.createDirectory();
        if (created.failed())
            return juce::Result::fail("Cannot create workspace root " + root.getFullPathName() + ": " + created.getErrorMessage());
    }

    const juce::String prefix = "render_" + sanitiseJobId(jobId) + "_";

    for (int attempt = 0; attempt < 8; ++attempt)
    {
        juce::File candidate = root.getChildFile(prefix + juce::Uuid().toString().substring(0, 8));

        if (candidate.exists())
            continue;

        auto created = candidate.createDirectory();
        if (created.failed())
            return juce::Result::fail("Cannot create workspace " + candidate.getFullPathName() + ": " + created.getErrorMessage());

        workspace = candidate;
        juce::Logger::writeToLog("Workspace acquired: " + workspace.getFullPathName());
        return juce::Result::ok();
    }

    return juce::Result::fail("Cannot allocate a unique workspace for job " + jobId);
}

void WorkspaceManager::release(const juce::File& workspace)
{
    if (!workspace.isAChildOf(root))
    {
        juce::Logger::writeToLog("WARNING: refusing to remove " + workspace.getFullPathName() + " outside the workspace root");
        return;
    }

    if (!workspace.exists())
        return;

    if (!workspace.deleteRecursively() || workspace.exists())
        juce::Logger::writeToLog("WARNING: failed to remove workspace " + workspace.getFullPathName());
    else
        juce::Logger::writeToLog("Workspace released: " + workspace.getFullPathName());
}

int WorkspaceManager::sweepStaleWorkspaces(juce::RelativeTime maxAge)
{
    if (!root.isDirectory())
        return 0;

    const juce::Time cutoff = juce::Time::getCurrentTime() - maxAge;
    int removed = 0;

    for (const auto& directory : root.findChildFiles(juce::File::findDirectories, false, "render_*"))
    {
        if (directory.getLastModificationTime() >= cutoff)
            continue;

        if (directory.deleteRecursively())
            ++removed;
        else
            juce::Logger::writeToLog("WARNING: failed to remove stale workspace " + directory.getFullPathName());
    }

    if (removed > 0)
        juce::Logger::writeToLog("Removed " + juce::String(removed) + " stale workspaces from " + root.getFullPathName());

    return removed;
}
