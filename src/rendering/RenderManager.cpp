#include "RenderManager.h"

RenderManager::RenderManager(const RenderEnvironment& environment)
    : environment(environment)
{
}

RenderManager::~RenderManager()
{
    shutdown(-1);
}

juce::Result RenderManager::validateJob(const RenderTypes::RenderJob& job)
{
    juce::StringArray missing;

    if (job.renderId.trim().isEmpty())    missing.add("renderId");
    if (job.userId.trim().isEmpty())      missing.add("userId");
    if (job.payloadUrl.trim().isEmpty())  missing.add("payloadUrl");
    if (job.callbackUrl.trim().isEmpty()) missing.add("callbackUrl");

    if (!missing.isEmpty())
        return juce::Result::fail("missing required fields: " + missing.joinIntoString(", "));

    return juce::Result::ok();
}

RenderManager::SubmitStatus RenderManager::submit(const RenderTypes::RenderJob& job, juce::String& error)
{
    auto validation = validateJob(job);
    if (validation.failed())
    {
        error = validation.getErrorMessage();
        return SubmitStatus::Invalid;
    }

    if (environment.workspaces == nullptr || environment.httpClient == nullptr || environment.notifier == nullptr)
    {
        error = "render environment is incomplete";
        return SubmitStatus::Invalid;
    }

    std::shared_ptr<RenderManagerCore> core;

    {
        juce::ScopedLock sl(lock);

        if (!acceptingJobs)
        {
            error = "worker is shutting down";
            return SubmitStatus::ShuttingDown;
        }

        reapFinishedJobs();

        for (const auto& existing : jobs)
        {
            if (existing->getJob().renderId == job.renderId && !RenderTypes::isTerminal(existing->getState()))
            {
                error = "render " + job.renderId + " is already running";
                return SubmitStatus::Duplicate;
            }
        }

        core = std::make_shared<RenderManagerCore>(job, environment);
        jobs.push_back(core);
        finishedReports.erase(job.renderId);
        finishedOrder.removeString(job.renderId);
    }

    juce::Logger::writeToLog("[RENDER " + job.renderId + "] Queued (user " + job.userId + ")");
    core->start();
    return SubmitStatus::Queued;
}

bool RenderManager::isJobRunning(const juce::String& renderId) const
{
    auto core = findJob(renderId);
    return core != nullptr && !RenderTypes::isTerminal(core->getState());
}

int RenderManager::getActiveJobCount() const
{
    juce::ScopedLock sl(lock);

    int count = 0;
    for (const auto& core : jobs)
        if (!RenderTypes::isTerminal(core->getState()))
            ++count;

    return count;
}

bool RenderManager::waitForJob(const juce::String& renderId, int timeoutMs, RenderTypes::CallbackReport& report)
{
    if (auto core = findJob(renderId))
    {
        if (!core->waitForCompletion(timeoutMs))
            return false;

        report = core->getReport();
        return true;
    }

    juce::ScopedLock sl(lock);
    auto finished = finishedReports.find(renderId);

    if (finished == finishedReports.end())
        return false;

    report = finished->second;
    return true;
}

std::vector<RenderTypes::RenderState> RenderManager::getStateHistory(const juce::String& renderId) const
{
    if (auto core = findJob(renderId))
        return core->getStateHistory();

    return {};
}

bool RenderManager::shutdown(int timeoutMs)
{
    std::vector<std::shared_ptr<RenderManagerCore>> running;

    {
        juce::ScopedLock sl(lock);
        acceptingJobs = false;
        running = jobs;
    }

    const juce::int64 deadline = juce::Time::currentTimeMillis() + timeoutMs;
    bool allFinished = true;

    for (const auto& core : running)
    {
        const int remaining = timeoutMs < 0 ? -1
                                            : (int) juce::jmax((juce::int64) 0, deadline - juce::Time::currentTimeMillis());

        if (!core->waitForCompletion(remaining))
        {
            juce::Logger::writeToLog("WARNING: render " + core->getJob().renderId + " still running at shutdown ("
                                     + RenderTypes::stateName(core->getState()) + ")");
            allFinished = false;
        }
    }

    return allFinished;
}

std::shared_ptr<RenderManagerCore> RenderManager::findJob(const juce::String& renderId) const
{
    juce::ScopedLock sl(lock);

    // Newest first: a finished job may still be waiting to be reaped
    for (auto it = jobs.rbegin(); it != jobs.rend(); ++it)
        if ((*it)->getJob().renderId == renderId)
            return *it;

    return nullptr;
}

void RenderManager::reapFinishedJobs()
{
    for (auto it = jobs.begin(); it != jobs.end();)
    {
        if ((*it)->isFinished())
        {
            const juce::String renderId = (*it)->getJob().renderId;
            finishedReports[renderId] = (*it)->getReport();
            finishedOrder.removeString(renderId);
            finishedOrder.add(renderId);
            it = jobs.erase(it);
        }
        else
        {
            ++it;
        }
    }

    while (finishedOrder.size() > maxFinishedReports)
    {
        finishedReports.erase(finishedOrder[0]);
        finishedOrder.remove(0);
    }
}
