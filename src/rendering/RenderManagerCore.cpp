#include "RenderManagerCore.h"

namespace
{
    juce::String indexedName(const juce::String& prefix, int index)
    {
        return prefix + "_" + juce::String(index).paddedLeft('0', 3);
    }
}

RenderManagerCore::RenderManagerCore(const RenderTypes::RenderJob& job, const RenderEnvironment& environment)
    : Thread("Render " + job.renderId),
      job(job),
      environment(environment)
{
    ffmpegExecutor = environment.createExecutor ? environment.createExecutor()
                                                : std::make_unique<FFmpegExecutor>();

    logFunction = [this](const juce::String& message)
    {
        juce::Logger::writeToLog("[RENDER " + this->job.renderId + "] " + message);

        juce::ScopedLock lock(logWriteLock);
        if (renderSessionLogStream != nullptr && renderSessionLogStream->openedOk())
        {
            renderSessionLogStream->writeText(juce::Time::getCurrentTime().toString(true, true) + ": " + message + "\n",
                                              false, false, nullptr);
            renderSessionLogStream->flush();
        }
    };

    ffmpegExecutor->setLogCallback(logFunction);

    // Entering Queued happens on the accepting thread
    stateHistory.push_back(RenderState::Queued);
}

RenderManagerCore::~RenderManagerCore()
{
    waitForThreadToExit(-1);
    teardownLoggingSession();
}

void RenderManagerCore::start()
{
    startThread();
}

RenderTypes::RenderState RenderManagerCore::getState() const
{
    juce::ScopedLock lock(stateLock);
    return state;
}

std::vector<RenderTypes::RenderState> RenderManagerCore::getStateHistory() const
{
    juce::ScopedLock lock(stateLock);
    return stateHistory;
}

bool RenderManagerCore::waitForCompletion(int timeoutMs)
{
    return completionEvent.wait(timeoutMs);
}

RenderTypes::CallbackReport RenderManagerCore::getReport() const
{
    juce::ScopedLock lock(stateLock);
    return report;
}

void RenderManagerCore::updateState(RenderState newState)
{
    {
        juce::ScopedLock lock(stateLock);
        state = newState;
        stateHistory.push_back(newState);
    }

    logFunction("State: " + RenderTypes::stateName(newState));
}

//==============================================================================
juce::Result RenderManagerCore::resolveStoryboard(const RenderTypes::RenderPayload& payload,
                                                  std::vector<RenderTypes::ClipPlan>& plans,
                                                  const std::function<void(const juce::String&)>& logFunction)
{
    plans.clear();

    for (const auto& item : payload.storyboard)
    {
        auto asset = payload.assets.find(item.assetId);

        if (asset == payload.assets.end())
        {
            if (logFunction)
                logFunction("Skipping storyboard item " + juce::String(item.position)
                            + ": asset '" + item.assetId + "' is missing or has no usable content");
            continue;
        }

        plans.push_back({ item, asset->second });
    }

    if (plans.empty())
        return juce::Result::fail("no clips produced: the storyboard has no resolvable items");

    return juce::Result::ok();
}

RenderTypes::RenderSettings RenderManagerCore::resolveSettings(const RenderTypes::RenderPayload& payload,
                                                               const RenderEnvironment& environment)
{
    auto format = environment.defaultFormat;
    auto quality = environment.defaultQuality;

    // Unknown names leave the defaults in place
    if (payload.format.isNotEmpty())
        RenderTypes::parseOutputFormat(payload.format, format);

    if (payload.quality.isNotEmpty())
        RenderTypes::parseQualityPreset(payload.quality, quality);

    return RenderTypes::RenderSettings::create(format, quality, environment.useNvidiaAcceleration);
}

juce::String RenderManagerCore::buildLogTail(const juce::String& header, const juce::String& detail)
{
    juce::String tail = header;

    if (detail.trim().isNotEmpty())
    {
        const int room = maxLogTailLength - header.length() - 1;
        const juce::String trimmedDetail = detail.trim();

        if (room > 0)
            tail << "\n" << (trimmedDetail.length() > room ? trimmedDetail.getLastCharacters(room) : trimmedDetail);
    }

    return tail.substring(0, maxLogTailLength);
}

//==============================================================================
void RenderManagerCore::run()
{
    renderStartTime = juce::Time::getCurrentTime();
    initialiseLoggingSession();

    logFunction("=== RENDER LOG ===");
    logFunction("Render started at: " + renderStartTime.toString(true, true));
    logFunction("User: " + job.userId);

    juce::Result result = juce::Result::ok();
    juce::String probeSummary;

    updateState(RenderState::FetchingAssets);

    {
        ScopedWorkspace workspace(*environment.workspaces, job.renderId);

        try
        {
            result = workspace.getResult();

            if (result.wasOk())
            {
                logFunction("Workspace: " + workspace.getDirectory().getFullPathName());
                result = runPipeline(workspace.getDirectory(), probeSummary);
            }
        }
        catch (const std::exception& e)
        {
            result = juce::Result::fail(e.what());
        }
        catch (...)
        {
            result = juce::Result::fail("unexpected fault");
        }

        // Released before any terminal state is entered
        workspace.release();
    }

    finishJob(result, probeSummary);
}

juce::Result RenderManagerCore::runPipeline(const juce::File& workspace, juce::String& probeSummary)
{
    //==========================================================================
    // STEP 1: Payload, clip plan and downloads
    RenderTypes::RenderPayload payload;
    std::vector<RenderTypes::ClipPlan> plans;
    juce::File audioFile;
    std::vector<juce::File> sourceFiles;

    auto result = fetchAssets(workspace, payload, plans, audioFile, sourceFiles);
    if (result.failed())
        return result;

    //==========================================================================
    // STEP 2: One clip per plan entry, strictly in order
    updateState(RenderState::Synthesizing);

    if (renderSessionDirectory.isDirectory())
    {
        juce::File ffmpegLogDirectory = renderSessionDirectory.getChildFile("ffmpeg");
        if (ffmpegLogDirectory.createDirectory().wasOk())
            ffmpegExecutor->setSessionLogDirectory(ffmpegLogDirectory);
    }

    std::vector<RenderTypes::Clip> clips;
    result = synthesizeClips(workspace, plans, sourceFiles, clips);
    if (result.failed())
        return result;

    //==========================================================================
    // STEP 3: Concatenate and mux with the narration
    updateState(RenderState::Assembling);

    TimelineAssembler timelineAssembler(ffmpegExecutor.get());
    timelineAssembler.setLogCallback(logFunction);
    timelineAssembler.setRenderSettings(settings);

    const juce::File outputFile = workspace.getChildFile("output.mp4");
    TimelineAssembler::AssemblyReport assemblyReport;

    result = timelineAssembler.assembleTimeline(clips, audioFile, workspace, outputFile, assemblyReport);
    if (result.failed())
        return result;

    probeSummary = assemblyReport.streamDescription;
    logFunction("Output duration: " + juce::String(assemblyReport.outputDuration, 3) + "s (video "
                + juce::String(assemblyReport.expectedVideoDuration, 3) + "s, audio "
                + juce::String(assemblyReport.audioDuration, 3) + "s)");

    //==========================================================================
    // STEP 4: Upload
    updateState(RenderState::Uploading);

    if (environment.storage == nullptr)
        return juce::Result::fail("object storage is not configured");

    const juce::String key = ObjectStorage::renderKeyFor(payload.projectId, job.renderId);
    logFunction("Uploading " + juce::String(outputFile.getSize() / 1024) + " KB to " + key);

    result = environment.storage->upload(outputFile, key, "video/mp4", outputUrl);
    if (result.failed())
        return juce::Result::fail("upload failed: " + result.getErrorMessage());

    logFunction("Uploaded: " + outputUrl);
    return juce::Result::ok();
}

juce::Result RenderManagerCore::fetchAssets(const juce::File& workspace,
                                            RenderTypes::RenderPayload& payload,
                                            std::vector<RenderTypes::ClipPlan>& plans,
                                            juce::File& audioFile,
                                            std::vector<juce::File>& sourceFiles)
{
    PayloadClient payloadClient(*environment.httpClient, environment.internalSecret);

    auto result = payloadClient.fetch(job, payload);
    if (result.failed())
        return result;

    if (payload.renderId.isNotEmpty() && payload.renderId != job.renderId)
        logFunction("WARNING: payload renderId '" + payload.renderId + "' differs from the request");

    logFunction("Payload: " + juce::String((int) payload.storyboard.size()) + " storyboard items, "
                + juce::String((int) payload.assets.size()) + " usable assets");

    // Validation before anything is downloaded
    result = resolveStoryboard(payload, plans, logFunction);
    if (result.failed())
        return result;

    if (payload.audioUrl.isEmpty())
        return juce::Result::fail("payload has no audioUrl");

    settings = resolveSettings(payload, environment);
    logFunction("Output: " + juce::String(settings.width) + "x" + juce::String(settings.height)
                + " @ " + juce::String(settings.frameRate) + " fps, preset " + settings.x264Preset
                + ", crf " + juce::String(settings.crf)
                + (settings.useNvidiaAcceleration ? ", NVENC" : ""));

    AssetFetcher fetcher(*environment.httpClient);
    fetcher.setLogCallback(logFunction);

    audioFile = workspace.getChildFile("audio.bin");
    result = fetcher.fetchRemote(payload.audioUrl, audioFile, AssetFetcher::audioTimeoutMs);
    if (result.failed())
        return juce::Result::fail("audio download failed: " + result.getErrorMessage());

    sourceFiles.clear();

    for (size_t i = 0; i < plans.size(); ++i)
    {
        juce::File sourceFile;
        result = fetcher.fetchAsset(plans[i].source, workspace, indexedName("src", (int) i), sourceFile);

        if (result.failed())
            return juce::Result::fail("asset '" + plans[i].item.assetId + "': " + result.getErrorMessage());

        sourceFiles.push_back(sourceFile);
    }

    return juce::Result::ok();
}

juce::Result RenderManagerCore::synthesizeClips(const juce::File& workspace,
                                                const std::vector<RenderTypes::ClipPlan>& plans,
                                                const std::vector<juce::File>& sourceFiles,
                                                std::vector<RenderTypes::Clip>& clips)
{
    ClipProcessor clipProcessor(ffmpegExecutor.get());
    clipProcessor.setLogCallback(logFunction);
    clipProcessor.setRenderSettings(settings);
    clipProcessor.setEncodingParams(environment.clipNvidiaParams, environment.clipCpuParams);

    clips.clear();

    for (size_t i = 0; i < plans.size(); ++i)
    {
        const juce::File clipFile = workspace.getChildFile(indexedName("clip", (int) i) + ".mp4");
        RenderTypes::Clip clip;

        auto result = clipProcessor.synthesizeClip(plans[i], sourceFiles[i], clipFile, clip);
        if (result.failed())
            return juce::Result::fail("clip " + juce::String((int) i) + " ('" + plans[i].item.assetId + "'): "
                                      + result.getErrorMessage());

        clips.push_back(clip);
    }

    logFunction("Synthesized " + juce::String((int) clips.size()) + " clips");
    return juce::Result::ok();
}

void RenderManagerCore::finishJob(const juce::Result& result, const juce::String& probeSummary)
{
    RenderTypes::CallbackReport finalReport;
    finalReport.renderId = job.renderId;
    finalReport.userId = job.userId;

    if (result.wasOk())
    {
        updateState(RenderState::Notifying);

        finalReport.complete = true;
        finalReport.outputUrl = outputUrl;
        finalReport.logTail = buildLogTail("render complete", probeSummary);
    }
    else
    {
        updateState(RenderState::Failed);
        logFunction("ERROR: " + result.getErrorMessage());

        finalReport.complete = false;
        finalReport.error = result.getErrorMessage();
        finalReport.logTail = buildLogTail("render failed: " + result.getErrorMessage(),
                                           ffmpegExecutor->getLastDiagnosticTail());
    }

    environment.notifier->notify(job.callbackUrl, finalReport);

    if (result.wasOk())
        updateState(RenderState::Completed);

    logFunction("Render finished in " + getElapsedTimeString());

    {
        juce::ScopedLock lock(stateLock);
        report = finalReport;
    }

    teardownLoggingSession();
    completionEvent.signal();
}

//==============================================================================
void RenderManagerCore::initialiseLoggingSession()
{
    if (environment.logRoot == juce::File() || environment.logRoot.createDirectory().failed())
        return;

    const juce::String timestamp = juce::Time::getCurrentTime().formatted("%Y%m%d_%H%M%S");
    renderSessionDirectory = environment.logRoot.getChildFile("render_" + WorkspaceManager::sanitiseJobId(job.renderId)
                                                              + "_" + timestamp);

    if (renderSessionDirectory.createDirectory().failed())
    {
        juce::Logger::writeToLog("WARNING: could not create log directory " + renderSessionDirectory.getFullPathName());
        renderSessionDirectory = juce::File();
        return;
    }

    juce::File renderLogFile = renderSessionDirectory.getChildFile("render.log");

    juce::ScopedLock lock(logWriteLock);
    renderSessionLogStream = std::make_unique<juce::FileOutputStream>(renderLogFile);

    if (!renderSessionLogStream->openedOk())
        renderSessionLogStream.reset();
}

void RenderManagerCore::teardownLoggingSession()
{
    ffmpegExecutor->setSessionLogDirectory(juce::File());

    juce::ScopedLock lock(logWriteLock);
    if (renderSessionLogStream != nullptr && renderSessionLogStream->openedOk())
        renderSessionLogStream->flush();
    renderSessionLogStream.reset();
}

juce::String RenderManagerCore::getElapsedTimeString() const
{
    int seconds = static_cast<int>((juce::Time::getCurrentTime() - renderStartTime).inSeconds());

    int hours = seconds / 3600;
    seconds %= 3600;
    int minutes = seconds / 60;
    seconds %= 60;

    juce::String result;

    if (hours > 0)
        result += juce::String(hours) + "h ";

    if (minutes > 0 || hours > 0)
        result += juce::String(minutes) + "m ";

    result += juce::String(seconds) + "s";

    return result;
}
