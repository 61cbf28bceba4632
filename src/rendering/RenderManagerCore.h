#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"
#include "FFmpegExecutor.h"
#include "ClipProcessor.h"
#include "TimelineAssembler.h"
#include "../io/AssetFetcher.h"
#include "../io/HttpClient.h"
#include "../io/WorkspaceManager.h"
#include "../delivery/CallbackNotifier.h"
#include "../delivery/ObjectStorage.h"
#include "../delivery/PayloadClient.h"

/**
 * The services a render job runs against. Everything is owned elsewhere (main() or a
 * test fixture) and must outlive every job that was given it.
 */
struct RenderEnvironment
{
    WorkspaceManager* workspaces = nullptr;
    HttpClient* httpClient = nullptr;
    ObjectStorage* storage = nullptr;           // null: uploads fail with a clear message
    Notifier* notifier = nullptr;

    /** Creates the executor a job runs its encoder commands through */
    std::function<std::unique_ptr<FFmpegExecutor>()> createExecutor;

    juce::String internalSecret;

    RenderTypes::OutputFormat defaultFormat = RenderTypes::OutputFormat::Horizontal;
    RenderTypes::QualityPreset defaultQuality = RenderTypes::QualityPreset::Standard;
    bool useNvidiaAcceleration = false;

    // Intermediate clip encoder options (empty keeps the built-in defaults)
    juce::String clipNvidiaParams;
    juce::String clipCpuParams;

    /** Parent of the per-job log directories; a non-existent file disables them */
    juce::File logRoot;
};

//==============================================================================
/**
 * Runs one render job through the whole pipeline on its own thread:
 * FetchingAssets -> Synthesizing -> Assembling -> Uploading -> Notifying -> Completed,
 * or Failed from any step before Notifying.
 *
 * The job owns a private workspace that is removed before either terminal state is
 * entered, and it emits exactly one CallbackReport.
 */
class RenderManagerCore : private juce::Thread
{
public:
    using RenderState = RenderTypes::RenderState;

    /** Maximum number of characters sent as the report's logTail */
    static constexpr int maxLogTailLength = 4000;

    /**
     * Creates the job in the Queued state. Nothing runs until start() is called.
     */
    RenderManagerCore(const RenderTypes::RenderJob& job, const RenderEnvironment& environment);

    /** Blocks until the job thread has finished; jobs are never interrupted. */
    ~RenderManagerCore() override;

    /** Starts the pipeline on the job thread. */
    void start();

    const RenderTypes::RenderJob& getJob() const { return job; }

    RenderState getState() const;

    /** Every state the job has entered, in order, starting with Queued */
    std::vector<RenderState> getStateHistory() const;

    bool isFinished() const { return RenderTypes::isTerminal(getState()) && !isThreadRunning(); }

    /**
     * Waits for the job to reach a terminal state.
     * @param timeoutMs Maximum wait, or -1 to wait forever
     * @return true if the job finished within the timeout
     */
    bool waitForCompletion(int timeoutMs);

    /** The report that was sent; only meaningful once the job has finished */
    RenderTypes::CallbackReport getReport() const;

    /**
     * Pairs each storyboard item with its asset shape, in storyboard order. Items whose
     * asset is missing or unresolvable are skipped; an empty result is a failure.
     */
    static juce::Result resolveStoryboard(const RenderTypes::RenderPayload& payload,
                                          std::vector<RenderTypes::ClipPlan>& plans,
                                          const std::function<void(const juce::String&)>& logFunction = nullptr);

    /** Worker defaults, overridden by the payload's format and quality where they are valid */
    static RenderTypes::RenderSettings resolveSettings(const RenderTypes::RenderPayload& payload,
                                                       const RenderEnvironment& environment);

    /** "<header>\n<detail>", trimmed from the front of detail to fit maxLogTailLength */
    static juce::String buildLogTail(const juce::String& header, const juce::String& detail);

private:
    /** Thread run method that orchestrates the entire rendering process. */
    void run() override;

    /** Everything between workspace acquisition and upload; the first failed step ends it. */
    juce::Result runPipeline(const juce::File& workspace, juce::String& probeSummary);

    juce::Result fetchAssets(const juce::File& workspace,
                             RenderTypes::RenderPayload& payload,
                             std::vector<RenderTypes::ClipPlan>& plans,
                             juce::File& audioFile,
                             std::vector<juce::File>& sourceFiles);

    juce::Result synthesizeClips(const juce::File& workspace,
                                 const std::vector<RenderTypes::ClipPlan>& plans,
                                 const std::vector<juce::File>& sourceFiles,
                                 std::vector<RenderTypes::Clip>& clips);

    /** Sends the report and enters the terminal state. Never fails. */
    void finishJob(const juce::Result& result, const juce::String& probeSummary);

    /** Updates the current state and records it in the history. */
    void updateState(RenderState newState);

    /** Prepares the per-job log directory, render.log and the FFmpeg log folder. */
    void initialiseLoggingSession();
    void teardownLoggingSession();

    // Human-readable elapsed time, e.g. "1m 12s"
    juce::String getElapsedTimeString() const;

    RenderTypes::RenderJob job;
    RenderEnvironment environment;

    std::unique_ptr<FFmpegExecutor> ffmpegExecutor;
    RenderTypes::RenderSettings settings;
    juce::String outputUrl;

    // State tracking
    mutable juce::CriticalSection stateLock;
    RenderState state = RenderState::Queued;
    std::vector<RenderState> stateHistory;
    RenderTypes::CallbackReport report;
    juce::WaitableEvent completionEvent { true };

    juce::Time renderStartTime;

    // Function for logging to both console and the job's render.log
    std::function<void(const juce::String&)> logFunction;

    // Session logging infrastructure
    juce::File renderSessionDirectory;
    std::unique_ptr<juce::FileOutputStream> renderSessionLogStream;
    juce::CriticalSection logWriteLock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RenderManagerCore)
};
