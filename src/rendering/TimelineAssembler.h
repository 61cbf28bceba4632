#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"
#include "FFmpegExecutor.h"

/**
 * Assembles the ordered clips and the narration track into the deliverable file.
 *
 * STEP 1: concatenate the clips, in storyboard order, into one silent sequence whose
 *         timestamps are regenerated from the frame counter (setpts=N/FPS/TB) under a
 *         fixed container timescale.
 * STEP 2: verify the sequence lasts the sum of the clips' nominal durations.
 * STEP 3: mux the sequence with the audio, trimmed to the shorter of the two.
 * STEP 4: probe the result for the completion report.
 */
class TimelineAssembler
{
public:
    /** What the assembly measured along the way */
    struct AssemblyReport
    {
        double expectedVideoDuration = 0.0;  // Sum of clip frame counts / frame rate
        double sequenceDuration = 0.0;       // Probed concatenated stream, 0 if unknown
        double audioDuration = 0.0;          // Probed narration, 0 if unknown
        double targetDuration = 0.0;         // min(video, audio)
        double outputDuration = 0.0;         // Probed final file, 0 if unknown
        juce::String streamDescription;      // r_frame_rate / avg_frame_rate / time_base of the output
    };

    /**
     * Creates a new TimelineAssembler.
     * @param executor The FFmpeg executor to use for timeline assembly
     */
    TimelineAssembler(FFmpegExecutor* executor);
    ~TimelineAssembler();

    /**
     * Sets a callback for receiving log messages.
     * @param callback Function called with log messages
     */
    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Sets the frame rate, quality and encoder choice of the final output.
     */
    void setRenderSettings(const RenderTypes::RenderSettings& settings);

    /**
     * Assembles the final output.
     * @param clips The synthesized clips in storyboard order (must not be empty)
     * @param audioFile The narration track
     * @param tempDirectory The job workspace for intermediate files
     * @param outputFile The file to save the final output to
     * @param report Receives the measured durations and the output stream description
     */
    juce::Result assembleTimeline(const std::vector<RenderTypes::Clip>& clips,
                                  const juce::File& audioFile,
                                  const juce::File& tempDirectory,
                                  const juce::File& outputFile,
                                  AssemblyReport& report);

    /**
     * Writes an ffconcat list with one "file '<path>'" line per clip.
     */
    bool createConcatFile(const std::vector<RenderTypes::Clip>& clips, const juce::File& concatFile);

    /** Sum of the clips' nominal durations (frameCount / frameRate) */
    double getNominalDuration(const std::vector<RenderTypes::Clip>& clips) const;

    /** STEP 1 via the concat demuxer */
    juce::StringArray buildConcatArguments(const juce::File& concatList, const juce::File& outputFile, bool useNvenc) const;

    /** STEP 1 fallback via the concat filter over every clip input */
    juce::StringArray buildFilterConcatArguments(const std::vector<RenderTypes::Clip>& clips,
                                                 const juce::File& outputFile,
                                                 bool useNvenc) const;

    /**
     * STEP 3 arguments.
     * @param targetDuration Explicit output length, or <= 0 to rely on the shortest-stream rule alone
     */
    juce::StringArray buildMuxArguments(const juce::File& sequenceFile,
                                        const juce::File& audioFile,
                                        double targetDuration,
                                        const juce::File& outputFile) const;

private:
    juce::StringArray buildFinalEncodingArguments(bool useNvenc) const;
    juce::StringArray buildTimestampArguments() const;

    juce::Result concatenateClips(const std::vector<RenderTypes::Clip>& clips,
                                  const juce::File& tempDirectory,
                                  const juce::File& sequenceFile);

    bool executeConcatWithFallback(const std::vector<RenderTypes::Clip>& clips,
                                   const juce::File& concatList,
                                   const juce::File& outputFile,
                                   bool useNvenc);

    FFmpegExecutor* ffmpegExecutor;
    RenderTypes::RenderSettings settings;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TimelineAssembler)
};
