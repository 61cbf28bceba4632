#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"
#include "FFmpegExecutor.h"

/**
 * Turns one storyboard item plus its fetched source file into a fixed-duration,
 * fixed-resolution, silent clip.
 *
 * A precomputed video is looped or truncated to the requested duration; a still
 * image is driven through the camera-motion law of its animation variant.
 * Both are letterboxed to the output frame and encoded with an exact frame count.
 */
class ClipProcessor
{
public:
    enum class Strategy
    {
        LoopFromVideo,
        AnimateFromImage
    };

    /**
     * Creates a new ClipProcessor.
     * @param ffmpegExecutor The FFmpeg executor to use for clip processing
     */
    ClipProcessor(FFmpegExecutor* ffmpegExecutor);
    ~ClipProcessor();

    /**
     * Sets a callback for receiving log messages.
     * @param logCallback Function called with log messages
     */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * Sets the frame geometry, frame rate and encoder choice for every clip.
     */
    void setRenderSettings(const RenderTypes::RenderSettings& settings);

    /**
     * Sets the encoder options used for intermediate clips.
     * @param nvidiaParams Options for h264_nvenc (empty keeps the default)
     * @param cpuParams Options for libx264 (empty keeps the default)
     */
    void setEncodingParams(const juce::String& nvidiaParams, const juce::String& cpuParams);

    /** A completed precomputed video always wins over a still image */
    static Strategy strategyFor(const RenderTypes::AssetSource& source);

    /**
     * Synthesizes one clip.
     * @param plan The storyboard item and the asset shape it resolved to
     * @param sourceFile The fetched video or decoded image
     * @param outputFile Where the clip is written
     * @param clip Receives the clip description on success
     */
    juce::Result synthesizeClip(const RenderTypes::ClipPlan& plan,
                                const juce::File& sourceFile,
                                const juce::File& outputFile,
                                RenderTypes::Clip& clip);

    /** FFmpeg arguments for the loop-from-video strategy */
    juce::StringArray buildLoopFromVideoArguments(const juce::File& sourceVideo,
                                                  double durationSec,
                                                  const juce::File& outputFile,
                                                  bool useNvenc) const;

    /** FFmpeg arguments for the animate-from-image strategy */
    juce::StringArray buildAnimateFromImageArguments(const juce::File& sourceImage,
                                                     RenderTypes::AnimationType animation,
                                                     double durationSec,
                                                     const juce::File& outputFile,
                                                     bool useNvenc) const;

    const RenderTypes::RenderSettings& getRenderSettings() const { return settings; }

private:
    juce::StringArray buildEncodingArguments(bool useNvenc) const;

    // FFmpeg executor for running commands
    FFmpegExecutor* ffmpegExecutor;

    RenderTypes::RenderSettings settings;

    // Encoder options without codec, pixel format or container flags
    juce::String nvidiaParams;
    juce::String cpuParams;

    // Log callback
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ClipProcessor)
};
