#pragma once
#include <JuceHeader.h>
#include <map>
#include <variant>

/**
 * Common types used across the rendering system.
 * These types are shared by multiple components to ensure consistency.
 */
namespace RenderTypes
{
    /** Header carrying the secret shared with the web tier on payload and callback requests */
    static constexpr const char* internalSecretHeader = "x-internal-render-secret";

    /** Camera-motion variants a storyboard item can request */
    enum class AnimationType
    {
        None,
        ZoomIn,
        ZoomOut,
        PanLeft,
        PanRight,
        PanUp,
        PanDown,
        FadeIn,
        FadeOut
    };

    /** Maps a payload animation name ("zoom-in", "pan-left", ...) to its variant; unknown names are None */
    AnimationType animationFromName(const juce::String& name);

    /** The payload name of an animation variant */
    juce::String animationName(AnimationType type);

    /** An asset whose background animation job already produced a looping video */
    struct VideoLoopSource
    {
        juce::String videoUrl;
    };

    /** An asset carried inline as a base64 image data URL */
    struct StillImageSource
    {
        juce::String dataUrl;
    };

    /** Exactly one resolvable content shape per asset */
    using AssetSource = std::variant<VideoLoopSource, StillImageSource>;

    /** Asset id -> resolved content shape. Unresolvable assets are never inserted. */
    using AssetTable = std::map<juce::String, AssetSource>;

    /** One render instruction of the storyboard */
    struct StoryboardItem
    {
        int position = 0;           // Index within the payload storyboard
        juce::String assetId;
        double durationSec = 0.0;   // Always > 0 once parsed
        AnimationType animation = AnimationType::None;
    };

    /** A storyboard item paired with the asset shape it resolved to */
    struct ClipPlan
    {
        StoryboardItem item;
        AssetSource source;
    };

    /** A synthesized, silent, fixed-duration fragment in the job workspace */
    struct Clip
    {
        int position = 0;
        juce::File file;
        double durationSec = 0.0;   // Requested duration
        int frameCount = 0;         // Exact number of frames encoded
    };

    /** Output frame geometry */
    enum class OutputFormat
    {
        Horizontal,
        Vertical,
        Square
    };

    /** Encoder quality presets */
    enum class QualityPreset
    {
        Basic,
        Standard,
        Pro
    };

    bool parseOutputFormat(const juce::String& name, OutputFormat& format);
    bool parseQualityPreset(const juce::String& name, QualityPreset& preset);

    /** Global settings every clip and the final output are encoded with */
    struct RenderSettings
    {
        int frameRate = 30;
        int width = 1920;
        int height = 1080;
        juce::String x264Preset = "fast";
        int crf = 23;
        juce::String maxVideoBitrate = "5000k";
        juce::String audioBitrate = "192k";
        bool useNvidiaAcceleration = false;

        /** Container timescale: a multiple of the frame rate so frame timestamps stay integral */
        int getTimescale() const { return frameRate * 512; }

        /** Duration of a single frame in seconds */
        double getFrameDuration() const { return 1.0 / (double) frameRate; }

        static RenderSettings create(OutputFormat format, QualityPreset quality, bool useNvidiaAcceleration);
    };

    /** Everything the payload endpoint returned, already typed */
    struct RenderPayload
    {
        juce::String renderId;
        juce::String projectId;
        juce::String audioUrl;
        std::vector<StoryboardItem> storyboard;
        AssetTable assets;
        juce::String format;    // Optional per-job override
        juce::String quality;   // Optional per-job override
    };

    /** The accepted render request */
    struct RenderJob
    {
        juce::String renderId;
        juce::String userId;
        juce::String payloadUrl;
        juce::String callbackUrl;
    };

    /** The one report sent to the callback location when a job terminates */
    struct CallbackReport
    {
        juce::String renderId;
        juce::String userId;
        bool complete = false;
        juce::String outputUrl;     // Set when complete
        juce::String error;         // Set when failed
        juce::String logTail;

        juce::var toJson() const;
    };

    /** Represents the current status of a render job */
    enum class RenderState
    {
        Queued,
        FetchingAssets,
        Synthesizing,
        Assembling,
        Uploading,
        Notifying,
        Completed,
        Failed
    };

    juce::String stateName(RenderState state);

    inline bool isTerminal(RenderState state)
    {
        return state == RenderState::Completed || state == RenderState::Failed;
    }
}
