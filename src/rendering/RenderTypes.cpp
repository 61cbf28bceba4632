#include "RenderTypes.h"

namespace RenderTypes
{
    AnimationType animationFromName(const juce::String& name)
    {
        const auto key = name.trim().toLowerCase();

        if (key == "zoom-in")   return AnimationType::ZoomIn;
        if (key == "zoom-out")  return AnimationType::ZoomOut;
        if (key == "pan-left")  return AnimationType::PanLeft;
        if (key == "pan-right") return AnimationType::PanRight;
        if (key == "pan-up")    return AnimationType::PanUp;
        if (key == "pan-down")  return AnimationType::PanDown;
        if (key == "fade-in")   return AnimationType::FadeIn;
        if (key == "fade-out")  return AnimationType::FadeOut;

        return AnimationType::None;
    }

    juce::String animationName(AnimationType type)
    {
        switch (type)
        {
            case AnimationType::ZoomIn:   return "zoom-in";
            case AnimationType::ZoomOut:  return "zoom-out";
            case AnimationType::PanLeft:  return "pan-left";
            case AnimationType::PanRight: return "pan-right";
            case AnimationType::PanUp:    return "pan-up";
            case AnimationType::PanDown:  return "pan-down";
            case AnimationType::FadeIn:   return "fade-in";
            case AnimationType::FadeOut:  return "fade-out";
            case AnimationType::None:     break;
        }

        return "none";
    }

    bool parseOutputFormat(const juce::String& name, OutputFormat& format)
    {
        const auto key = name.trim().toLowerCase();

        if (key == "horizontal") { format = OutputFormat::Horizontal; return true; }
        if (key == "vertical")   { format = OutputFormat::Vertical;   return true; }
        if (key == "square")     { format = OutputFormat::Square;     return true; }

        return false;
    }

    bool parseQualityPreset(const juce::String& name, QualityPreset& preset)
    {
        const auto key = name.trim().toLowerCase();

        if (key == "basic")    { preset = QualityPreset::Basic;    return true; }
        if (key == "standard") { preset = QualityPreset::Standard; return true; }
        if (key == "pro")      { preset = QualityPreset::Pro;      return true; }

        return false;
    }

    RenderSettings RenderSettings::create(OutputFormat format, QualityPreset quality, bool useNvidiaAcceleration)
    {
        RenderSettings settings;
        settings.useNvidiaAcceleration = useNvidiaAcceleration;

        // Basic renders at 720p-class geometry, the others at 1080p-class
        const int longEdge = (quality == QualityPreset::Basic) ? 1280 : 1920;
        const int shortEdge = (quality == QualityPreset::Basic) ? 720 : 1080;

        switch (format)
        {
            case OutputFormat::Horizontal: settings.width = longEdge;  settings.height = shortEdge; break;
            case OutputFormat::Vertical:   settings.width = shortEdge; settings.height = longEdge;  break;
            case OutputFormat::Square:     settings.width = shortEdge; settings.height = shortEdge; break;
        }

        switch (quality)
        {
            case QualityPreset::Basic:
                settings.x264Preset = "veryfast";
                settings.crf = 24;
                settings.maxVideoBitrate = "2500k";
                settings.audioBitrate = "160k";
                break;

            case QualityPreset::Standard:
                settings.x264Preset = "fast";
                settings.crf = 23;
                settings.maxVideoBitrate = "5000k";
                settings.audioBitrate = "192k";
                break;

            case QualityPreset::Pro:
                settings.x264Preset = "medium";
                settings.crf = 21;
                settings.maxVideoBitrate = "8000k";
                settings.audioBitrate = "192k";
                break;
        }

        return settings;
    }

    juce::var CallbackReport::toJson() const
    {
        auto* object = new juce::DynamicObject();
        object->setProperty("userId", userId);
        object->setProperty("renderId", renderId);
        object->setProperty("status", complete ? "complete" : "failed");

        if (complete)
            object->setProperty("outputUrl", outputUrl);
        else
            object->setProperty("error", error);

        object->setProperty("logTail", logTail);
        return juce::var(object);
    }

    juce::String stateName(RenderState state)
    {
        switch (state)
        {
            case RenderState::Queued:         return "Queued";
            case RenderState::FetchingAssets: return "FetchingAssets";
            case RenderState::Synthesizing:   return "Synthesizing";
            case RenderState::Assembling:     return "Assembling";
            case RenderState::Uploading:      return "Uploading";
            case RenderState::Notifying:      return "Notifying";
            case RenderState::Completed:      return "Completed";
            case RenderState::Failed:         return "Failed";
        }

        return "Unknown";
    }
}
