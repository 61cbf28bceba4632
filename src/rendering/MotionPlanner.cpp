#include "MotionPlanner.h"

using RenderTypes::AnimationType;

namespace
{
    bool isPan(AnimationType type)
    {
        return type == AnimationType::PanLeft || type == AnimationType::PanRight
            || type == AnimationType::PanUp || type == AnimationType::PanDown;
    }

    double progressAt(int frameIndex, int frameCount)
    {
        const int clamped = juce::jlimit(0, juce::jmax(0, frameCount - 1), frameIndex);
        return (double) clamped / (double) MotionPlanner::motionDenominator(frameCount);
    }
}

int MotionPlanner::frameCountFor(double durationSec, int frameRate)
{
    return juce::jmax(1, juce::roundToInt(durationSec * (double) frameRate));
}

int MotionPlanner::motionDenominator(int frameCount)
{
    return juce::jmax(1, frameCount - 1);
}

double MotionPlanner::scaleAtFrame(AnimationType type, int frameIndex, int frameCount)
{
    const double t = progressAt(frameIndex, frameCount);

    switch (type)
    {
        case AnimationType::ZoomIn:  return juce::jmin(1.0 + (maxZoom - 1.0) * t, maxZoom);
        case AnimationType::ZoomOut: return juce::jmax(maxZoom - (maxZoom - 1.0) * t, 1.0);
        default: break;
    }

    return isPan(type) ? panZoom : 1.0;
}

juce::Point<double> MotionPlanner::offsetAtFrame(AnimationType type, int frameIndex, int frameCount)
{
    const double t = progressAt(frameIndex, frameCount);

    switch (type)
    {
        case AnimationType::PanLeft:  return { t, 0.5 };
        case AnimationType::PanRight: return { 1.0 - t, 0.5 };
        case AnimationType::PanUp:    return { 0.5, 1.0 - t };
        case AnimationType::PanDown:  return { 0.5, t };
        default: break;
    }

    return { 0.5, 0.5 };
}

double MotionPlanner::opacityAt(AnimationType type, double timeSec, double durationSec)
{
    if (type == AnimationType::FadeIn)
        return juce::jlimit(0.0, 1.0, timeSec / fadeDuration);

    if (type == AnimationType::FadeOut)
    {
        const double start = fadeOutStart(durationSec);
        if (timeSec <= start)
            return 1.0;

        return juce::jlimit(0.0, 1.0, 1.0 - (timeSec - start) / fadeDuration);
    }

    return 1.0;
}

double MotionPlanner::fadeOutStart(double durationSec)
{
    return juce::jmax(0.0, durationSec - fadeDuration);
}

juce::String MotionPlanner::buildLetterboxFilter(const RenderTypes::RenderSettings& settings)
{
    const juce::String w(settings.width);
    const juce::String h(settings.height);

    return "scale=" + w + ":" + h + ":force_original_aspect_ratio=decrease,"
         + "pad=" + w + ":" + h + ":(ow-iw)/2:(oh-ih)/2:black,"
         + "setsar=1";
}

juce::String MotionPlanner::buildMotionFilter(AnimationType type,
                                              double durationSec,
                                              const RenderTypes::RenderSettings& settings)
{
    const int frameCount = frameCountFor(durationSec, settings.frameRate);
    const juce::String den(motionDenominator(frameCount));
    const juce::String tail = ":d=1:s=" + juce::String(settings.width) + "x" + juce::String(settings.height)
                            + ":fps=" + juce::String(settings.frameRate);

    const juce::String zoomMax(maxZoom, 2);
    const juce::String zoomStep(maxZoom - 1.0, 2);
    const juce::String panZ = "z='" + juce::String(panZoom, 2) + "'";

    // zoompan's crop window travels across (iw - iw/zoom) horizontally and (ih - ih/zoom) vertically
    const juce::String centreX = "x='iw/2-(iw/zoom/2)'";
    const juce::String centreY = "y='ih/2-(ih/zoom/2)'";
    const juce::String panMidX = "x='(iw-iw/zoom)/2'";
    const juce::String panMidY = "y='(ih-ih/zoom)/2'";

    switch (type)
    {
        case AnimationType::ZoomIn:
            return "zoompan=z='min(1+" + zoomStep + "*on/" + den + "," + zoomMax + ")':" + centreX + ":" + centreY + tail;

        case AnimationType::ZoomOut:
            return "zoompan=z='max(" + zoomMax + "-" + zoomStep + "*on/" + den + ",1.0)':" + centreX + ":" + centreY + tail;

        case AnimationType::PanLeft:
            return "zoompan=" + panZ + ":x='(iw-iw/zoom)*on/" + den + "':" + panMidY + tail;

        case AnimationType::PanRight:
            return "zoompan=" + panZ + ":x='(iw-iw/zoom)*(1-on/" + den + ")':" + panMidY + tail;

        case AnimationType::PanUp:
            return "zoompan=" + panZ + ":" + panMidX + ":y='(ih-ih/zoom)*(1-on/" + den + ")'" + tail;

        case AnimationType::PanDown:
            return "zoompan=" + panZ + ":" + panMidX + ":y='(ih-ih/zoom)*on/" + den + "'" + tail;

        case AnimationType::FadeIn:
            return "fade=t=in:st=0:d=" + juce::String(fadeDuration, 1);

        case AnimationType::FadeOut:
            return "fade=t=out:st=" + juce::String(fadeOutStart(durationSec), 3) + ":d=" + juce::String(fadeDuration, 1);

        case AnimationType::None:
            break;
    }

    return {};
}
