#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"

/**
 * Frame-accurate camera-motion parameters for still-image clips.
 *
 * Each animation variant is a function of the output frame index i (0 .. frameCount-1).
 * buildMotionFilter() emits the same law as an FFmpeg filter expression, where the
 * zoompan output frame counter "on" plays the role of i; the numeric accessors
 * (scaleAtFrame, offsetAtFrame, opacityAt) evaluate it directly.
 */
class MotionPlanner
{
public:
    static constexpr double maxZoom = 1.25;
    static constexpr double panZoom = 1.15;
    static constexpr double fadeDuration = 0.5;

    /** round(duration * frameRate), never less than one frame */
    static int frameCountFor(double durationSec, int frameRate);

    /** frameCount - 1, clamped to 1 so single-frame clips never divide by zero */
    static int motionDenominator(int frameCount);

    /** Magnification applied at frame i */
    static double scaleAtFrame(RenderTypes::AnimationType type, int frameIndex, int frameCount);

    /**
     * Crop window position at frame i as a fraction of the available travel on each axis.
     * (0, 0) is the top-left limit, (1, 1) the bottom-right, (0.5, 0.5) centred.
     */
    static juce::Point<double> offsetAtFrame(RenderTypes::AnimationType type, int frameIndex, int frameCount);

    /** Frame opacity at time t (seconds) into a clip of the given duration */
    static double opacityAt(RenderTypes::AnimationType type, double timeSec, double durationSec);

    /** Where a fade-out begins: max(0, duration - 0.5) */
    static double fadeOutStart(double durationSec);

    /**
     * Scales to fit the output frame preserving aspect ratio, then letterboxes
     * with black, centred.
     */
    static juce::String buildLetterboxFilter(const RenderTypes::RenderSettings& settings);

    /**
     * The motion fragment appended after the letterbox filter, or an empty string
     * for a static frame.
     */
    static juce::String buildMotionFilter(RenderTypes::AnimationType type,
                                          double durationSec,
                                          const RenderTypes::RenderSettings& settings);
};
