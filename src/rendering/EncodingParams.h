#pragma once
#include <JuceHeader.h>

/**
 * Encoder option handling shared by the clip and sequence stages.
 *
 * User-supplied option strings may carry their own codec, pixel format or container
 * flags; those are stripped so every stage can pin H.264 with 4:2:0 chroma itself.
 */
namespace EncodingParams
{
    static const juce::String defaultClipCpuParams = "-preset veryfast -crf 18";
    static const juce::String defaultClipNvidiaParams = "-preset p4 -rc constqp -qp 18";

    /**
     * Returns "-c:v <encoder> <filtered options>" as separate argument tokens.
     * @param params Options to filter, or empty to use the fallback
     * @param useNvenc Selects h264_nvenc instead of libx264
     * @param fallback Options used when params is empty
     */
    juce::StringArray buildVideoEncoderArguments(const juce::String& params,
                                                 bool useNvenc,
                                                 const juce::String& fallback);
}
