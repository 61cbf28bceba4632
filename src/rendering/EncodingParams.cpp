#include "EncodingParams.h"

namespace EncodingParams
{
    juce::StringArray buildVideoEncoderArguments(const juce::String& input,
                                                 bool useNvenc,
                                                 const juce::String& fallback)
    {
        juce::String params = input.trim();
        if (params.isEmpty())
            params = fallback.trim();

        juce::StringArray tokens;
        tokens.addTokens(params, " ", "\"'");
        tokens.trim();
        tokens.removeEmptyStrings();

        juce::StringArray result { "-c:v", useNvenc ? "h264_nvenc" : "libx264" };

        for (int i = 0; i < tokens.size(); ++i)
        {
            const juce::String token = tokens[i];

            auto skipOptionWithValue = [&](const juce::String& opt)
            {
                if (token == opt || token.startsWith(opt + "="))
                {
                    if (token == opt && i + 1 < tokens.size())
                        ++i;
                    return true;
                }
                return false;
            };

            if (token == "-an" || token == "-y")
                continue;

            if (skipOptionWithValue("-c:v") ||
                skipOptionWithValue("-vcodec") ||
                skipOptionWithValue("-profile:v") ||
                skipOptionWithValue("-level") ||
                skipOptionWithValue("-pix_fmt") ||
                skipOptionWithValue("-movflags"))
            {
                continue;
            }

            result.add(token.unquoted());
        }

        result.add("-pix_fmt");
        result.add("yuv420p");
        return result;
    }
}
