#pragma once
#include <JuceHeader.h>
#include "../rendering/RenderTypes.h"
#include "HttpClient.h"

/**
 * Resolves asset references into local files inside a job workspace.
 *
 * Two reference kinds exist: remote URLs, which are streamed to disk through the
 * HttpClient, and inline base64 image data URLs, which are decoded in place.
 * Nothing is retried; every failure is returned to the caller as a failed Result.
 */
class AssetFetcher
{
public:
    static constexpr int audioTimeoutMs = 180 * 1000;
    static constexpr int videoTimeoutMs = 300 * 1000;

    explicit AssetFetcher(HttpClient& httpClient);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Streams a remote resource to the destination file.
     */
    juce::Result fetchRemote(const juce::String& url, const juce::File& destination, int timeoutMs);

    /**
     * Materialises an asset as <directory>/<baseName>.<ext>.
     * Video loops are downloaded as .mp4; still images keep the extension of their image type.
     *
     * @param localFile Receives the written file on success
     */
    juce::Result fetchAsset(const RenderTypes::AssetSource& source,
                            const juce::File& directory,
                            const juce::String& baseName,
                            juce::File& localFile);

    /**
     * Decodes a "data:image/<type>;base64,<payload>" URL to <directory>/<baseName>.<ext>.
     * Anything that is not an image type or not valid base64 is rejected.
     */
    static juce::Result decodeDataUrlImage(const juce::String& dataUrl,
                                           const juce::File& directory,
                                           const juce::String& baseName,
                                           juce::File& imageFile);

    /** File extension for an image MIME type, e.g. "image/jpeg" -> "jpg" */
    static juce::String extensionForImageType(const juce::String& mimeType);

private:
    HttpClient& httpClient;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AssetFetcher)
};
