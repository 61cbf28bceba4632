#include "AssetFetcher.h"

AssetFetcher::AssetFetcher(HttpClient& httpClient)
    : httpClient(httpClient)
{
}

void AssetFetcher::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

juce::Result AssetFetcher::fetchRemote(const juce::String& url, const juce::File& destination, int timeoutMs)
{
    if (!url.startsWithIgnoreCase("http://") && !url.startsWithIgnoreCase("https://"))
        return juce::Result::fail("Unsupported asset URL: " + url.substring(0, 64));

    if (logCallback)
        logCallback("Downloading " + url.upToFirstOccurrenceOf("?", false, false) + " -> " + destination.getFileName());

    auto result = httpClient.download(juce::URL(url), destination, timeoutMs);

    if (result.wasOk() && logCallback)
        logCallback("Downloaded " + destination.getFileName() + " ("
                    + juce::String(destination.getSize() / 1024) + " KB)");

    return result;
}

juce::Result AssetFetcher::fetchAsset(const RenderTypes::AssetSource& source,
                                      const juce::File& directory,
                                      const juce::String& baseName,
                                      juce::File& localFile)
{
    if (const auto* video = std::get_if<RenderTypes::VideoLoopSource>(&source))
    {
        localFile = directory.getChildFile(baseName + ".mp4");
        return fetchRemote(video->videoUrl, localFile, videoTimeoutMs);
    }

    const auto& image = std::get<RenderTypes::StillImageSource>(source);
    auto result = decodeDataUrlImage(image.dataUrl, directory, baseName, localFile);

    if (result.wasOk() && logCallback)
        logCallback("Decoded inline image " + localFile.getFileName() + " ("
                    + juce::String(localFile.getSize() / 1024) + " KB)");

    return result;
}

juce::Result AssetFetcher::decodeDataUrlImage(const juce::String& dataUrl,
                                              const juce::File& directory,
                                              const juce::String& baseName,
                                              juce::File& imageFile)
{
    const juce::String trimmed = dataUrl.trim();

    if (!trimmed.startsWithIgnoreCase("data:") || !trimmed.containsChar(','))
        return juce::Result::fail("Invalid image data URL");

    const juce::String header = trimmed.substring(5).upToFirstOccurrenceOf(",", false, false);

    if (!header.endsWithIgnoreCase(";base64"))
        return juce::Result::fail("Image data URL is not base64 encoded");

    const juce::String mimeType = header.upToFirstOccurrenceOf(";", false, false).trim().toLowerCase();

    if (!mimeType.startsWith("image/") || mimeType.length() <= 6)
        return juce::Result::fail("Data URL is not an image: " + mimeType);

    const juce::String payload = trimmed.fromFirstOccurrenceOf(",", false, false)
                                        .removeCharacters(" \t\r\n");

    if (payload.isEmpty() || payload.length() % 4 != 0)
        return juce::Result::fail("Malformed base64 image payload");

    juce::MemoryOutputStream decoded;

    if (!juce::Base64::convertFromBase64(decoded, payload) || decoded.getDataSize() == 0)
        return juce::Result::fail("Malformed base64 image payload");

    imageFile = directory.getChildFile(baseName + "." + extensionForImageType(mimeType));

    if (!imageFile.replaceWithData(decoded.getData(), decoded.getDataSize()))
        return juce::Result::fail("Cannot write " + imageFile.getFullPathName());

    return juce::Result::ok();
}

juce::String AssetFetcher::extensionForImageType(const juce::String& mimeType)
{
    const juce::String subtype = mimeType.fromFirstOccurrenceOf("/", false, false).toLowerCase();

    if (subtype == "jpeg" || subtype == "jpg" || subtype == "pjpeg")
        return "jpg";

    if (subtype == "svg+xml")
        return "svg";

    const juce::String cleaned = subtype.retainCharacters("abcdefghijklmnopqrstuvwxyz0123456789");
    return cleaned.isNotEmpty() ? cleaned : juce::String("img");
}
