#include "ObjectStorage.h"

juce::String ObjectStorage::renderKeyFor(const juce::String& projectId, const juce::String& renderId)
{
    const juce::String project = projectId.trim().isNotEmpty() ? projectId.trim() : juce::String("unknown");
    return "renders/" + project + "/" + renderId.trim() + ".mp4";
}

//==============================================================================
juce::StringArray S3ObjectStorage::Settings::getMissingFields() const
{
    juce::StringArray missing;

    if (endpoint.isEmpty())                     missing.add("endpoint");
    if (bucket.isEmpty())                       missing.add("bucket");
    if (credentials.accessKeyId.isEmpty())      missing.add("access key id");
    if (credentials.secretAccessKey.isEmpty())  missing.add("secret access key");
    if (publicBaseUrl.isEmpty())                missing.add("public base URL");

    return missing;
}

S3ObjectStorage::S3ObjectStorage(HttpClient& httpClient, const Settings& settings)
    : httpClient(httpClient),
      settings(settings)
{
}

juce::String S3ObjectStorage::getPublicUrl(const juce::String& key) const
{
    return settings.publicBaseUrl.trimCharactersAtEnd("/") + "/" + key;
}

juce::String S3ObjectStorage::getHostHeader() const
{
    const juce::URL endpointUrl(settings.endpoint);
    const int port = endpointUrl.getPort();

    return port > 0 ? endpointUrl.getDomain() + ":" + juce::String(port) : endpointUrl.getDomain();
}

juce::String S3ObjectStorage::getCanonicalUri(const juce::String& key) const
{
    return "/" + AwsSigV4::uriEncode(settings.bucket, true) + "/" + AwsSigV4::uriEncode(key, false);
}

HttpClient::Request S3ObjectStorage::buildPutRequest(const juce::String& key,
                                                     const juce::String& contentType,
                                                     juce::MemoryBlock body,
                                                     juce::Time timestamp) const
{
    const juce::String amzDate = AwsSigV4::formatAmzDate(timestamp);
    const juce::String payloadHash = AwsSigV4::sha256Hex(body.getData(), body.getSize());
    const juce::String canonicalUri = getCanonicalUri(key);

    juce::StringPairArray signedHeaders;
    signedHeaders.set("host", getHostHeader());
    signedHeaders.set("content-type", contentType);
    signedHeaders.set("x-amz-content-sha256", payloadHash);
    signedHeaders.set("x-amz-date", amzDate);

    HttpClient::Request request;
    request.method = "PUT";
    request.url = juce::URL(settings.endpoint.trimCharactersAtEnd("/") + canonicalUri);
    request.timeoutMs = uploadTimeoutMs;
    request.body = std::move(body);

    // The HTTP layer sets Host itself from the URL
    request.headers.set("Content-Type", contentType);
    request.headers.set("x-amz-content-sha256", payloadHash);
    request.headers.set("x-amz-date", amzDate);
    request.headers.set("Authorization", AwsSigV4::createAuthorization(settings.credentials, "PUT", canonicalUri, {},
                                                                      signedHeaders, payloadHash, amzDate));
    return request;
}

juce::Result S3ObjectStorage::upload(const juce::File& file,
                                     const juce::String& key,
                                     const juce::String& contentType,
                                     juce::String& publicUrl)
{
    const auto missing = settings.getMissingFields();
    if (!missing.isEmpty())
        return juce::Result::fail("Object storage is not configured (missing " + missing.joinIntoString(", ") + ")");

    juce::MemoryBlock body;
    if (!file.loadFileAsData(body) || body.getSize() == 0)
        return juce::Result::fail("Cannot read render output " + file.getFullPathName());

    juce::Logger::writeToLog("Uploading " + file.getFileName() + " (" + juce::String((juce::int64) body.getSize() / 1024)
                             + " KB) to " + settings.bucket + "/" + key);

    HttpClient::Response response;
    auto result = httpClient.send(buildPutRequest(key, contentType, std::move(body), juce::Time::getCurrentTime()), response);

    if (result.failed())
        return juce::Result::fail("Upload failed: " + result.getErrorMessage());

    if (!response.isSuccess())
        return juce::Result::fail("Upload failed: HTTP " + juce::String(response.statusCode) + " "
                                  + response.getBodyAsString().substring(0, 300));

    publicUrl = getPublicUrl(key);
    return juce::Result::ok();
}
