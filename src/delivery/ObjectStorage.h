#pragma once
#include <JuceHeader.h>
#include "../io/HttpClient.h"
#include "AwsSigV4.h"

/**
 * Destination for finished renders.
 */
class ObjectStorage
{
public:
    virtual ~ObjectStorage() = default;

    /**
     * Stores a file under the given key.
     * @param publicUrl Receives the address callers can fetch the object from
     */
    virtual juce::Result upload(const juce::File& file,
                                const juce::String& key,
                                const juce::String& contentType,
                                juce::String& publicUrl) = 0;

    /** renders/<projectId>/<renderId>.mp4 */
    static juce::String renderKeyFor(const juce::String& projectId, const juce::String& renderId);
};

//==============================================================================
/**
 * Uploads with a single SigV4-signed PUT to an S3-compatible endpoint
 * (path-style: <endpoint>/<bucket>/<key>). Defaults target Cloudflare R2.
 */
class S3ObjectStorage : public ObjectStorage
{
public:
    static constexpr int uploadTimeoutMs = 10 * 60 * 1000;

    struct Settings
    {
        juce::String endpoint;          // https://<account>.r2.cloudflarestorage.com
        juce::String bucket;
        juce::String publicBaseUrl;
        AwsSigV4::Credentials credentials;

        /** Lists the settings that are still missing; empty when uploads can work */
        juce::StringArray getMissingFields() const;
    };

    S3ObjectStorage(HttpClient& httpClient, const Settings& settings);

    juce::Result upload(const juce::File& file,
                        const juce::String& key,
                        const juce::String& contentType,
                        juce::String& publicUrl) override;

    /** <publicBaseUrl without trailing slash>/<key> */
    juce::String getPublicUrl(const juce::String& key) const;

    /** The endpoint's host, with ":<port>" when the endpoint names one */
    juce::String getHostHeader() const;

    /** Path-style canonical URI for a key: /<bucket>/<encoded key> */
    juce::String getCanonicalUri(const juce::String& key) const;

    /**
     * Builds the signed PUT request for an in-memory body.
     */
    HttpClient::Request buildPutRequest(const juce::String& key,
                                        const juce::String& contentType,
                                        juce::MemoryBlock body,
                                        juce::Time timestamp) const;

private:
    HttpClient& httpClient;
    Settings settings;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(S3ObjectStorage)
};
