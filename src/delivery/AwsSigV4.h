#pragma once
#include <JuceHeader.h>

/**
 * AWS Signature Version 4 request signing, as accepted by S3 and S3-compatible
 * stores such as Cloudflare R2. Hashing uses juce::SHA256.
 */
class AwsSigV4
{
public:
    struct Credentials
    {
        juce::String accessKeyId;
        juce::String secretAccessKey;
        juce::String region = "auto";
        juce::String service = "s3";
    };

    /** HMAC-SHA256 of a message under a binary key */
    static juce::MemoryBlock hmacSha256(const juce::MemoryBlock& key, const void* data, size_t numBytes);
    static juce::MemoryBlock hmacSha256(const juce::MemoryBlock& key, const juce::String& message);

    /** Lowercase hex SHA-256 of a block of bytes */
    static juce::String sha256Hex(const void* data, size_t numBytes);

    /** RFC 3986 encoding; '/' is kept when encodeSlash is false (object keys in paths) */
    static juce::String uriEncode(const juce::String& text, bool encodeSlash);

    /** YYYYMMDD'T'HHMMSS'Z' in UTC */
    static juce::String formatAmzDate(juce::Time time);

    /** Signing key derived from the secret for one date/region/service scope */
    static juce::MemoryBlock deriveSigningKey(const Credentials& credentials, const juce::String& dateStamp);

    /**
     * Builds the canonical request.
     * @param headers Headers to sign; names are lowercased and values trimmed
     * @param signedHeaders Receives the ';'-joined sorted header names
     */
    static juce::String buildCanonicalRequest(const juce::String& method,
                                              const juce::String& canonicalUri,
                                              const juce::String& canonicalQuery,
                                              const juce::StringPairArray& headers,
                                              const juce::String& payloadHash,
                                              juce::String& signedHeaders);

    /**
     * Returns the value of the Authorization header for a request.
     * @param amzDate The same timestamp sent as x-amz-date
     */
    static juce::String createAuthorization(const Credentials& credentials,
                                            const juce::String& method,
                                            const juce::String& canonicalUri,
                                            const juce::String& canonicalQuery,
                                            const juce::StringPairArray& headers,
                                            const juce::String& payloadHash,
                                            const juce::String& amzDate);
};
