#include "AwsSigV4.h"
#include <ctime>

namespace
{
    juce::String toHex(const juce::MemoryBlock& block)
    {
        return juce::String::toHexString(block.getData(), (int) block.getSize(), 0);
    }

    juce::MemoryBlock utf8Block(const juce::String& text)
    {
        return juce::MemoryBlock(text.toRawUTF8(), text.getNumBytesAsUTF8());
    }
}

juce::MemoryBlock AwsSigV4::hmacSha256(const juce::MemoryBlock& key, const void* data, size_t numBytes)
{
    const size_t blockSize = 64;

    juce::MemoryBlock paddedKey = key.getSize() > blockSize ? juce::SHA256(key).getRawData() : key;
    paddedKey.ensureSize(blockSize, true);

    juce::MemoryBlock inner(blockSize), outer(blockSize);
    for (size_t i = 0; i < blockSize; ++i)
    {
        inner[i] = (char) (paddedKey[i] ^ 0x36);
        outer[i] = (char) (paddedKey[i] ^ 0x5c);
    }

    inner.append(data, numBytes);
    const juce::MemoryBlock innerHash = juce::SHA256(inner).getRawData();

    outer.append(innerHash.getData(), innerHash.getSize());
    return juce::SHA256(outer).getRawData();
}

juce::MemoryBlock AwsSigV4::hmacSha256(const juce::MemoryBlock& key, const juce::String& message)
{
    return hmacSha256(key, message.toRawUTF8(), message.getNumBytesAsUTF8());
}

juce::String AwsSigV4::sha256Hex(const void* data, size_t numBytes)
{
    return juce::SHA256(data, numBytes).toHexString();
}

juce::String AwsSigV4::uriEncode(const juce::String& text, bool encodeSlash)
{
    const char* utf8 = text.toRawUTF8();
    const size_t numBytes = text.getNumBytesAsUTF8();
    juce::String result;

    for (size_t i = 0; i < numBytes; ++i)
    {
        const auto c = (unsigned char) utf8[i];

        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
            || c == '-' || c == '_' || c == '.' || c == '~' || (c == '/' && !encodeSlash))
        {
            result += (juce::juce_wchar) c;
        }
        else
        {
            result += "%" + juce::String::toHexString((int) c).paddedLeft('0', 2).toUpperCase();
        }
    }

    return result;
}

juce::String AwsSigV4::formatAmzDate(juce::Time time)
{
    const std::time_t seconds = (std::time_t) (time.toMilliseconds() / 1000);
    std::tm utc {};

   #if JUCE_WINDOWS
    gmtime_s(&utc, &seconds);
   #else
    gmtime_r(&seconds, &utc);
   #endif

    char buffer[32] = { 0 };
    std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &utc);
    return juce::String(buffer);
}

juce::MemoryBlock AwsSigV4::deriveSigningKey(const Credentials& credentials, const juce::String& dateStamp)
{
    const auto dateKey = hmacSha256(utf8Block("AWS4" + credentials.secretAccessKey), dateStamp);
    const auto regionKey = hmacSha256(dateKey, credentials.region);
    const auto serviceKey = hmacSha256(regionKey, credentials.service);
    return hmacSha256(serviceKey, juce::String("aws4_request"));
}

juce::String AwsSigV4::buildCanonicalRequest(const juce::String& method,
                                             const juce::String& canonicalUri,
                                             const juce::String& canonicalQuery,
                                             const juce::StringPairArray& headers,
                                             const juce::String& payloadHash,
                                             juce::String& signedHeaders)
{
    std::vector<std::pair<juce::String, juce::String>> sortedHeaders;

    for (int i = 0; i < headers.size(); ++i)
        sortedHeaders.emplace_back(headers.getAllKeys()[i].trim().toLowerCase(),
                                   headers.getAllValues()[i].trim());

    std::sort(sortedHeaders.begin(), sortedHeaders.end(),
              [](const auto& a, const auto& b) { return a.first.compare(b.first) < 0; });

    juce::String canonicalHeaders;
    juce::StringArray names;

    for (const auto& header : sortedHeaders)
    {
        canonicalHeaders << header.first << ":" << header.second << "\n";
        names.add(header.first);
    }

    signedHeaders = names.joinIntoString(";");

    return method.toUpperCase() + "\n"
         + canonicalUri + "\n"
         + canonicalQuery + "\n"
         + canonicalHeaders + "\n"
         + signedHeaders + "\n"
         + payloadHash;
}

juce::String AwsSigV4::createAuthorization(const Credentials& credentials,
                                           const juce::String& method,
                                           const juce::String& canonicalUri,
                                           const juce::String& canonicalQuery,
                                           const juce::StringPairArray& headers,
                                           const juce::String& payloadHash,
                                           const juce::String& amzDate)
{
    juce::String signedHeaders;
    const juce::String canonicalRequest = buildCanonicalRequest(method, canonicalUri, canonicalQuery,
                                                                headers, payloadHash, signedHeaders);

    const juce::String dateStamp = amzDate.substring(0, 8);
    const juce::String scope = dateStamp + "/" + credentials.region + "/" + credentials.service + "/aws4_request";

    const juce::String stringToSign = "AWS4-HMAC-SHA256\n"
                                    + amzDate + "\n"
                                    + scope + "\n"
                                    + sha256Hex(canonicalRequest.toRawUTF8(), canonicalRequest.getNumBytesAsUTF8());

    const juce::String signature = toHex(hmacSha256(deriveSigningKey(credentials, dateStamp), stringToSign));

    return "AWS4-HMAC-SHA256 Credential=" + credentials.accessKeyId + "/" + scope
         + ", SignedHeaders=" + signedHeaders
         + ", Signature=" + signature;
}
