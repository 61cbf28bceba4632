#include "HttpMessage.h"

namespace
{
    int findHeaderTerminator(const juce::MemoryBlock& data)
    {
        const auto* bytes = static_cast<const char*>(data.getData());
        const int size = (int) data.getSize();

        for (int i = 0; i + 3 < size; ++i)
            if (bytes[i] == '\r' && bytes[i + 1] == '\n' && bytes[i + 2] == '\r' && bytes[i + 3] == '\n')
                return i;

        return -1;
    }
}

HttpResponse HttpResponse::json(int statusCode, const juce::var& body)
{
    HttpResponse response;
    response.statusCode = statusCode;
    response.body = body;
    return response;
}

HttpResponse HttpResponse::error(int statusCode, const juce::String& message)
{
    auto* object = new juce::DynamicObject();
    object->setProperty("error", message);
    return json(statusCode, juce::var(object));
}

//==============================================================================
HttpMessage::ParseStatus HttpMessage::parseRequest(const juce::MemoryBlock& received, HttpRequest& request)
{
    const int headerEnd = findHeaderTerminator(received);

    if (headerEnd < 0)
        return (int) received.getSize() > maxHeaderSize ? ParseStatus::TooLarge : ParseStatus::Incomplete;

    if (headerEnd > maxHeaderSize)
        return ParseStatus::TooLarge;

    const auto headerText = juce::String::fromUTF8(static_cast<const char*>(received.getData()), headerEnd);
    auto lines = juce::StringArray::fromLines(headerText);

    if (lines.isEmpty())
        return ParseStatus::Malformed;

    auto requestLine = juce::StringArray::fromTokens(lines[0].trim(), " ", "");
    requestLine.removeEmptyStrings();

    if (requestLine.size() != 3 || !requestLine[2].startsWith("HTTP/1."))
        return ParseStatus::Malformed;

    HttpRequest parsed;
    parsed.method = requestLine[0].toUpperCase();
    parsed.path = requestLine[1].upToFirstOccurrenceOf("?", false, false);

    if (!parsed.path.startsWithChar('/'))
        return ParseStatus::Malformed;

    for (int i = 1; i < lines.size(); ++i)
    {
        if (lines[i].isEmpty())
            continue;

        const int colon = lines[i].indexOfChar(':');
        if (colon <= 0)
            return ParseStatus::Malformed;

        parsed.headers.set(lines[i].substring(0, colon).trim().toLowerCase(),
                           lines[i].substring(colon + 1).trim());
    }

    if (parsed.getHeader("transfer-encoding").isNotEmpty())
        return ParseStatus::Malformed;

    juce::int64 contentLength = 0;
    const juce::String lengthHeader = parsed.getHeader("content-length");

    if (lengthHeader.isNotEmpty())
    {
        if (!lengthHeader.containsOnly("0123456789") || lengthHeader.length() > 12)
            return ParseStatus::Malformed;

        contentLength = lengthHeader.getLargeIntValue();
    }

    if (contentLength > maxBodySize)
        return ParseStatus::TooLarge;

    const juce::int64 bodyStart = headerEnd + 4;
    const juce::int64 available = (juce::int64) received.getSize() - bodyStart;

    if (available < contentLength)
        return ParseStatus::Incomplete;

    parsed.body = juce::MemoryBlock(static_cast<const char*>(received.getData()) + bodyStart, (size_t) contentLength);
    request = parsed;
    return ParseStatus::Complete;
}

juce::MemoryBlock HttpMessage::formatResponse(const HttpResponse& response)
{
    const juce::String body = juce::JSON::toString(response.body, true);
    const auto bodyUtf8 = body.toUTF8();
    const size_t bodyBytes = bodyUtf8.sizeInBytes() - 1;

    juce::String head;
    head << "HTTP/1.1 " << response.statusCode << " " << getReasonPhrase(response.statusCode) << "\r\n"
         << "Content-Type: application/json\r\n"
         << "Content-Length: " << (int) bodyBytes << "\r\n"
         << "Connection: close\r\n"
         << "\r\n";

    juce::MemoryBlock data;
    data.append(head.toRawUTF8(), head.getNumBytesAsUTF8());
    data.append(bodyUtf8.getAddress(), bodyBytes);
    return data;
}

juce::String HttpMessage::getReasonPhrase(int statusCode)
{
    switch (statusCode)
    {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  break;
    }

    return "Unknown";
}
