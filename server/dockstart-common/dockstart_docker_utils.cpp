#include "dockstart_docker_internal.h"

#include <algorithm>
#include <sstream>
#include <string>

namespace dockstart
{

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    const auto total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<const char*>(contents), total);
    return total;
}

std::string TrimWhitespace(const std::string& value)
{
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return {};

    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string SanitizeForLog(const std::string& input, size_t maxLength)
{
    std::string sanitized;
    sanitized.reserve(std::min(input.size(), maxLength));

    size_t produced = 0;
    for (unsigned char ch : input)
    {
        if (produced >= maxLength)
            break;

        if (ch >= 32 && ch <= 126)
        {
            sanitized.push_back(static_cast<char>(ch));
            ++produced;
        }
        else
        {
            if (produced + 4 > maxLength)
                break;
            constexpr char hexDigits[] = "0123456789ABCDEF";
            sanitized.append("\\x");
            sanitized.push_back(hexDigits[(ch >> 4) & 0x0F]);
            sanitized.push_back(hexDigits[ch & 0x0F]);
            produced += 4;
        }
    }

    return sanitized;
}

bool ParseJson(const std::string& text, Json::Value& root, std::string* errors)
{
    Json::CharReaderBuilder builder;
    std::string errs;
    std::istringstream stream(text);
    const bool parsed = Json::parseFromStream(builder, stream, &root, &errs);
    if (!parsed && errors)
        *errors = errs;
    return parsed;
}

std::string WriteCompactJson(const Json::Value& value)
{
    Json::StreamWriterBuilder writerBuilder;
    writerBuilder["indentation"] = "";
    return Json::writeString(writerBuilder, value);
}

std::string ParseEngineErrorResponse(const std::string& response)
{
    const std::string trimmed = TrimWhitespace(response);
    if (trimmed.empty())
        return "empty response body";

    Json::Value errorJson;
    if (ParseJson(trimmed, errorJson) && errorJson.isObject())
    {
        if (errorJson.isMember("message") && errorJson["message"].isString())
        {
            const std::string message = errorJson["message"].asString();
            if (!message.empty())
                return message;
        }
    }

    return std::string{"raw="} + SanitizeForLog(trimmed);
}

std::string Base64UrlEncode(const std::string& input)
{
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string encoded;
    encoded.reserve(((input.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 3 <= input.size())
    {
        const unsigned int chunk = (static_cast<unsigned char>(input[i]) << 16) |
                                   (static_cast<unsigned char>(input[i + 1]) << 8) |
                                   static_cast<unsigned char>(input[i + 2]);
        encoded.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        encoded.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        encoded.push_back(kAlphabet[chunk & 0x3F]);
        i += 3;
    }

    const size_t remaining = input.size() - i;
    if (remaining == 1)
    {
        const unsigned int chunk = static_cast<unsigned char>(input[i]) << 16;
        encoded.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        encoded.append("==");
    }
    else if (remaining == 2)
    {
        const unsigned int chunk = (static_cast<unsigned char>(input[i]) << 16) |
                                   (static_cast<unsigned char>(input[i + 1]) << 8);
        encoded.push_back(kAlphabet[(chunk >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(chunk >> 12) & 0x3F]);
        encoded.push_back(kAlphabet[(chunk >> 6) & 0x3F]);
        encoded.push_back('=');
    }

    return encoded;
}

std::pair<std::string, std::string> SplitImageReference(const std::string& image)
{
    if (image.find('@') != std::string::npos)
        return {image, std::string{}};

    const auto lastSlash = image.rfind('/');
    const auto lastColon = image.rfind(':');
    if (lastColon != std::string::npos &&
        (lastSlash == std::string::npos || lastColon > lastSlash))
        return {image.substr(0, lastColon), image.substr(lastColon + 1)};

    return {image, "latest"};
}

bool FindPullError(const std::string& responseBody, std::string& error)
{
    std::istringstream stream(responseBody);
    std::string line;
    while (std::getline(stream, line))
    {
        const std::string trimmed = TrimWhitespace(line);
        if (trimmed.empty())
            continue;

        Json::Value progress;
        if (!ParseJson(trimmed, progress) || !progress.isObject())
            continue;

        if (progress.isMember("error"))
        {
            error = progress["error"].asString();
            return true;
        }
    }

    return false;
}

} // namespace dockstart
