#include "HttpHeader.h"
#include "HttpClient.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace RGET
{

std::string ToLower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::string HttpResponse::header(const std::string& name) const
{
    auto it = headers.find(ToLower(name));
    if(it == headers.end())
    {
        return "";
    }
    return it->second;
}

// 整串都是十进制数字才算合法
static std::optional<int64_t> ParseDigits(const std::string& s, size_t begin, size_t end)
{
    while(begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while(end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    if(begin == end)
    {
        return std::nullopt;
    }
    for(size_t i = begin; i < end; ++i)
    {
        if(!std::isdigit(static_cast<unsigned char>(s[i])))
        {
            return std::nullopt;
        }
    }

    std::string digits = s.substr(begin, end - begin);
    errno = 0;
    char* endPtr = nullptr;
    long long v = strtoll(digits.c_str(), &endPtr, 10);
    if(errno == ERANGE || endPtr == digits.c_str() || *endPtr != '\0')
    {
        return std::nullopt;
    }
    return static_cast<int64_t>(v);
}

std::optional<int64_t> ParseContentLength(const std::string& value)
{
    return ParseDigits(value, 0, value.size());
}

std::optional<int64_t> ParseContentRangeTotal(const std::string& value)
{
    std::string v = ToLower(value);
    if(v.compare(0, 5, "bytes") != 0)
    {
        return std::nullopt;
    }
    size_t slash = v.rfind('/');
    if(slash == std::string::npos)
    {
        return std::nullopt;
    }
    return ParseDigits(v, slash + 1, v.size());
}

std::optional<int64_t> ParseContentRangeStart(const std::string& value)
{
    size_t spacePos = value.find(' ');
    if(spacePos == std::string::npos)
    {
        return std::nullopt;
    }
    size_t dashPos = value.find('-', spacePos + 1);
    if(dashPos == std::string::npos)
    {
        return std::nullopt;
    }
    return ParseDigits(value, spacePos + 1, dashPos);
}

std::string MakeRangeHeader(int64_t offset)
{
    return "bytes=" + std::to_string(offset) + "-";
}

std::string MakeRangeHeader(int64_t first, int64_t last)
{
    return "bytes=" + std::to_string(first) + "-" + std::to_string(last);
}

}
