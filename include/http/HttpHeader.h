#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace RGET
{

// "Content-Length: 12345" 的值部分，非法返回 nullopt
std::optional<int64_t> ParseContentLength(const std::string& value);

// "bytes 0-1023/12345" 或 "bytes */12345" 的总长度，"/*" 返回 nullopt
std::optional<int64_t> ParseContentRangeTotal(const std::string& value);

// "bytes 100-199/1000" 的起始位置
std::optional<int64_t> ParseContentRangeStart(const std::string& value);

// "bytes=<offset>-"
std::string MakeRangeHeader(int64_t offset);
std::string MakeRangeHeader(int64_t first, int64_t last);

std::string ToLower(std::string s);

}
