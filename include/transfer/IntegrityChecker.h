#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace RGET
{

class IntegrityChecker
{
public:
    // 文件存在、大小与 expectedSize 相同（已知时）、头部能读出数据才算完整
    static bool check(const std::string& path, std::optional<int64_t> expectedSize);
};

}
