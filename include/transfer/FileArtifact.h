#pragma once
#include <cstdint>
#include <fstream>
#include <string>
#include <utility>

namespace RGET
{

// 目标文件本身就是续传检查点，不另存元数据
class FileArtifact
{
public:
    explicit FileArtifact(std::string path) : path_(std::move(path)) {}

    // 磁盘上的大小，不存在返回 -1
    int64_t diskSize() const;
    // 删除，不存在也算成功
    bool remove() const;

    // append 为 true 时追加写，否则新建/截断
    bool open(std::ofstream& out, bool append) const;

private:
    std::string path_;
};

}
