#pragma once
#include <cstdio>
#include <optional>
#include <string>
#include "DownloadTask.h"
#include "rg_conf.h"

namespace RGET
{

// 命令行参数，未给出的项为空，由配置文件或默认值补齐
struct Options
{
    std::string url;
    std::string proxy;
    std::optional<int> retryInterval;
    std::string outputDir;
    bool ignoreTls = false;             // 不校验证书，也不在控制台打印错误详情
    std::optional<int> maxAttempts;     // 0 表示不限
    std::string confName;
    bool json = false;
    bool quiet = false;
    bool help = false;
};

bool ParseOptions(int argc, char* const* argv, Options& opts, std::string& error);

void PrintUsage(FILE* out, const char* prog);

// 命令行 > 配置文件 > 默认值，生成下载任务；会创建下载目录
bool BuildTask(const Options& opts, RgConf& conf, DownloadTask& task, std::string& error);

}
