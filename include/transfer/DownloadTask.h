#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "HttpClient.h"
#include "rg_macro.h"

namespace RGET
{

// 一次下载调用的全部输入，创建后不再修改
struct DownloadTask
{
    std::string url;
    std::string filePath;                       // 目标文件完整路径
    std::string proxy;                          // 规范化后的代理，空表示不用代理
    std::chrono::seconds retryInterval{RG_DEFAULT_RETRY_INTERVAL};
    std::optional<int> maxAttempts;             // 不设置则无限重试

    bool verifyTls = true;
    long connectTimeout = RG_DEFAULT_CONNECT_TIMEOUT;
    long readTimeout = RG_DEFAULT_READ_TIMEOUT;
    long probeTimeout = RG_DEFAULT_PROBE_TIMEOUT;
    long maxRedirects = RG_DEFAULT_MAX_REDIRECTS;
    size_t blockSize = RG_DEFAULT_BLOCK_SIZE;
    bool rangeProbeFallback = true;             // 服务器不给大小时尝试分段探测
    std::string userAgent = RG_USER_AGENT;

    // 流式下载用的请求参数
    RequestOptions transferOptions() const;
    // 探测用的请求参数，带总超时
    RequestOptions probeOptions() const;
};

enum class Outcome
{
    Pending,
    Succeeded,
    Failed,
    Cancelled
};

enum class FailReason
{
    None,
    ProbeFailed,
    AttemptsExhausted,
    FileError       // 本地文件无法删除或创建
};

// 一次下载期间 ResumeEngine 独占的可变状态
struct TransferState
{
    std::optional<int64_t> expectedSize;        // nullopt: 服务器没有声明大小
    int64_t resumeOffset = 0;
    int attempts = 0;
    Outcome outcome = Outcome::Pending;
};

struct DownloadResult
{
    Outcome outcome = Outcome::Pending;
    FailReason reason = FailReason::None;
    std::string filePath;
    int64_t bytesOnDisk = 0;                    // 结束时磁盘上的文件大小，也是下次续传位置
    std::optional<int64_t> expectedSize;
    int attempts = 0;
    std::string message;

    // 进程退出码：成功和用户中断为0，探测失败2，重试耗尽1
    int exitCode() const;
};

const char* OutcomeName(Outcome outcome);

}
