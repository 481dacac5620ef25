#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "DownloadTask.h"

namespace RGET
{

struct ProgressSample
{
    int64_t offset = 0;                 // 已写入磁盘的字节数
    std::optional<int64_t> total;       // 服务器声明的大小
    double rate = 0;                    // 瞬时速率，字节/秒
};

struct RetryNotice
{
    int attempt = 0;                    // 刚失败的是第几次尝试
    int64_t offset = 0;
    std::optional<int64_t> total;
    std::chrono::seconds wait{0};
    std::string reason;
};

// 下载过程的观察者，核心逻辑只通过它对外输出
class ProgressSink
{
public:
    virtual ~ProgressSink() = default;

    // 探测完成，准备开始下载
    virtual void onStart(const DownloadTask& task, std::optional<int64_t> total) { (void)task; (void)total; }
    virtual void onAttempt(int attempt, int64_t offset) { (void)attempt; (void)offset; }
    virtual void onProgress(const ProgressSample& sample) = 0;
    // 已有文件校验失败被删除
    virtual void onCorrupt(const std::string& path, int64_t size) { (void)path; (void)size; }
    virtual void onRetry(const RetryNotice& notice) { (void)notice; }
    virtual void onFinished(const DownloadResult& result) { (void)result; }
};

class NullProgressSink : public ProgressSink
{
public:
    void onProgress(const ProgressSample&) override {}
};

}
