#pragma once
#include <cstdio>
#include "ProgressSink.h"

namespace RGET
{

// 控制台单行刷新：xx.x% (已下载/总大小) 速率/s
class ConsoleProgressSink : public ProgressSink
{
public:
    // showErrorDetail 为 false 时重试只提示失败，不打印具体错误
    explicit ConsoleProgressSink(FILE* out = stdout, bool showErrorDetail = true)
        : out_(out), showErrorDetail_(showErrorDetail) {}

    void onStart(const DownloadTask& task, std::optional<int64_t> total) override;
    void onAttempt(int attempt, int64_t offset) override;
    void onProgress(const ProgressSample& sample) override;
    void onCorrupt(const std::string& path, int64_t size) override;
    void onRetry(const RetryNotice& notice) override;
    void onFinished(const DownloadResult& result) override;

private:
    FILE* out_;
    bool showErrorDetail_;
};

}
