#pragma once
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include "DownloadTask.h"
#include "HttpClient.h"
#include "ProgressSink.h"

namespace RGET
{

enum class AttemptOutcome
{
    Completed,   // 服务器正常结束了响应
    Retryable,   // 网络错误或写盘失败，已写入的部分保留
    Cancelled    // 用户中断
};

struct AttemptResult
{
    int64_t newOffset = 0;
    AttemptOutcome outcome = AttemptOutcome::Retryable;
    std::string error;
};

// 一次 Range 请求：从 offset 开始流式写入目标文件
class TransferAttempt
{
public:
    TransferAttempt(const DownloadTask& task, HttpClient& client, ProgressSink& sink,
                    const std::atomic<int>& stopFlag)
        : task_(task), client_(client), sink_(sink), stopFlag_(stopFlag) {}

    // offset > 0 追加写，否则新建/截断
    // 服务器返回 416 时抛 IntegrityError，本地文件需要丢弃
    AttemptResult run(int64_t offset, std::optional<int64_t> expectedSize);

private:
    bool stopRequested() const { return stopFlag_.load() != 0; }

    const DownloadTask& task_;
    HttpClient& client_;
    ProgressSink& sink_;
    const std::atomic<int>& stopFlag_;
};

}
