#pragma once
#include <atomic>
#include <chrono>
#include "DownloadTask.h"
#include "FileArtifact.h"
#include "HttpClient.h"
#include "ProgressSink.h"
#include "TransferAttempt.h"

namespace RGET
{

// 断点续传状态机
//
// Probing -> ProbeFailed | AttemptLoop
// AttemptLoop 每一轮：
//   检查已有文件 -> 已完整（成功，不发请求）| 损坏（删除，从0开始）| 部分（续传）
//   Range 请求并写盘 -> 校验 -> 完整（成功）| 不完整（等待 retryInterval 后重试）
// 任何时候 stopFlag 置位都以 Cancelled 结束，文件保留以便下次续传；
// 设置了 maxAttempts 且用完则 Failed。续传位置每轮都从磁盘文件大小重新取得。
class ResumeEngine
{
public:
    ResumeEngine(const DownloadTask& task, HttpClient& client, ProgressSink& sink,
                 const std::atomic<int>& stopFlag);

    DownloadResult run();

private:
    // 本轮开始前检查磁盘上的文件，返回 true 表示文件已经完整
    bool checkExisting();
    // 校验本轮结果
    bool verify(const AttemptResult& ar) const;
    // 分片睡眠，期间收到中断抛 CancelledError
    void sleepInterruptible(std::chrono::seconds interval) const;

    DownloadResult finish(Outcome outcome, FailReason reason, const std::string& message);

    bool stopRequested() const { return stopFlag_.load() != 0; }

    const DownloadTask& task_;
    HttpClient& client_;
    ProgressSink& sink_;
    const std::atomic<int>& stopFlag_;
    FileArtifact file_;
    TransferState state_;
};

}
