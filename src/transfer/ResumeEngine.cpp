#include "ResumeEngine.h"
#include <algorithm>
#include <thread>
#include "DownloadException.h"
#include "IntegrityChecker.h"
#include "SizeProbe.h"
#include "TransferAttempt.h"
#include "rg_logger.h"
#include "rg_macro.h"

namespace RGET
{

ResumeEngine::ResumeEngine(const DownloadTask& task, HttpClient& client, ProgressSink& sink,
                           const std::atomic<int>& stopFlag)
    : task_(task),
      client_(client),
      sink_(sink),
      stopFlag_(stopFlag),
      file_(task.filePath)
{
}

DownloadResult ResumeEngine::run()
{
    // 第一步：探测文件大小，失败不重试
    Logger::rg_log_error_core(RG_LOG_NOTICE, 0, "开始下载 %s -> %s", task_.url.c_str(), task_.filePath.c_str());
    if(!task_.verifyTls)
    {
        Logger::rg_log_error_core(RG_LOG_WARN, 0, "已关闭 TLS 证书校验: %s", task_.url.c_str());
    }

    try
    {
        SizeProbe probe(client_, task_.probeOptions(), task_.rangeProbeFallback,
                        [this] { return stopRequested(); });
        ProbeResult pr = probe.probe(task_.url);
        state_.expectedSize = pr.size;
    }
    catch(const ProbeError& e)
    {
        Logger::rg_log_error_core(RG_LOG_ERR, 0, "获取文件信息失败: %s", e.what());
        return finish(Outcome::Failed, FailReason::ProbeFailed, e.what());
    }
    catch(const CancelledError& e)
    {
        return finish(Outcome::Cancelled, FailReason::None, e.what());
    }

    if(state_.expectedSize)
    {
        Logger::rg_log_error_core(RG_LOG_INFO, 0, "文件大小 %lld 字节", static_cast<long long>(*state_.expectedSize));
    }
    else
    {
        Logger::rg_log_error_core(RG_LOG_WARN, 0, "无法获取文件大小，每次都从头下载且只能按非空校验");
    }
    sink_.onStart(task_, state_.expectedSize);

    // 第二步：重试循环
    try
    {
        while(state_.outcome == Outcome::Pending)
        {
            if(stopRequested())
            {
                throw CancelledError("用户中断");
            }

            state_.attempts++;

            try
            {
                if(checkExisting())
                {
                    return finish(Outcome::Succeeded, FailReason::None, "文件已完整");
                }
            }
            catch(const IntegrityError& e)
            {
                // 旧文件删不掉，本轮无法开始
                Logger::rg_log_error_core(RG_LOG_ERR, 0, "%s", e.what());
                return finish(Outcome::Failed, FailReason::FileError, e.what());
            }

            sink_.onAttempt(state_.attempts, state_.resumeOffset);
            Logger::rg_log_error_core(RG_LOG_INFO, 0, "第%d次尝试，从 %lld 字节开始",
                                      state_.attempts, static_cast<long long>(state_.resumeOffset));

            AttemptResult ar;
            try
            {
                TransferAttempt attempt(task_, client_, sink_, stopFlag_);
                ar = attempt.run(state_.resumeOffset, state_.expectedSize);
            }
            catch(const IntegrityError& e)
            {
                Logger::rg_log_error_core(RG_LOG_WARN, 0, "%s，删除本地文件后重新下载", e.what());
                file_.remove();
                ar = AttemptResult{0, AttemptOutcome::Retryable, e.what()};
            }

            if(ar.outcome == AttemptOutcome::Cancelled)
            {
                throw CancelledError(ar.error);
            }

            // 第三步：校验
            if(verify(ar))
            {
                return finish(Outcome::Succeeded, FailReason::None, "下载完成");
            }

            std::string reason = ar.error;
            if(reason.empty())
            {
                int64_t onDisk = file_.diskSize();
                reason = "连接已结束但文件不完整（" + std::to_string(onDisk < 0 ? 0 : onDisk) + " 字节）";
            }

            if(task_.maxAttempts && state_.attempts >= *task_.maxAttempts)
            {
                Logger::rg_log_error_core(RG_LOG_ERR, 0, "已尝试 %d 次，放弃: %s", state_.attempts, reason.c_str());
                return finish(Outcome::Failed, FailReason::AttemptsExhausted, reason);
            }

            RetryNotice notice;
            notice.attempt = state_.attempts;
            notice.offset = ar.newOffset;
            notice.total = state_.expectedSize;
            notice.wait = task_.retryInterval;
            notice.reason = reason;
            sink_.onRetry(notice);
            Logger::rg_log_error_core(RG_LOG_WARN, 0, "第%d次尝试失败（%lld 字节）: %s，%lld 秒后重试",
                                      state_.attempts, static_cast<long long>(ar.newOffset), reason.c_str(),
                                      static_cast<long long>(task_.retryInterval.count()));

            sleepInterruptible(task_.retryInterval);
        }
    }
    catch(const CancelledError& e)
    {
        return finish(Outcome::Cancelled, FailReason::None, e.what());
    }

    return finish(state_.outcome, FailReason::None, "");
}

bool ResumeEngine::checkExisting()
{
    // 不相信内存里的偏移，以磁盘为准
    int64_t onDisk = file_.diskSize();

    if(!state_.expectedSize)
    {
        // 大小未知时无法判断旧文件是否完整，一律丢弃
        if(onDisk >= 0)
        {
            Logger::rg_log_error_core(RG_LOG_NOTICE, 0, "文件大小未知，丢弃已有文件 %s（%lld 字节）",
                                      task_.filePath.c_str(), static_cast<long long>(onDisk));
            if(!file_.remove())
            {
                throw IntegrityError("无法删除已有文件 " + task_.filePath);
            }
        }
        state_.resumeOffset = 0;
        return false;
    }

    int64_t expected = *state_.expectedSize;
    if(onDisk < 0)
    {
        state_.resumeOffset = 0;
        return false;
    }

    if(onDisk >= expected)
    {
        if(IntegrityChecker::check(task_.filePath, expected))
        {
            state_.resumeOffset = expected;
            Logger::rg_log_error_core(RG_LOG_NOTICE, 0, "文件已完整: %s", task_.filePath.c_str());
            return true;
        }

        Logger::rg_log_error_core(RG_LOG_WARN, 0, "文件损坏（%lld/%lld 字节），删除后重新下载: %s",
                                  static_cast<long long>(onDisk), static_cast<long long>(expected),
                                  task_.filePath.c_str());
        sink_.onCorrupt(task_.filePath, onDisk);
        if(!file_.remove())
        {
            throw IntegrityError("无法删除损坏的文件 " + task_.filePath);
        }
        state_.resumeOffset = 0;
        return false;
    }

    state_.resumeOffset = onDisk;
    return false;
}

bool ResumeEngine::verify(const AttemptResult& ar) const
{
    if(!state_.expectedSize)
    {
        // 没有大小可比，只有服务器正常结束响应且文件非空才算完成
        return ar.outcome == AttemptOutcome::Completed &&
               IntegrityChecker::check(task_.filePath, std::nullopt);
    }
    return IntegrityChecker::check(task_.filePath, state_.expectedSize);
}

void ResumeEngine::sleepInterruptible(std::chrono::seconds interval) const
{
    auto deadline = std::chrono::steady_clock::now() + interval;
    while(std::chrono::steady_clock::now() < deadline)
    {
        if(stopRequested())
        {
            throw CancelledError("用户中断");
        }
        auto left = deadline - std::chrono::steady_clock::now();
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(left, std::chrono::milliseconds(100)));
    }
    if(stopRequested())
    {
        throw CancelledError("用户中断");
    }
}

DownloadResult ResumeEngine::finish(Outcome outcome, FailReason reason, const std::string& message)
{
    state_.outcome = outcome;

    int64_t onDisk = file_.diskSize();
    state_.resumeOffset = onDisk < 0 ? 0 : onDisk;

    DownloadResult result;
    result.outcome = outcome;
    result.reason = reason;
    result.filePath = task_.filePath;
    result.bytesOnDisk = state_.resumeOffset;
    result.expectedSize = state_.expectedSize;
    result.attempts = state_.attempts;
    result.message = message;

    switch(outcome)
    {
    case Outcome::Succeeded:
        Logger::rg_log_error_core(RG_LOG_NOTICE, 0, "下载完成: %s（%lld 字节，%d 次尝试）",
                                  task_.filePath.c_str(), static_cast<long long>(result.bytesOnDisk), result.attempts);
        break;
    case Outcome::Cancelled:
        Logger::rg_log_error_core(RG_LOG_NOTICE, 0, "用户中断，已保存 %lld 字节，再次执行从该位置继续: %s",
                                  static_cast<long long>(result.bytesOnDisk), task_.filePath.c_str());
        break;
    case Outcome::Failed:
        Logger::rg_log_error_core(RG_LOG_ERR, 0, "下载失败: %s", message.c_str());
        break;
    case Outcome::Pending:
        break;
    }

    sink_.onFinished(result);
    return result;
}

}
