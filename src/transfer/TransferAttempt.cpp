#include "TransferAttempt.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include "DownloadException.h"
#include "FileArtifact.h"
#include "HttpHeader.h"
#include "RateTracker.h"
#include "rg_logger.h"
#include "rg_macro.h"

namespace RGET
{

AttemptResult TransferAttempt::run(int64_t offset, std::optional<int64_t> expectedSize)
{
    FileArtifact file(task_.filePath);
    std::ofstream out;
    int64_t pos = offset;
    bool opened = false;
    bool cancelled = false;
    std::string writeError;
    RateTracker tracker(offset);
    const size_t blockSize = task_.blockSize > 0 ? task_.blockSize : RG_DEFAULT_BLOCK_SIZE;

    auto closeFile = [&out] {
        if(out.is_open())
        {
            out.flush();
            out.close();
        }
    };

    BodyHandler onBody = [&](const HttpResponse& resp, const char* data, size_t len) -> bool {
        if(stopRequested())
        {
            cancelled = true;
            return false;
        }

        if(!opened)
        {
            bool append = offset > 0;
            if(append && resp.status == 200)
            {
                // 服务器不支持 Range，返回的是整个文件
                Logger::rg_log_error_core(RG_LOG_WARN, 0, "服务器忽略了 Range 请求，从头重新写入 %s", task_.filePath.c_str());
                append = false;
                pos = 0;
                tracker.reset(pos);
            }
            else if(append && resp.status == 206)
            {
                std::optional<int64_t> start = ParseContentRangeStart(resp.header("content-range"));
                if(start && *start != offset)
                {
                    writeError = "服务器返回的区间起点 " + std::to_string(*start) +
                                 " 与请求的 " + std::to_string(offset) + " 不符";
                    return false;
                }
            }

            if(!file.open(out, append))
            {
                writeError = "无法打开文件 " + task_.filePath + ": " + strerror(errno);
                return false;
            }
            opened = true;
        }

        size_t done = 0;
        while(done < len)
        {
            size_t n = std::min(blockSize, len - done);
            out.write(data + done, static_cast<std::streamsize>(n));
            if(!out)
            {
                writeError = std::string("写入文件失败: ") + strerror(errno);
                return false;
            }
            done += n;
            pos += static_cast<int64_t>(n);
        }

        double rate = 0;
        if(tracker.update(pos, rate))
        {
            sink_.onProgress(ProgressSample{pos, expectedSize, rate});
        }
        return true;
    };

    AbortCheck shouldAbort = [this] { return stopRequested(); };

    Logger::rg_log_error_core(RG_LOG_INFO, 0, "GET %s Range: %s", task_.url.c_str(), MakeRangeHeader(offset).c_str());

    HttpResponse resp;
    try
    {
        resp = client_.get(task_.url, task_.transferOptions(), MakeRangeHeader(offset), onBody, shouldAbort);
    }
    catch(const TransferError& e)
    {
        closeFile();
        sink_.onProgress(ProgressSample{pos, expectedSize, 0});

        if(e.httpStatus() == 416)
        {
            throw IntegrityError("服务器拒绝了续传区间 " + MakeRangeHeader(offset), 416);
        }
        if(stopRequested())
        {
            return AttemptResult{pos, AttemptOutcome::Cancelled, e.what()};
        }
        Logger::rg_log_error_core(RG_LOG_WARN, 0, "传输中断于 %lld 字节: %s", static_cast<long long>(pos), e.what());
        return AttemptResult{pos, AttemptOutcome::Retryable, e.what()};
    }
    closeFile();

    if(cancelled || (resp.aborted && stopRequested()))
    {
        sink_.onProgress(ProgressSample{pos, expectedSize, 0});
        Logger::rg_log_error_core(RG_LOG_NOTICE, 0, "用户中断，已写入 %lld 字节", static_cast<long long>(pos));
        return AttemptResult{pos, AttemptOutcome::Cancelled, "用户中断"};
    }
    if(!writeError.empty())
    {
        Logger::rg_log_error_core(RG_LOG_ERR, 0, "%s", writeError.c_str());
        return AttemptResult{pos, AttemptOutcome::Retryable, writeError};
    }

    return AttemptResult{pos, AttemptOutcome::Completed, ""};
}

}
