#include "SizeProbe.h"
#include "DownloadException.h"
#include "HttpHeader.h"
#include "rg_logger.h"
#include "rg_macro.h"

namespace RGET
{

ProbeResult SizeProbe::probe(const std::string& url)
{
    ProbeResult result;
    HttpResponse resp;
    try
    {
        resp = client_.head(url, opts_, shouldAbort_);
    }
    catch(const TransferError& e)
    {
        if(stopRequested())
        {
            throw CancelledError("用户中断");
        }
        throw ProbeError(e.what(), e.httpStatus() ? e.httpStatus() : e.code());
    }
    if(resp.aborted || stopRequested())
    {
        throw CancelledError("用户中断");
    }

    result.status = resp.status;
    result.statusOk = resp.status >= 200 && resp.status < 300;
    if(!result.statusOk)
    {
        throw ProbeError("HEAD 请求返回状态码 " + std::to_string(resp.status), resp.status);
    }

    result.acceptRanges = ToLower(resp.header("accept-ranges")) == "bytes";

    std::optional<int64_t> length = ParseContentLength(resp.header("content-length"));
    if(length && *length > 0)
    {
        result.size = length;
        return result;
    }

    Logger::rg_log_error_core(RG_LOG_NOTICE, 0, "服务器没有声明文件大小: %s", url.c_str());
    if(rangeFallback_)
    {
        result.size = probeByRange(url);
        result.fromRangeProbe = result.size.has_value();
    }
    return result;
}

std::optional<int64_t> SizeProbe::probeByRange(const std::string& url)
{
    HttpResponse resp;
    size_t received = 0;
    try
    {
        resp = client_.get(url, opts_, MakeRangeHeader(0, RG_RANGE_PROBE_BYTES - 1),
            [&received](const HttpResponse&, const char*, size_t len) {
                received += len;
                return received < RG_RANGE_PROBE_BYTES;
            },
            shouldAbort_);
    }
    catch(const TransferError& e)
    {
        if(stopRequested())
        {
            throw CancelledError("用户中断");
        }
        Logger::rg_log_error_core(RG_LOG_NOTICE, 0, "分段探测失败: %s", e.what());
        return std::nullopt;
    }
    if(stopRequested())
    {
        throw CancelledError("用户中断");
    }

    if(resp.status == 206)
    {
        std::optional<int64_t> total = ParseContentRangeTotal(resp.header("content-range"));
        if(total && *total > 0)
        {
            Logger::rg_log_error_core(RG_LOG_INFO, 0, "分段探测得到文件大小 %lld", static_cast<long long>(*total));
            return total;
        }
        return std::nullopt;
    }

    // 服务器忽略了 Range，200 的 Content-Length 就是整个文件
    if(resp.status == 200)
    {
        std::optional<int64_t> length = ParseContentLength(resp.header("content-length"));
        if(length && *length > 0)
        {
            Logger::rg_log_error_core(RG_LOG_INFO, 0, "服务器忽略 Range，按 Content-Length 得到文件大小 %lld",
                                      static_cast<long long>(*length));
            return length;
        }
    }
    return std::nullopt;
}

}
