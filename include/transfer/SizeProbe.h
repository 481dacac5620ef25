#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include "HttpClient.h"

namespace RGET
{

struct ProbeResult
{
    std::optional<int64_t> size;     // nullopt: 服务器没有声明大小
    bool statusOk = false;
    long status = 0;
    bool acceptRanges = false;       // 服务器声明了 Accept-Ranges: bytes
    bool fromRangeProbe = false;     // 大小来自分段探测
};

// 下载前用 HEAD 取得远端文件大小
class SizeProbe
{
public:
    SizeProbe(HttpClient& client, const RequestOptions& opts, bool rangeFallback,
              AbortCheck shouldAbort = AbortCheck())
        : client_(client), opts_(opts), rangeFallback_(rangeFallback), shouldAbort_(std::move(shouldAbort)) {}

    // 超时、连不上、非 2xx 抛 ProbeError；shouldAbort 返回 true 时抛 CancelledError
    ProbeResult probe(const std::string& url);

private:
    // 请求前 RG_RANGE_PROBE_BYTES 字节，从 Content-Range 里取总长
    std::optional<int64_t> probeByRange(const std::string& url);

    bool stopRequested() const { return shouldAbort_ && shouldAbort_(); }

    HttpClient& client_;
    RequestOptions opts_;
    bool rangeFallback_;
    AbortCheck shouldAbort_;
};

}
