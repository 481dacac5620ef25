#include "FakeHttpClient.h"
#include <algorithm>
#include <cstdio>
#include <thread>
#include "DownloadException.h"

namespace RGET
{
namespace test
{

namespace
{

// "bytes=a-" 或 "bytes=a-b"，b 缺省为 -1
bool ParseRange(const std::string& range, long long& first, long long& last)
{
    first = 0;
    last = -1;
    if(range.empty())
    {
        return false;
    }
    if(sscanf(range.c_str(), "bytes=%lld-%lld", &first, &last) >= 1)
    {
        return true;
    }
    return false;
}

}

HttpResponse FakeHttpClient::head(const std::string& url,
                                  const RequestOptions& opts,
                                  const AbortCheck& shouldAbort)
{
    (void)url;
    headCalls++;
    seenOptions.push_back(opts);

    HttpResponse resp;
    if(shouldAbort && shouldAbort())
    {
        resp.aborted = true;
        return resp;
    }
    if(headThrows)
    {
        throw TransferError("Could not resolve host", 6);
    }

    resp.status = headStatus;
    if(sendContentLength)
    {
        int64_t len = headLengthOverride ? *headLengthOverride : static_cast<int64_t>(body_.size());
        resp.headers["content-length"] = std::to_string(len);
    }
    resp.headers["accept-ranges"] = honorRange ? "bytes" : "none";
    return resp;
}

HttpResponse FakeHttpClient::get(const std::string& url,
                                 const RequestOptions& opts,
                                 const std::string& range,
                                 const BodyHandler& onBody,
                                 const AbortCheck& shouldAbort)
{
    (void)url;
    getCalls++;
    ranges.push_back(range);
    seenOptions.push_back(opts);

    int64_t drop = -1;
    if(!dropAfter.empty())
    {
        drop = dropAfter.front();
        dropAfter.pop_front();
    }
    int64_t close = -1;
    if(!closeAfter.empty())
    {
        close = closeAfter.front();
        closeAfter.pop_front();
    }

    const int64_t size = static_cast<int64_t>(body_.size());
    HttpResponse resp;
    int64_t begin = 0;
    int64_t end = size;

    long long first = 0;
    long long last = -1;
    if(honorRange && ParseRange(range, first, last))
    {
        if(first >= size)
        {
            throw TransferError("The requested URL returned error: 416", 22, 416);
        }
        begin = first;
        if(last >= 0 && last + 1 < end)
        {
            end = last + 1;
        }
        resp.status = 206;
        resp.headers["content-range"] = "bytes " + std::to_string(begin) + "-" +
                                        std::to_string(end - 1) + "/" + std::to_string(size);
    }
    else
    {
        resp.status = 200;
    }
    resp.headers["content-length"] = std::to_string(end - begin);

    const int64_t block = static_cast<int64_t>(opts.bufferSize > 0 ? opts.bufferSize : 4096);
    int64_t pos = begin;
    int64_t sent = 0;
    while(pos < end)
    {
        if(pos > begin && chunkDelay.count() > 0)
        {
            std::this_thread::sleep_for(chunkDelay);
        }
        if(shouldAbort && shouldAbort())
        {
            resp.aborted = true;
            return resp;
        }
        if(drop >= 0 && sent >= drop)
        {
            throw TransferError("Recv failure: Connection reset by peer", 56);
        }
        if(close >= 0 && sent >= close)
        {
            return resp;
        }

        int64_t n = std::min(block, end - pos);
        if(drop >= 0)
        {
            n = std::min(n, drop - sent);
        }
        if(close >= 0)
        {
            n = std::min(n, close - sent);
        }
        if(stopAt && pos < *stopAt)
        {
            n = std::min(n, *stopAt - pos);
        }

        if(!onBody(resp, body_.data() + pos, static_cast<size_t>(n)))
        {
            resp.aborted = true;
            return resp;
        }
        pos += n;
        sent += n;

        if(stopAt && stopFlag && pos >= *stopAt)
        {
            stopFlag->store(1);
        }
    }
    return resp;
}

}
}
