#include "CurlHttpClient.h"
#include <cstring>
#include <string>
#include "DownloadException.h"
#include "HttpHeader.h"
#include "rg_logger.h"
#include "rg_macro.h"

namespace RGET
{

CurlGlobal::CurlGlobal() : code_(curl_global_init(CURL_GLOBAL_DEFAULT))
{
    if(code_ != CURLE_OK)
    {
        Logger::rg_log_error_core(RG_LOG_EMERG, 0, "curl_global_init() 失败: %s", curl_easy_strerror(code_));
    }
}

CurlGlobal::~CurlGlobal()
{
    if(code_ == CURLE_OK)
    {
        curl_global_cleanup();
    }
}

CurlHttpClient::CurlHttpClient() : curl_(curl_easy_init(), &curl_easy_cleanup)
{
    if(!curl_)
    {
        throw TransferError("curl_easy_init() 失败");
    }
}

HttpResponse CurlHttpClient::head(const std::string& url,
                                  const RequestOptions& opts,
                                  const AbortCheck& shouldAbort)
{
    HttpResponse response;
    Transfer t;
    t.curl = curl_.get();
    t.response = &response;
    t.shouldAbort = shouldAbort ? &shouldAbort : nullptr;

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_reset(t.curl);
    applyOptions(opts, t, errbuf);
    curl_easy_setopt(t.curl, CURLOPT_NOBODY, 1L);
    applyAbortCheck(t);

    return perform(url, t, errbuf);
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const RequestOptions& opts,
                                 const std::string& range,
                                 const BodyHandler& onBody,
                                 const AbortCheck& shouldAbort)
{
    HttpResponse response;
    Transfer t;
    t.curl = curl_.get();
    t.response = &response;
    t.onBody = onBody ? &onBody : nullptr;
    t.shouldAbort = shouldAbort ? &shouldAbort : nullptr;

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_reset(t.curl);
    applyOptions(opts, t, errbuf);

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, &curl_slist_free_all);
    if(!range.empty())
    {
        std::string line = "Range: " + range;
        headers.reset(curl_slist_append(nullptr, line.c_str()));
        if(!headers)
        {
            throw TransferError("curl_slist_append() 失败");
        }
        curl_easy_setopt(t.curl, CURLOPT_HTTPHEADER, headers.get());
    }

    curl_easy_setopt(t.curl, CURLOPT_WRITEFUNCTION, &CurlHttpClient::WriteCallback);
    curl_easy_setopt(t.curl, CURLOPT_WRITEDATA, &t);

    applyAbortCheck(t);

    return perform(url, t, errbuf);
}

void CurlHttpClient::applyOptions(const RequestOptions& opts, Transfer& t, char* errbuf)
{
    CURL* curl = t.curl;
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, opts.maxRedirects);

    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, opts.connectTimeout);
    if(opts.totalTimeout > 0)
    {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, opts.totalTimeout);
    }
    if(opts.readTimeout > 0)
    {
        // readTimeout 秒内平均速度低于 1 字节/秒即判定为断线
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, opts.readTimeout);
    }

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, opts.verifyTls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, opts.verifyTls ? 2L : 0L);

    if(!opts.proxy.empty())
    {
        // 同一个代理同时用于 http 和 https
        curl_easy_setopt(curl, CURLOPT_PROXY, opts.proxy.c_str());
        curl_easy_setopt(curl, CURLOPT_PROXY_SSL_VERIFYPEER, opts.verifyTls ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_PROXY_SSL_VERIFYHOST, opts.verifyTls ? 2L : 0L);
    }
    if(!opts.userAgent.empty())
    {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, opts.userAgent.c_str());
    }
    if(opts.bufferSize > 0)
    {
        curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(opts.bufferSize));
    }

    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &CurlHttpClient::HeaderCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &t);
}

// 连接、等待响应期间也会周期回调，卡住的请求同样能被中断
void CurlHttpClient::applyAbortCheck(Transfer& t)
{
    if(t.shouldAbort)
    {
        curl_easy_setopt(t.curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(t.curl, CURLOPT_XFERINFOFUNCTION, &CurlHttpClient::XferInfoCallback);
        curl_easy_setopt(t.curl, CURLOPT_XFERINFODATA, &t);
    }
}

HttpResponse CurlHttpClient::perform(const std::string& url, Transfer& t, const char* errbuf)
{
    curl_easy_setopt(t.curl, CURLOPT_URL, url.c_str());

    CURLcode res = curl_easy_perform(t.curl);

    long status = 0;
    curl_easy_getinfo(t.curl, CURLINFO_RESPONSE_CODE, &status);
    t.response->status = status;

    if(t.error)
    {
        std::rethrow_exception(t.error);
    }

    if(res == CURLE_OK)
    {
        return *t.response;
    }

    if(t.stopped && (res == CURLE_WRITE_ERROR || res == CURLE_ABORTED_BY_CALLBACK))
    {
        t.response->aborted = true;
        return *t.response;
    }

    std::string msg = curl_easy_strerror(res);
    if(errbuf[0] != '\0')
    {
        msg += ": ";
        msg += errbuf;
    }

    if(res == CURLE_HTTP_RETURNED_ERROR)
    {
        throw TransferError(msg, res, status);
    }
    throw TransferError(msg, res);
}

size_t CurlHttpClient::HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata)
{
    Transfer* t = static_cast<Transfer*>(userdata);
    size_t len = size * nitems;
    std::string line(buffer, len);

    while(!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    {
        line.pop_back();
    }

    // 新的状态行（重定向或 100 Continue 之后），丢弃上一跳的头
    if(line.compare(0, 5, "HTTP/") == 0)
    {
        t->response->headers.clear();
        return len;
    }

    size_t colon = line.find(':');
    if(colon == std::string::npos)
    {
        return len;
    }

    std::string key = ToLower(line.substr(0, colon));
    std::string value = line.substr(colon + 1);
    size_t first = value.find_first_not_of(" \t");
    value = (first == std::string::npos) ? "" : value.substr(first);

    t->response->headers[key] = value;
    return len;
}

size_t CurlHttpClient::WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    Transfer* t = static_cast<Transfer*>(userdata);
    size_t len = size * nmemb;

    if(t->onBody == nullptr)
    {
        return len;
    }

    long status = 0;
    curl_easy_getinfo(t->curl, CURLINFO_RESPONSE_CODE, &status);
    t->response->status = status;

    try
    {
        if(!(*t->onBody)(*t->response, ptr, len))
        {
            t->stopped = true;
            return 0;
        }
    }
    catch(...)
    {
        // 异常不能穿过 libcurl 的 C 栈，perform 结束后重新抛出
        t->error = std::current_exception();
        t->stopped = true;
        return 0;
    }
    return len;
}

int CurlHttpClient::XferInfoCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    Transfer* t = static_cast<Transfer*>(clientp);
    if(t->shouldAbort && (*t->shouldAbort)())
    {
        t->stopped = true;
        return 1;
    }
    return 0;
}

}
