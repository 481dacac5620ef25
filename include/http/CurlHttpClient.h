#pragma once
#include <curl/curl.h>
#include <exception>
#include <memory>
#include <string>
#include "HttpClient.h"

namespace RGET
{

// curl_global_init / curl_global_cleanup，main 中持有一个
class CurlGlobal
{
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

    bool ok() const { return code_ == CURLE_OK; }

private:
    CURLcode code_;
};

// libcurl easy 接口实现，句柄在请求之间复用以保持连接
class CurlHttpClient : public HttpClient
{
public:
    CurlHttpClient();
    ~CurlHttpClient() override = default;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse head(const std::string& url,
                      const RequestOptions& opts,
                      const AbortCheck& shouldAbort) override;

    HttpResponse get(const std::string& url,
                     const RequestOptions& opts,
                     const std::string& range,
                     const BodyHandler& onBody,
                     const AbortCheck& shouldAbort) override;

private:
    // 一次请求在回调间共享的上下文
    struct Transfer
    {
        CURL* curl = nullptr;
        HttpResponse* response = nullptr;
        const BodyHandler* onBody = nullptr;
        const AbortCheck* shouldAbort = nullptr;
        bool stopped = false;               // 由我们主动中止
        std::exception_ptr error;           // 回调里抛出的异常，perform 之后重新抛出
    };

    void applyOptions(const RequestOptions& opts, Transfer& t, char* errbuf);
    void applyAbortCheck(Transfer& t);
    HttpResponse perform(const std::string& url, Transfer& t, const char* errbuf);

    static size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata);
    static size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static int XferInfoCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                                curl_off_t ultotal, curl_off_t ulnow);

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
};

}
