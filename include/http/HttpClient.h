#pragma once
#include <functional>
#include <map>
#include <string>

namespace RGET
{

// 一次请求的连接参数，由 DownloadTask 生成
struct RequestOptions
{
    std::string proxy;              // 已规范化的代理地址，空表示直连
    bool verifyTls = true;          // 校验服务器证书
    long connectTimeout = 10;       // 连接超时（秒）
    long readTimeout = 10;          // 读超时（秒），持续无数据视为断线，0 不限
    long totalTimeout = 0;          // 整个请求超时（秒），0 不限
    long maxRedirects = 10;         // 最多跟随的重定向次数
    size_t bufferSize = 4096;       // 每次回调交付的最大字节数
    std::string userAgent;
};

struct HttpResponse
{
    long status = 0;
    std::map<std::string, std::string> headers;  // 键统一小写，只保留最后一跳的头
    bool aborted = false;                        // 被 BodyHandler 或 AbortCheck 中止

    // 不存在返回空串
    std::string header(const std::string& name) const;
};

// 返回 false 中止传输；response 中已经有本次响应的状态码和头
using BodyHandler = std::function<bool(const HttpResponse& response, const char* data, size_t len)>;
// 返回 true 中止传输，连接卡住没有数据时也会被周期调用
using AbortCheck = std::function<bool()>;

// HTTP 传输接口
// 传输层失败（连接失败、超时、断线、4xx/5xx）抛 TransferError，中止不抛
class HttpClient
{
public:
    virtual ~HttpClient() = default;

    // 只取头部，shouldAbort 可为空
    virtual HttpResponse head(const std::string& url,
                              const RequestOptions& opts,
                              const AbortCheck& shouldAbort) = 0;

    // range 为空时不带 Range 头，例如 "bytes=100-"
    virtual HttpResponse get(const std::string& url,
                             const RequestOptions& opts,
                             const std::string& range,
                             const BodyHandler& onBody,
                             const AbortCheck& shouldAbort) = 0;
};

}
