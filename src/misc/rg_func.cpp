#include "rg_func.h"
#include <curl/curl.h>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <system_error>
#include "rg_logger.h"
#include "rg_macro.h"

namespace fs = std::filesystem;

namespace RGET
{

std::string FormatSize(double size)
{
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    const int unitCount = sizeof(units) / sizeof(units[0]);

    int idx = 0;
    while(size >= 1024 && idx < unitCount - 1)
    {
        size /= 1024;
        idx++;
    }

    char buf[64];
    snprintf(buf, sizeof(buf), "%.2f %s", size, units[idx]);
    return buf;
}

std::string FilenameFromUrl(const std::string& url)
{
    std::string path;

    std::unique_ptr<CURLU, decltype(&curl_url_cleanup)> h(curl_url(), &curl_url_cleanup);
    char* part = nullptr;
    if(h && curl_url_set(h.get(), CURLUPART_URL, url.c_str(), 0) == CURLUE_OK &&
       curl_url_get(h.get(), CURLUPART_PATH, &part, 0) == CURLUE_OK)
    {
        path = part;
        curl_free(part);
    }
    else
    {
        // 解析不了就手工去掉 scheme、查询串和片段
        path = url;
        size_t scheme = path.find("://");
        if(scheme != std::string::npos)
        {
            size_t slash = path.find('/', scheme + 3);
            path = (slash == std::string::npos) ? "" : path.substr(slash);
        }
        size_t q = path.find_first_of("?#");
        if(q != std::string::npos)
        {
            path.erase(q);
        }
    }

    size_t slash = path.find_last_of('/');
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    size_t q = name.find('?');
    if(q != std::string::npos)
    {
        name.erase(q);
    }
    if(name.empty() || name == "." || name == "..")
    {
        return RG_DEFAULT_FILENAME;
    }
    return name;
}

bool NormalizeProxy(const std::string& proxy, std::string& normalized, std::string& error)
{
    normalized.clear();
    if(proxy.empty())
    {
        return true;
    }

    std::string scheme = "http";
    std::string rest = proxy;
    size_t sep = proxy.find("://");
    if(sep != std::string::npos)
    {
        scheme = proxy.substr(0, sep);
        rest = proxy.substr(sep + 3);
        if(scheme != "http" && scheme != "https" && scheme != "socks5" && scheme != "socks5h")
        {
            error = "不支持的代理协议: " + scheme;
            return false;
        }
    }
    while(!rest.empty() && rest.back() == '/')
    {
        rest.pop_back();
    }

    size_t colon = rest.rfind(':');
    if(colon == std::string::npos || colon == 0)
    {
        error = "代理地址格式错误，应为：地址:端口（如：127.0.0.1:8080）";
        return false;
    }

    std::string port = rest.substr(colon + 1);
    if(port.empty() || port.find_first_not_of("0123456789") != std::string::npos || port.size() > 5)
    {
        error = "端口号必须是数字";
        return false;
    }
    int portNum = atoi(port.c_str());
    if(portNum < 1 || portNum > 65535)
    {
        error = "端口号应在1-65535之间";
        return false;
    }

    normalized = scheme + "://" + rest;
    return true;
}

std::string DefaultDownloadDir()
{
    fs::path dir;
    const char* xdg = getenv("XDG_DOWNLOAD_DIR");
    const char* home = getenv("HOME");
    if(xdg != nullptr && xdg[0] != '\0')
    {
        dir = xdg;
    }
    else if(home != nullptr && home[0] != '\0')
    {
        dir = fs::path(home) / "Downloads";
    }
    else
    {
        return ".";
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if(ec)
    {
        Logger::rg_log_error_core(RG_LOG_WARN, ec.value(), "无法创建下载目录 %s，改用当前目录", dir.c_str());
        return ".";
    }
    return dir.string();
}

std::string JoinPath(const std::string& dir, const std::string& name)
{
    if(dir.empty())
    {
        return name;
    }
    return (fs::path(dir) / name).string();
}

}
