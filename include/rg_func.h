#pragma once
#include <cstdint>
#include <string>

namespace RGET
{

// 1536 -> "1.50 KB"
std::string FormatSize(double size);

// URL 路径的最后一段，去掉查询串和片段，取不到时返回 RG_DEFAULT_FILENAME
std::string FilenameFromUrl(const std::string& url);

// 校验并补全代理地址：127.0.0.1:8080 -> http://127.0.0.1:8080
// 格式不对返回 false，error 中是原因
bool NormalizeProxy(const std::string& proxy, std::string& normalized, std::string& error);

// $XDG_DOWNLOAD_DIR，否则 $HOME/Downloads，否则当前目录；不存在时创建
std::string DefaultDownloadDir();

// 拼接目录和文件名
std::string JoinPath(const std::string& dir, const std::string& name);

}
