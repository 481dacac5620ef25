#include "rg_options.h"
#include <getopt.h>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include "rg_func.h"
#include "rg_macro.h"

namespace fs = std::filesystem;

namespace RGET
{

static bool ParseNonNegative(const char* text, int& value)
{
    if(text == nullptr || *text == '\0')
    {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long v = strtol(text, &end, 10);
    if(errno != 0 || *end != '\0' || v < 0 || v > INT_MAX)
    {
        return false;
    }
    value = static_cast<int>(v);
    return true;
}

bool ParseOptions(int argc, char* const* argv, Options& opts, std::string& error)
{
    static struct option long_options[] = {
        {"link",           required_argument, 0, 'l'},
        {"proxy",          required_argument, 0, 'p'},
        {"retry-interval", required_argument, 0, 'r'},
        {"output",         required_argument, 0, 'o'},
        {"ignore",         no_argument,       0, 'i'},
        {"max-attempts",   required_argument, 0, 'm'},
        {"conf",           required_argument, 0, 'c'},
        {"json",           no_argument,       0, 'j'},
        {"quiet",          no_argument,       0, 'q'},
        {"help",           no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    optind = 0;     // glibc: 重新初始化，允许多次解析
    opterr = 0;

    int opt;
    int value = 0;
    while((opt = getopt_long(argc, argv, "l:p:r:o:im:c:jqh", long_options, nullptr)) != -1)
    {
        switch(opt)
        {
        case 'l': opts.url = optarg; break;
        case 'p': opts.proxy = optarg; break;
        case 'r':
            if(!ParseNonNegative(optarg, value))
            {
                error = std::string("重试间隔必须是非负整数: ") + optarg;
                return false;
            }
            opts.retryInterval = value;
            break;
        case 'o': opts.outputDir = optarg; break;
        case 'i': opts.ignoreTls = true; break;
        case 'm':
            if(!ParseNonNegative(optarg, value))
            {
                error = std::string("最大尝试次数必须是非负整数: ") + optarg;
                return false;
            }
            opts.maxAttempts = value;
            break;
        case 'c': opts.confName = optarg; break;
        case 'j': opts.json = true; break;
        case 'q': opts.quiet = true; break;
        case 'h': opts.help = true; break;
        case '?':
        default:
            error = "无法识别的参数";
            if(optopt)
            {
                error += std::string(": -") + static_cast<char>(optopt);
            }
            return false;
        }
    }

    // 也允许直接把链接作为位置参数
    if(opts.url.empty() && optind < argc)
    {
        opts.url = argv[optind++];
    }
    if(optind < argc)
    {
        error = std::string("多余的参数: ") + argv[optind];
        return false;
    }
    if(opts.url.empty() && !opts.help)
    {
        error = "缺少下载链接 (-l/--link)";
        return false;
    }
    return true;
}

void PrintUsage(FILE* out, const char* prog)
{
    fprintf(out,
        "用法: %s -l <下载链接> [选项]\n"
        "断点续传下载工具，断线后自动从已下载的位置继续\n"
        "\n"
        "  -l, --link URL            下载链接 (必填，也可作为位置参数)\n"
        "  -p, --proxy ADDR          代理地址，如 127.0.0.1:8080 或 socks5://127.0.0.1:1080\n"
        "  -r, --retry-interval SEC  重试间隔秒数 (默认 %d)\n"
        "  -o, --output DIR          保存目录 (默认系统下载目录)\n"
        "  -i, --ignore              不校验 TLS 证书，且不显示详细错误信息\n"
        "  -m, --max-attempts N      最多尝试次数，0 表示不限 (默认不限)\n"
        "  -c, --conf FILE           配置文件 (默认 %s)\n"
        "  -j, --json                以 JSON 行输出进度\n"
        "  -q, --quiet               不输出进度\n"
        "  -h, --help                显示本帮助\n",
        prog, RG_DEFAULT_RETRY_INTERVAL, RG_CONF_FILE);
}

bool BuildTask(const Options& opts, RgConf& conf, DownloadTask& task, std::string& error)
{
    if(opts.url.empty())
    {
        error = "缺少下载链接";
        return false;
    }
    task.url = opts.url;

    std::string proxy = opts.proxy;
    if(proxy.empty() && conf.GetString("Proxy") != nullptr)
    {
        proxy = conf.GetString("Proxy");
    }
    if(!NormalizeProxy(proxy, task.proxy, error))
    {
        return false;
    }

    int retry = opts.retryInterval ? *opts.retryInterval
                                   : conf.GetIntDefault("RetryInterval", RG_DEFAULT_RETRY_INTERVAL);
    if(retry < 0)
    {
        error = "重试间隔不能为负数";
        return false;
    }
    task.retryInterval = std::chrono::seconds(retry);

    int maxAttempts = opts.maxAttempts ? *opts.maxAttempts : conf.GetIntDefault("MaxAttempts", 0);
    if(maxAttempts > 0)
    {
        task.maxAttempts = maxAttempts;
    }
    else
    {
        task.maxAttempts.reset();
    }

    std::string dir = opts.outputDir;
    if(dir.empty() && conf.GetString("DownloadDir") != nullptr)
    {
        dir = conf.GetString("DownloadDir");
    }
    if(dir.empty())
    {
        dir = DefaultDownloadDir();
    }
    else
    {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if(ec)
        {
            error = "无法创建保存目录 " + dir + ": " + ec.message();
            return false;
        }
    }
    task.filePath = JoinPath(dir, FilenameFromUrl(opts.url));

    task.verifyTls = !opts.ignoreTls && conf.GetBoolDefault("VerifyTls", true);
    task.connectTimeout = conf.GetIntDefault("ConnectTimeout", RG_DEFAULT_CONNECT_TIMEOUT);
    task.readTimeout = conf.GetIntDefault("ReadTimeout", RG_DEFAULT_READ_TIMEOUT);
    task.probeTimeout = conf.GetIntDefault("ProbeTimeout", RG_DEFAULT_PROBE_TIMEOUT);
    task.maxRedirects = conf.GetIntDefault("MaxRedirects", RG_DEFAULT_MAX_REDIRECTS);
    task.rangeProbeFallback = conf.GetBoolDefault("RangeProbe", true);

    int blockSize = conf.GetIntDefault("BlockSize", RG_DEFAULT_BLOCK_SIZE);
    task.blockSize = blockSize > 0 ? static_cast<size_t>(blockSize) : RG_DEFAULT_BLOCK_SIZE;

    const char* ua = conf.GetString("UserAgent");
    if(ua != nullptr && ua[0] != '\0')
    {
        task.userAgent = ua;
    }
    return true;
}

}
