#include "rg_app.h"
#include <iostream>
#include <memory>
#include "AsyncProgressSink.h"
#include "ConsoleProgressSink.h"
#include "CurlHttpClient.h"
#include "DownloadException.h"
#include "JsonProgressSink.h"
#include "ResumeEngine.h"
#include "rg_conf.h"
#include "rg_logger.h"
#include "rg_macro.h"
#include "rg_options.h"
#include "rg_signal.h"

namespace RGET
{

int App::run(int argc, char* const* argv)
{
    const char* prog = argc > 0 ? argv[0] : "rget";

    Options opts;
    std::string error;
    if(!ParseOptions(argc, argv, opts, error))
    {
        Logger::rg_log_stderr(0, "%s", error.c_str());
        PrintUsage(stderr, prog);
        return 2;
    }
    if(opts.help)
    {
        PrintUsage(stdout, prog);
        return 0;
    }

    // 配置加载：显式指定的配置文件必须存在，默认配置文件可以没有
    RgConf* conf = RgConf::getInstance();
    const char* confName = opts.confName.empty() ? RG_CONF_FILE : opts.confName.c_str();
    bool confLoaded = conf->LoadConf(confName);
    if(!confLoaded && !opts.confName.empty())
    {
        Logger::rg_log_init(nullptr, RG_LOG_WARN);
        Logger::rg_log_stderr(0, "配置文件[%s]载入失败，退出!", confName);
        return 2;
    }

    // 日志初始化（依赖配置项）
    Logger::rg_log_init(conf->GetString("Log"), conf->GetIntDefault("LogLevel", RG_LOG_WARN));
    if(confLoaded)
    {
        Logger::rg_log_error_core(RG_LOG_INFO, 0, "已载入配置文件 %s", conf->Path().c_str());
    }

    if(Signal::rg_init_signals() != 0)
    {
        Logger::rg_log_close();
        return 1;
    }

    DownloadTask task;
    if(!BuildTask(opts, *conf, task, error))
    {
        Logger::rg_log_stderr(0, "%s", error.c_str());
        Logger::rg_log_close();
        return 2;
    }

    CurlGlobal curlGlobal;
    if(!curlGlobal.ok())
    {
        Logger::rg_log_stderr(0, "libcurl 初始化失败");
        Logger::rg_log_close();
        return 1;
    }

    int exitcode = 0;
    try
    {
        CurlHttpClient client;

        std::unique_ptr<ProgressSink> sink;
        if(opts.quiet)
        {
            sink = std::make_unique<NullProgressSink>();
        }
        else if(opts.json)
        {
            sink = std::make_unique<JsonProgressSink>(std::cout);
        }
        else
        {
            sink = std::make_unique<ConsoleProgressSink>(stdout, !opts.ignoreTls);
        }

        AsyncProgressSink async(*sink);
        ResumeEngine engine(task, client, async, Signal::g_stopEvent);
        DownloadResult result = engine.run();
        async.StopAll();

        if(result.outcome == Outcome::Cancelled && Signal::g_lastSigno.load() != 0)
        {
            Logger::rg_log_error_core(RG_LOG_NOTICE, 0, "收到信号 %s，下载已中断",
                                      Signal::rg_signal_name(Signal::g_lastSigno.load()));
        }
        exitcode = result.exitCode();
    }
    catch(const DownloadException& e)
    {
        Logger::rg_log_stderr(0, "%s: %s", ErrorKindName(e.kind()), e.what());
        exitcode = 1;
    }

    Logger::rg_log_close();
    return exitcode;
}

}
