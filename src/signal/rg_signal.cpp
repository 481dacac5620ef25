#include "rg_signal.h"
#include <errno.h>
#include <string.h>
#include "rg_logger.h"
#include "rg_macro.h"

namespace RGET
{

std::atomic<int> Signal::g_stopEvent{0};
std::atomic<int> Signal::g_lastSigno{0};

rg_signal_t Signal::signals[] = {
    { SIGHUP,  "SIGHUP",  Signal::rg_signal_handler },
    { SIGINT,  "SIGINT",  Signal::rg_signal_handler },
    { SIGTERM, "SIGTERM", Signal::rg_signal_handler },
    { SIGQUIT, "SIGQUIT", Signal::rg_signal_handler },
    { SIGPIPE, "SIGPIPE", nullptr },    // 对端断开时不要让进程退出
    { 0,       nullptr,   nullptr }     // 终止标志
};

// 初始化信号的函数，用于注册信号处理函数
// 返回值：成功返回0，失败返回-1
int Signal::rg_init_signals()
{
    rg_signal_t *sig;
    struct sigaction sa;

    for(sig = signals; sig->signo != 0; sig++)
    {
        memset(&sa, 0, sizeof(sa));

        if(sig->handler == nullptr)
        {
            sa.sa_handler = SIG_IGN;
        }
        else
        {
            sa.sa_sigaction = sig->handler;
            sa.sa_flags = SA_SIGINFO;   // 让 sa_sigaction 生效
        }

        sigemptyset(&sa.sa_mask);   // 不阻塞任何信号

        if(sigaction(sig->signo, &sa, nullptr) == -1)
        {
            Logger::rg_log_error_core(RG_LOG_EMERG, errno, "sigaction(%s) failed", sig->signame);
            return -1;
        }
    }
    return 0;
}

const char* Signal::rg_signal_name(int signo)
{
    for(rg_signal_t* sig = signals; sig->signo != 0; sig++)
    {
        if(sig->signo == signo)
        {
            return sig->signame;
        }
    }
    return "unknown";
}

// 只做异步信号安全的事：置标志，日志由下载循环在信号返回后写
void Signal::rg_signal_handler(int signo, siginfo_t* siginfo, void* ucontext)
{
    (void)siginfo;
    (void)ucontext;
    g_lastSigno.store(signo);
    g_stopEvent.store(1);
}

}
