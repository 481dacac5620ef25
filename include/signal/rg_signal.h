#pragma once
#include <atomic>
#include <signal.h>

namespace RGET
{

typedef struct
{
    int signo;              // 信号对应数字编号
    const char* signame;    // 信号名称
    // 信号处理函数，为 nullptr 表示忽略该信号
    void (*handler)(int signo, siginfo_t* siginfo, void* ucontext);
} rg_signal_t;

class Signal
{
public:
    // 安装信号处理，失败返回 -1
    static int rg_init_signals();

    // 收到 SIGINT/SIGTERM/SIGQUIT/SIGHUP 后置 1，下载循环据此取消
    static std::atomic<int> g_stopEvent;
    // 最近一次收到的停止信号，0 表示没有
    static std::atomic<int> g_lastSigno;

    static const char* rg_signal_name(int signo);

private:
    static void rg_signal_handler(int signo, siginfo_t* siginfo, void* ucontext);

    static rg_signal_t signals[];
};

}
