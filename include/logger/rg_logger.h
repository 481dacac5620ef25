#pragma once
#include <sys/types.h>
#include <cstdarg>
#include <cstddef>

namespace RGET
{
// 日志
typedef struct
{
    int LogLevel;
    int fd; // 日志文件描述符
}rg_log_t;

class Logger
{
public:
    // logname: 日志文件名，相对路径放在 <可执行文件目录>/../log 下，空则写 stderr
    static void   rg_log_init(const char *logname, int level);
    static void   rg_log_stderr(int err, const char *fmt, ...);
    static void   rg_log_error_core(int level, int err, const char *fmt, ...);
    static void   rg_log_close();

    static int    rg_log_level() { return rg_log.LogLevel; }

private:
    static char  *rg_log_errno(char *buf, char *last, int err);
    static char  *rg_vslprintf(char *buf, char *last, const char *fmt, va_list args);
    static void   rg_log_write(int fd, const char *buf, size_t len);

    static rg_log_t rg_log;
};

}
