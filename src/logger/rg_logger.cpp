#include "rg_macro.h"
#include <string.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <limits.h>
#include <sys/time.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <cstdio>
#include <ctime>
#include <string>
#include "rg_logger.h"

namespace RGET
{
//错误等级，与rg_macro.h中的定义相同
static const char err_level[][20] =
{
    {"stderr"},    //0：控制台错误
    {"emerg"},     //1：紧急
    {"alert"},     //2：警戒
    {"crit"},      //3：严重
    {"error"},     //4：错误
    {"warn"},      //5：警告
    {"notice"},    //6：注意
    {"info"},      //7：信息
    {"debug"}      //8：调试
};

rg_log_t Logger::rg_log = {RG_LOG_NOTICE, -1};

// 控制台错误，最高等级，同时写一份到日志文件
void Logger::rg_log_stderr(int err, const char *fmt, ...)
{
    va_list args;
    char errstr[RG_MAX_ERROR_STR + 1];
    char *p, *last;

    memset(errstr, 0, sizeof(errstr));
    last = errstr + RG_MAX_ERROR_STR;

    p = errstr + snprintf(errstr, RG_MAX_ERROR_STR, "rget: ");
    va_start(args, fmt);
    p = rg_vslprintf(p, last, fmt, args);
    va_end(args);

    if(err)
    {
        p = rg_log_errno(p, last, err);
    }
    //位置不够，换行也要插入末尾
    if(p >= (last - 1))
    {
        p = (last - 1) - 1;
    }
    *p++ = '\n';

    rg_log_write(STDERR_FILENO, errstr, p - errstr);

    if(rg_log.fd > STDERR_FILENO) // 日志文件打开了，也写入日志文件
    {
        p--;
        *p = 0;
        rg_log_error_core(RG_LOG_STDERR, 0, "%s", errstr + 6);
    }
}

// 组合出【 (错误编号: 错误原因) 】放到buf中
char* Logger::rg_log_errno(char* buf, char* last, int err)
{
    char extra[256] = {0};
    int len = snprintf(extra, sizeof(extra), " (%d: %s) ", err, strerror(err));
    if(len > 0 && buf + len < last)
    {
        memcpy(buf, extra, len);
        buf += len;
    }
    return buf;
}

// 往日志文件中写日志，自动加换行符
// level: 比配置的 LogLevel 大的日志不写
// err: 不为0时附加 errno 描述
void Logger::rg_log_error_core(int level, int err, const char *fmt, ...)
{
    if(level > rg_log.LogLevel)
    {
        return;
    }

    char errstr[RG_MAX_ERROR_STR + 1];
    char *p, *last;
    va_list args;

    memset(errstr, 0, sizeof(errstr));
    last = errstr + RG_MAX_ERROR_STR;

    struct timeval tv;
    struct tm tm;
    memset(&tm, 0, sizeof(tm));
    memset(&tv, 0, sizeof(tv));
    gettimeofday(&tv, NULL);
    time_t sec = tv.tv_sec;
    localtime_r(&sec, &tm);

    // 2024-10-22 16:53:13 [notice] 17113:
    int n = snprintf(errstr, RG_MAX_ERROR_STR, "%4d-%02d-%02d %02d:%02d:%02d [%s] %d: ",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                     tm.tm_hour, tm.tm_min, tm.tm_sec,
                     err_level[level], (int)getpid());
    p = errstr + n;

    va_start(args, fmt);
    p = rg_vslprintf(p, last, fmt, args);
    va_end(args);

    if(err)
    {
        p = rg_log_errno(p, last, err);
    }
    if(p >= (last - 1))
    {
        p = (last - 1) - 1;
    }
    *p++ = '\n';

    int fd = (rg_log.fd == -1) ? STDERR_FILENO : rg_log.fd;
    ssize_t written = write(fd, errstr, p - errstr);
    if(written == -1)
    {
        if(errno == ENOSPC) //磁盘没空间，写失败，什么也不做
        {
        }
        else if(fd != STDERR_FILENO)
        {
            rg_log_write(STDERR_FILENO, errstr, p - errstr);
        }
    }
}

// 描述：日志初始化
void Logger::rg_log_init(const char *logname, int level)
{
    rg_log.LogLevel = level;
    rg_log_close();

    if(logname == NULL || logname[0] == '\0')
    {
        rg_log.fd = STDERR_FILENO;
        return;
    }

    std::string logFilePath;
    if(logname[0] == '/')
    {
        logFilePath = logname;
    }
    else
    {
        // 可执行文件所在目录的同级 log 目录
        char exePath[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", exePath, PATH_MAX - 1);
        if(count == -1)
        {
            rg_log.fd = STDERR_FILENO;
            rg_log_stderr(errno, "[alert] could not get executable path");
            return;
        }
        exePath[count] = '\0';
        std::string exeDir = std::string(exePath).substr(0, std::string(exePath).find_last_of('/'));
        std::string logDir = exeDir + "/../log";

        struct stat st;
        if(stat(logDir.c_str(), &st) == -1)
        {
            if(mkdir(logDir.c_str(), 0755) == -1)
            {
                rg_log.fd = STDERR_FILENO;
                rg_log_stderr(errno, "[alert] could not create log directory %s", logDir.c_str());
                return;
            }
        }
        logFilePath = logDir + "/" + logname;
    }

    rg_log.fd = open(logFilePath.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644);
    if(rg_log.fd == -1)
    {
        rg_log.fd = STDERR_FILENO; // 打开失败则写入标准错误
        rg_log_stderr(errno, "[alert] could not open error log file %s", logFilePath.c_str());
    }
}

// 关闭日志文件
void Logger::rg_log_close()
{
    if(rg_log.fd > STDERR_FILENO)
    {
        close(rg_log.fd);
    }
    rg_log.fd = -1;
}

char *Logger::rg_vslprintf(char* buf, char* last, const char* fmt, va_list args)
{
    if(buf >= last)
    {
        return buf;
    }
    int n = vsnprintf(buf, last - buf, fmt, args);
    if(n < 0)
    {
        return buf;
    }
    // 被截断时停在last前一个位置
    if(buf + n >= last)
    {
        return last - 1;
    }
    return buf + n;
}

void Logger::rg_log_write(int fd, const char *buf, size_t len)
{
    while(len > 0)
    {
        ssize_t n = write(fd, buf, len);
        if(n == -1)
        {
            if(errno == EINTR) continue;
            return;
        }
        buf += n;
        len -= n;
    }
}

}
