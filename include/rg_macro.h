#pragma once

// 日志等级，与 rg_logger.cpp 中 err_level[] 顺序一致
#define RG_LOG_STDERR            0    //控制台错误【stderr】：最高级别日志
#define RG_LOG_EMERG             1    //紧急 【emerg】
#define RG_LOG_ALERT             2    //警戒 【alert】
#define RG_LOG_CRIT              3    //严重 【crit】
#define RG_LOG_ERR               4    //错误 【error】
#define RG_LOG_WARN              5    //警告 【warn】
#define RG_LOG_NOTICE            6    //注意 【notice】
#define RG_LOG_INFO              7    //信息 【info】
#define RG_LOG_DEBUG             8    //调试 【debug】

#define RG_MAX_ERROR_STR         2048 //显示的错误信息最大数组长度

#define RG_CONF_FILE             "rget.conf"   //默认配置文件名

// 下载相关默认值
#define RG_DEFAULT_RETRY_INTERVAL   3      //重试间隔（秒）
#define RG_DEFAULT_CONNECT_TIMEOUT  10     //连接超时（秒）
#define RG_DEFAULT_READ_TIMEOUT     10     //读超时（秒），超过这么久没有数据算断线
#define RG_DEFAULT_PROBE_TIMEOUT    10     //HEAD 探测总超时（秒）
#define RG_DEFAULT_BLOCK_SIZE       4096   //流式写盘块大小
#define RG_DEFAULT_MAX_REDIRECTS    10     //最多跟随重定向次数
#define RG_INTEGRITY_HEAD_BYTES     1024   //完整性校验读取的头部字节数
#define RG_RANGE_PROBE_BYTES        1024   //没有 Content-Length 时分段探测的字节数
#define RG_DEFAULT_FILENAME         "download_file"
#define RG_USER_AGENT               "rget/1.0"
