#pragma once

namespace RGET
{

class App
{
public:
    // 解析参数、载入配置、初始化日志和信号，执行一次下载，返回进程退出码
    static int run(int argc, char* const* argv);
};

}
