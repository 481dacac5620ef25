#include "rg_app.h"

//程序主入口函数
int main(int argc, char* const* argv)
{
    return RGET::App::run(argc, argv);
}
