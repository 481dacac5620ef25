#include <gtest/gtest.h>
#include <cerrno>
#include "TempDir.h"
#include "rg_logger.h"
#include "rg_macro.h"

using namespace RGET;

TEST(LoggerTest, WritesLinesAtOrBelowLevel)
{
    test::TempDir dir;
    std::string path = dir.file("rget.log");

    Logger::rg_log_init(path.c_str(), RG_LOG_INFO);
    EXPECT_EQ(Logger::rg_log_level(), RG_LOG_INFO);
    Logger::rg_log_error_core(RG_LOG_INFO, 0, "第%d次尝试，从 %lld 字节开始", 2, 600000LL);
    Logger::rg_log_error_core(RG_LOG_ERR, ENOSPC, "写入失败");
    Logger::rg_log_error_core(RG_LOG_DEBUG, 0, "不应出现");
    Logger::rg_log_close();
    Logger::rg_log_init(nullptr, RG_LOG_NOTICE);

    std::string text = test::ReadFile(path);
    EXPECT_NE(text.find("[info]"), std::string::npos);
    EXPECT_NE(text.find("第2次尝试，从 600000 字节开始"), std::string::npos);
    EXPECT_NE(text.find("[error]"), std::string::npos);
    EXPECT_NE(text.find("(28: "), std::string::npos);
    EXPECT_EQ(text.find("不应出现"), std::string::npos);
    EXPECT_EQ(text.back(), '\n');
}

TEST(LoggerTest, LongMessageIsTruncated)
{
    test::TempDir dir;
    std::string path = dir.file("long.log");

    Logger::rg_log_init(path.c_str(), RG_LOG_DEBUG);
    std::string big(RG_MAX_ERROR_STR * 2, 'a');
    Logger::rg_log_error_core(RG_LOG_NOTICE, 0, "%s", big.c_str());
    Logger::rg_log_close();
    Logger::rg_log_init(nullptr, RG_LOG_NOTICE);

    std::string text = test::ReadFile(path);
    EXPECT_LE(text.size(), static_cast<size_t>(RG_MAX_ERROR_STR));
    EXPECT_EQ(text.back(), '\n');
}
