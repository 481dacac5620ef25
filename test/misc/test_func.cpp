#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include "TempDir.h"
#include "rg_func.h"
#include "rg_macro.h"

using namespace RGET;

TEST(FormatSizeTest, Units)
{
    EXPECT_EQ(FormatSize(0), "0.00 B");
    EXPECT_EQ(FormatSize(512), "512.00 B");
    EXPECT_EQ(FormatSize(1536), "1.50 KB");
    EXPECT_EQ(FormatSize(1024.0 * 1024), "1.00 MB");
    EXPECT_EQ(FormatSize(3.0 * 1024 * 1024 * 1024), "3.00 GB");
    EXPECT_EQ(FormatSize(2.0 * 1024 * 1024 * 1024 * 1024), "2.00 TB");
    // TB 之后不再进位
    EXPECT_EQ(FormatSize(2048.0 * 1024 * 1024 * 1024 * 1024), "2048.00 TB");
}

TEST(FilenameFromUrlTest, LastPathSegment)
{
    EXPECT_EQ(FilenameFromUrl("https://example.com/files/archive.tar.gz"), "archive.tar.gz");
    EXPECT_EQ(FilenameFromUrl("http://example.com/a/b.iso?token=abc&x=1"), "b.iso");
    EXPECT_EQ(FilenameFromUrl("http://example.com/dl/setup.exe#frag"), "setup.exe");
}

TEST(FilenameFromUrlTest, FallsBackToDefault)
{
    EXPECT_EQ(FilenameFromUrl("http://example.com/"), RG_DEFAULT_FILENAME);
    EXPECT_EQ(FilenameFromUrl("http://example.com"), RG_DEFAULT_FILENAME);
    EXPECT_EQ(FilenameFromUrl("http://example.com/dir/"), RG_DEFAULT_FILENAME);
}

TEST(NormalizeProxyTest, AddsHttpScheme)
{
    std::string out, err;
    ASSERT_TRUE(NormalizeProxy("127.0.0.1:8080", out, err));
    EXPECT_EQ(out, "http://127.0.0.1:8080");

    ASSERT_TRUE(NormalizeProxy("socks5h://proxy.local:1080/", out, err));
    EXPECT_EQ(out, "socks5h://proxy.local:1080");

    ASSERT_TRUE(NormalizeProxy("", out, err));
    EXPECT_TRUE(out.empty());
}

TEST(NormalizeProxyTest, RejectsBadInput)
{
    std::string out, err;
    EXPECT_FALSE(NormalizeProxy("127.0.0.1", out, err));
    EXPECT_FALSE(err.empty());
    EXPECT_FALSE(NormalizeProxy("127.0.0.1:abc", out, err));
    EXPECT_FALSE(NormalizeProxy("127.0.0.1:0", out, err));
    EXPECT_FALSE(NormalizeProxy("127.0.0.1:65536", out, err));
    EXPECT_FALSE(NormalizeProxy("ftp://127.0.0.1:21", out, err));
    EXPECT_TRUE(NormalizeProxy("127.0.0.1:65535", out, err));
}

TEST(DownloadDirTest, PrefersXdgThenHome)
{
    test::TempDir tmp;
    std::string savedXdg = getenv("XDG_DOWNLOAD_DIR") ? getenv("XDG_DOWNLOAD_DIR") : "";
    std::string savedHome = getenv("HOME") ? getenv("HOME") : "";

    setenv("XDG_DOWNLOAD_DIR", tmp.file("xdg").c_str(), 1);
    EXPECT_EQ(DefaultDownloadDir(), tmp.file("xdg"));

    unsetenv("XDG_DOWNLOAD_DIR");
    setenv("HOME", tmp.path().c_str(), 1);
    EXPECT_EQ(DefaultDownloadDir(), tmp.file("Downloads"));
    EXPECT_TRUE(std::filesystem::is_directory(tmp.file("Downloads")));

    if(savedXdg.empty()) unsetenv("XDG_DOWNLOAD_DIR"); else setenv("XDG_DOWNLOAD_DIR", savedXdg.c_str(), 1);
    if(savedHome.empty()) unsetenv("HOME"); else setenv("HOME", savedHome.c_str(), 1);
}

TEST(JoinPathTest, Basic)
{
    EXPECT_EQ(JoinPath("/tmp", "a.bin"), "/tmp/a.bin");
    EXPECT_EQ(JoinPath("/tmp/", "a.bin"), "/tmp/a.bin");
    EXPECT_EQ(JoinPath("", "a.bin"), "a.bin");
}
