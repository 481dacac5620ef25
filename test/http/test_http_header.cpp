#include <gtest/gtest.h>
#include "HttpClient.h"
#include "HttpHeader.h"

using namespace RGET;

TEST(HttpHeaderTest, ContentLength)
{
    EXPECT_EQ(ParseContentLength("12345"), 12345);
    EXPECT_EQ(ParseContentLength(" 42 "), 42);
    EXPECT_EQ(ParseContentLength("0"), 0);
    EXPECT_FALSE(ParseContentLength(""));
    EXPECT_FALSE(ParseContentLength("-1"));
    EXPECT_FALSE(ParseContentLength("12abc"));
    EXPECT_FALSE(ParseContentLength("99999999999999999999999"));
}

TEST(HttpHeaderTest, ContentRangeTotal)
{
    EXPECT_EQ(ParseContentRangeTotal("bytes 0-1023/1000000"), 1000000);
    EXPECT_EQ(ParseContentRangeTotal("bytes */5000"), 5000);
    EXPECT_EQ(ParseContentRangeTotal("Bytes 0-0/7"), 7);
    EXPECT_FALSE(ParseContentRangeTotal("bytes 0-1023/*"));
    EXPECT_FALSE(ParseContentRangeTotal("items 0-1/2"));
    EXPECT_FALSE(ParseContentRangeTotal(""));
}

TEST(HttpHeaderTest, ContentRangeStart)
{
    EXPECT_EQ(ParseContentRangeStart("bytes 600000-999999/1000000"), 600000);
    EXPECT_EQ(ParseContentRangeStart("bytes 0-99/100"), 0);
    EXPECT_FALSE(ParseContentRangeStart("bytes */100"));
    EXPECT_FALSE(ParseContentRangeStart("garbage"));
}

TEST(HttpHeaderTest, RangeHeader)
{
    EXPECT_EQ(MakeRangeHeader(0), "bytes=0-");
    EXPECT_EQ(MakeRangeHeader(600000), "bytes=600000-");
    EXPECT_EQ(MakeRangeHeader(0, 1023), "bytes=0-1023");
}

TEST(HttpHeaderTest, ResponseHeaderLookupIsCaseInsensitive)
{
    HttpResponse resp;
    resp.headers["content-length"] = "10";
    EXPECT_EQ(resp.header("Content-Length"), "10");
    EXPECT_EQ(resp.header("content-range"), "");
}
