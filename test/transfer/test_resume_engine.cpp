#include <gtest/gtest.h>
#include <atomic>
#include "FakeHttpClient.h"
#include "RecordingSink.h"
#include "ResumeEngine.h"
#include "TempDir.h"

using namespace RGET;
using test::FakeHttpClient;

class ResumeEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        task_.url = "http://example.com/files/big.bin";
        task_.filePath = dir_.file("big.bin");
        task_.retryInterval = std::chrono::seconds(0);
    }

    DownloadResult runEngine(FakeHttpClient& client)
    {
        ResumeEngine engine(task_, client, sink_, stop_);
        return engine.run();
    }

    test::TempDir dir_;
    DownloadTask task_;
    test::RecordingSink sink_;
    std::atomic<int> stop_{0};
};

TEST_F(ResumeEngineTest, ResumesAfterDroppedConnection)
{
    std::string payload = test::MakePayload(1000000);
    FakeHttpClient client(payload);
    client.dropAfter.push_back(600000);

    DownloadResult r = runEngine(client);

    EXPECT_EQ(r.outcome, Outcome::Succeeded);
    EXPECT_EQ(r.attempts, 2);
    EXPECT_EQ(r.bytesOnDisk, 1000000);
    EXPECT_EQ(r.exitCode(), 0);
    ASSERT_EQ(client.ranges.size(), 2u);
    EXPECT_EQ(client.ranges[0], "bytes=0-");
    EXPECT_EQ(client.ranges[1], "bytes=600000-");
    ASSERT_EQ(sink_.retries.size(), 1u);
    EXPECT_EQ(sink_.retries[0].offset, 600000);
    EXPECT_EQ(sink_.attemptOffsets, (std::vector<int64_t>{0, 600000}));
    EXPECT_EQ(test::ReadFile(task_.filePath), payload);
    EXPECT_EQ(sink_.finished, 1);
}

TEST_F(ResumeEngineTest, CancelKeepsPartialFileForNextRun)
{
    std::string payload = test::MakePayload(100000);
    FakeHttpClient client(payload);
    client.stopAt = 42000;
    client.stopFlag = &stop_;

    DownloadResult r = runEngine(client);
    EXPECT_EQ(r.outcome, Outcome::Cancelled);
    EXPECT_EQ(r.bytesOnDisk, 42000);
    EXPECT_EQ(r.exitCode(), 0);
    EXPECT_EQ(test::FileSize(task_.filePath), 42000);

    // 再次执行从 42000 继续
    stop_ = 0;
    client.stopAt.reset();
    test::RecordingSink sink2;
    ResumeEngine engine(task_, client, sink2, stop_);
    DownloadResult r2 = engine.run();

    EXPECT_EQ(r2.outcome, Outcome::Succeeded);
    EXPECT_EQ(client.ranges.back(), "bytes=42000-");
    EXPECT_EQ(test::ReadFile(task_.filePath), payload);
}

TEST_F(ResumeEngineTest, CompleteFileNeedsNoTransfer)
{
    std::string payload = test::MakePayload(20000);
    test::WriteFile(task_.filePath, payload);
    FakeHttpClient client(payload);

    DownloadResult r = runEngine(client);

    EXPECT_EQ(r.outcome, Outcome::Succeeded);
    EXPECT_EQ(client.headCalls, 1);
    EXPECT_EQ(client.getCalls, 0);
    EXPECT_EQ(r.bytesOnDisk, 20000);
}

TEST_F(ResumeEngineTest, OversizedFileIsDeletedAndRedownloaded)
{
    std::string payload = test::MakePayload(100000);
    test::WriteFile(task_.filePath, std::string(150000, 'x'));
    FakeHttpClient client(payload);

    DownloadResult r = runEngine(client);

    EXPECT_EQ(r.outcome, Outcome::Succeeded);
    EXPECT_EQ(sink_.corruptSizes, (std::vector<int64_t>{150000}));
    ASSERT_EQ(client.ranges.size(), 1u);
    EXPECT_EQ(client.ranges[0], "bytes=0-");
    EXPECT_EQ(test::ReadFile(task_.filePath), payload);
}

TEST_F(ResumeEngineTest, UnknownSizeDiscardsExistingFile)
{
    std::string payload = test::MakePayload(30000);
    test::WriteFile(task_.filePath, std::string(500, 'x'));
    FakeHttpClient client(payload);
    client.sendContentLength = false;
    task_.rangeProbeFallback = false;

    DownloadResult r = runEngine(client);

    EXPECT_EQ(r.outcome, Outcome::Succeeded);
    EXPECT_FALSE(sink_.startTotal);
    EXPECT_FALSE(r.expectedSize);
    EXPECT_EQ(client.ranges[0], "bytes=0-");
    EXPECT_EQ(test::ReadFile(task_.filePath), payload);
}

TEST_F(ResumeEngineTest, UnknownSizeRestartsFromZeroAfterDrop)
{
    std::string payload = test::MakePayload(30000);
    FakeHttpClient client(payload);
    client.sendContentLength = false;
    client.dropAfter.push_back(300);
    task_.rangeProbeFallback = false;

    DownloadResult r = runEngine(client);

    EXPECT_EQ(r.outcome, Outcome::Succeeded);
    EXPECT_EQ(r.attempts, 2);
    EXPECT_EQ(client.ranges, (std::vector<std::string>{"bytes=0-", "bytes=0-"}));
    EXPECT_EQ(test::ReadFile(task_.filePath), payload);
}

TEST_F(ResumeEngineTest, RangeProbeSizeEnablesResume)
{
    std::string payload = test::MakePayload(30000);
    FakeHttpClient client(payload);
    client.sendContentLength = false;
    client.dropAfter.push_back(-1);     // 探测请求不断
    client.dropAfter.push_back(10000);

    DownloadResult r = runEngine(client);

    EXPECT_EQ(r.outcome, Outcome::Succeeded);
    ASSERT_TRUE(r.expectedSize);
    EXPECT_EQ(*r.expectedSize, 30000);
    EXPECT_EQ(client.ranges,
              (std::vector<std::string>{"bytes=0-1023", "bytes=0-", "bytes=10000-"}));
    EXPECT_EQ(test::ReadFile(task_.filePath), payload);
}

TEST_F(ResumeEngineTest, MaxAttemptsExhausted)
{
    std::string payload = test::MakePayload(5000);
    FakeHttpClient client(payload);
    client.dropAfter = {100, 100, 100, 100};
    task_.maxAttempts = 3;

    DownloadResult r = runEngine(client);

    EXPECT_EQ(r.outcome, Outcome::Failed);
    EXPECT_EQ(r.reason, FailReason::AttemptsExhausted);
    EXPECT_EQ(r.attempts, 3);
    EXPECT_EQ(r.exitCode(), 1);
    EXPECT_EQ(r.bytesOnDisk, 300);
    EXPECT_EQ(client.ranges,
              (std::vector<std::string>{"bytes=0-", "bytes=100-", "bytes=200-"}));
    EXPECT_EQ(sink_.retries.size(), 2u);
}

TEST_F(ResumeEngineTest, ProbeFailureIsFatal)
{
    FakeHttpClient client("data");
    client.headThrows = true;

    DownloadResult r = runEngine(client);

    EXPECT_EQ(r.outcome, Outcome::Failed);
    EXPECT_EQ(r.reason, FailReason::ProbeFailed);
    EXPECT_EQ(r.exitCode(), 2);
    EXPECT_EQ(r.attempts, 0);
    EXPECT_EQ(client.getCalls, 0);
    EXPECT_FALSE(sink_.started);
    EXPECT_EQ(test::FileSize(task_.filePath), -1);
}

TEST_F(ResumeEngineTest, RangeNotSatisfiableRestartsFromZero)
{
    // 服务器声明的大小比实际内容大，本地已有的部分超出了实际内容
    std::string payload = test::MakePayload(1000);
    test::WriteFile(task_.filePath, payload);
    FakeHttpClient client(payload);
    client.headLengthOverride = 2000;
    task_.maxAttempts = 2;

    DownloadResult r = runEngine(client);

    EXPECT_EQ(r.outcome, Outcome::Failed);
    EXPECT_EQ(r.reason, FailReason::AttemptsExhausted);
    EXPECT_EQ(client.ranges, (std::vector<std::string>{"bytes=1000-", "bytes=0-"}));
    EXPECT_EQ(r.bytesOnDisk, 1000);
}

TEST_F(ResumeEngineTest, StopDuringRetryWaitCancels)
{
    std::string payload = test::MakePayload(5000);
    FakeHttpClient client(payload);
    client.dropAfter.push_back(1000);
    task_.retryInterval = std::chrono::seconds(30);
    sink_.retryHook = [this](const RetryNotice&) { stop_ = 1; };

    auto begin = std::chrono::steady_clock::now();
    DownloadResult r = runEngine(client);
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_EQ(r.outcome, Outcome::Cancelled);
    EXPECT_EQ(r.bytesOnDisk, 1000);
    EXPECT_EQ(client.getCalls, 1);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST_F(ResumeEngineTest, StopBeforeStartLeavesNoFile)
{
    FakeHttpClient client(test::MakePayload(5000));
    stop_ = 1;

    DownloadResult r = runEngine(client);

    EXPECT_EQ(r.outcome, Outcome::Cancelled);
    EXPECT_EQ(r.exitCode(), 0);
    EXPECT_EQ(r.attempts, 0);
    EXPECT_EQ(client.getCalls, 0);
    EXPECT_EQ(r.bytesOnDisk, 0);
    // 探测阶段就被中断，不会进入下载
    EXPECT_FALSE(sink_.started);
    EXPECT_EQ(sink_.finished, 1);
}

TEST_F(ResumeEngineTest, SendsTaskOptionsToClient)
{
    FakeHttpClient client(test::MakePayload(100));
    task_.proxy = "http://127.0.0.1:8080";
    task_.verifyTls = false;
    task_.probeTimeout = 7;
    task_.readTimeout = 60;

    runEngine(client);

    ASSERT_EQ(client.seenOptions.size(), 2u);
    EXPECT_EQ(client.seenOptions[0].proxy, "http://127.0.0.1:8080");
    EXPECT_EQ(client.seenOptions[0].totalTimeout, 7);
    EXPECT_FALSE(client.seenOptions[0].verifyTls);
    EXPECT_EQ(client.seenOptions[1].totalTimeout, 0);
    EXPECT_EQ(client.seenOptions[1].readTimeout, 60);
}
