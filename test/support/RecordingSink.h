#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "ProgressSink.h"

namespace RGET
{
namespace test
{

// 记录引擎发出的所有事件
class RecordingSink : public ProgressSink
{
public:
    void onStart(const DownloadTask&, std::optional<int64_t> total) override
    {
        started = true;
        startTotal = total;
    }
    void onAttempt(int attempt, int64_t offset) override
    {
        (void)attempt;
        attemptOffsets.push_back(offset);
    }
    void onProgress(const ProgressSample& sample) override
    {
        lastProgress = sample.offset;
        samples.push_back(sample);
    }
    void onCorrupt(const std::string&, int64_t size) override { corruptSizes.push_back(size); }
    void onRetry(const RetryNotice& notice) override
    {
        retries.push_back(notice);
        if(retryHook)
        {
            retryHook(notice);
        }
    }
    void onFinished(const DownloadResult& result) override
    {
        finished++;
        lastResult = result;
    }

    bool started = false;
    std::optional<int64_t> startTotal;
    std::vector<int64_t> attemptOffsets;
    int64_t lastProgress = -1;
    std::vector<ProgressSample> samples;
    std::vector<int64_t> corruptSizes;
    std::vector<RetryNotice> retries;
    int finished = 0;
    DownloadResult lastResult;

    std::function<void(const RetryNotice&)> retryHook;
};

}
}
