#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include "ProgressSink.h"

namespace RGET
{

// 在独立线程上驱动内层 sink，下载线程永远不等控制台输出
// 进度采样只保留最新一条，拿不到锁就丢弃；其他事件排队，按顺序全部送达
class AsyncProgressSink : public ProgressSink
{
public:
    explicit AsyncProgressSink(ProgressSink& inner);
    ~AsyncProgressSink() override;

    AsyncProgressSink(const AsyncProgressSink&) = delete;
    AsyncProgressSink& operator=(const AsyncProgressSink&) = delete;

    void onStart(const DownloadTask& task, std::optional<int64_t> total) override;
    void onAttempt(int attempt, int64_t offset) override;
    void onProgress(const ProgressSample& sample) override;
    void onCorrupt(const std::string& path, int64_t size) override;
    void onRetry(const RetryNotice& notice) override;
    void onFinished(const DownloadResult& result) override;

    // 把已入队的事件全部交给内层 sink 后停止线程，可重复调用
    void StopAll();

    int droppedSamples() const { return m_dropped.load(); }

private:
    void post(std::function<void()> event);
    void ThreadFunc();
    // 调用一个事件，异常只记日志
    void deliver(const std::function<void()>& event);

    ProgressSink& m_inner;

    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<std::function<void()>> m_events;
    std::optional<ProgressSample> m_latest;
    std::atomic<bool> m_shutdown{false};
    std::atomic<int> m_dropped{0};

    std::thread m_thread;
};

}
