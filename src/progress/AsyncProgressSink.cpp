#include "AsyncProgressSink.h"
#include <exception>
#include "rg_logger.h"
#include "rg_macro.h"

namespace RGET
{

AsyncProgressSink::AsyncProgressSink(ProgressSink& inner) : m_inner(inner)
{
    m_thread = std::thread([this] { ThreadFunc(); });
}

AsyncProgressSink::~AsyncProgressSink()
{
    StopAll();
}

void AsyncProgressSink::StopAll()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if(m_shutdown.exchange(true))
        {
            return;
        }
    }
    m_cv.notify_all();
    if(m_thread.joinable())
    {
        m_thread.join();
    }
}

void AsyncProgressSink::post(std::function<void()> event)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if(m_shutdown)
        {
            return;
        }
        m_events.push_back(std::move(event));
    }
    m_cv.notify_one();
}

void AsyncProgressSink::onStart(const DownloadTask& task, std::optional<int64_t> total)
{
    // task 由调用方持有且在整个下载期间有效
    post([this, &task, total] { m_inner.onStart(task, total); });
}

void AsyncProgressSink::onAttempt(int attempt, int64_t offset)
{
    post([this, attempt, offset] { m_inner.onAttempt(attempt, offset); });
}

void AsyncProgressSink::onProgress(const ProgressSample& sample)
{
    std::unique_lock<std::mutex> lock(m_mutex, std::try_to_lock);
    if(!lock.owns_lock())
    {
        ++m_dropped;
        return;
    }
    if(m_latest)
    {
        ++m_dropped;
    }
    m_latest = sample;
    lock.unlock();
    m_cv.notify_one();
}

void AsyncProgressSink::onCorrupt(const std::string& path, int64_t size)
{
    post([this, path, size] { m_inner.onCorrupt(path, size); });
}

void AsyncProgressSink::onRetry(const RetryNotice& notice)
{
    post([this, notice] { m_inner.onRetry(notice); });
}

void AsyncProgressSink::onFinished(const DownloadResult& result)
{
    post([this, result] { m_inner.onFinished(result); });
}

void AsyncProgressSink::ThreadFunc()
{
    for(;;)
    {
        std::deque<std::function<void()>> events;
        std::optional<ProgressSample> sample;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return m_shutdown.load() || !m_events.empty() || m_latest.has_value();
            });
            events.swap(m_events);
            sample.swap(m_latest);
            if(events.empty() && !sample && m_shutdown)
            {
                break;
            }
        }

        // 进度先于排队事件输出，避免“完成”之后又刷出一条旧进度
        if(sample)
        {
            deliver([this, &sample] { m_inner.onProgress(*sample); });
        }
        // 每个事件单独捕获，一个事件失败不影响后面的事件
        for(auto& ev : events)
        {
            deliver(ev);
        }
    }
}

void AsyncProgressSink::deliver(const std::function<void()>& event)
{
    try
    {
        event();
    }
    catch(const std::exception& e)
    {
        Logger::rg_log_error_core(RG_LOG_ERR, 0, "进度输出异常: %s", e.what());
    }
}

}
