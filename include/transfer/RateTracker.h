#pragma once
#include <chrono>
#include <cstdint>

namespace RGET
{

// 瞬时速率：上次报告以来的字节数 / 上次报告以来的秒数
class RateTracker
{
public:
    using Clock = std::chrono::steady_clock;

    explicit RateTracker(int64_t startOffset,
                         Clock::time_point now = Clock::now(),
                         Clock::duration interval = std::chrono::seconds(1))
        : interval_(interval),
          lastOffset_(startOffset),
          lastTime_(now) {}

    // 距上次报告满 interval 时返回 true 并给出 rate（字节/秒）
    bool update(int64_t offset, Clock::time_point now, double& rate);
    bool update(int64_t offset, double& rate) { return update(offset, Clock::now(), rate); }

    // 写入位置被重新定位（例如服务器忽略 Range 从0开始）时重置基准
    void reset(int64_t offset, Clock::time_point now = Clock::now());

    int64_t lastOffset() const { return lastOffset_; }

private:
    Clock::duration interval_;
    int64_t lastOffset_;            // 上次报告时的偏移
    Clock::time_point lastTime_;    // 上次报告时间
};

}
