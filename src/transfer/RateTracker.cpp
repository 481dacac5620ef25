#include "RateTracker.h"

namespace RGET
{

bool RateTracker::update(int64_t offset, Clock::time_point now, double& rate)
{
    if(now - lastTime_ < interval_)
    {
        return false;
    }

    double elapsedSec = std::chrono::duration<double>(now - lastTime_).count();
    rate = elapsedSec > 0 ? static_cast<double>(offset - lastOffset_) / elapsedSec : 0.0;

    lastTime_ = now;
    lastOffset_ = offset;
    return true;
}

void RateTracker::reset(int64_t offset, Clock::time_point now)
{
    lastOffset_ = offset;
    lastTime_ = now;
}

}
