#include "DownloadTask.h"

namespace RGET
{

RequestOptions DownloadTask::transferOptions() const
{
    RequestOptions opts;
    opts.proxy = proxy;
    opts.verifyTls = verifyTls;
    opts.connectTimeout = connectTimeout;
    opts.readTimeout = readTimeout;
    opts.totalTimeout = 0;
    opts.maxRedirects = maxRedirects;
    opts.bufferSize = blockSize;
    opts.userAgent = userAgent;
    return opts;
}

RequestOptions DownloadTask::probeOptions() const
{
    RequestOptions opts = transferOptions();
    opts.totalTimeout = probeTimeout;
    return opts;
}

int DownloadResult::exitCode() const
{
    switch(outcome)
    {
    case Outcome::Succeeded:
    case Outcome::Cancelled:
        return 0;
    case Outcome::Failed:
        return reason == FailReason::ProbeFailed ? 2 : 1;
    case Outcome::Pending:
        break;
    }
    return 1;
}

const char* OutcomeName(Outcome outcome)
{
    switch(outcome)
    {
    case Outcome::Pending:   return "pending";
    case Outcome::Succeeded: return "succeeded";
    case Outcome::Failed:    return "failed";
    case Outcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

}
