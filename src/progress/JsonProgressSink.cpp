#include "JsonProgressSink.h"

namespace RGET
{

using json = nlohmann::json;

static json SizeOrNull(const std::optional<int64_t>& size)
{
    return size ? json(*size) : json(nullptr);
}

void JsonProgressSink::emit(const json& j)
{
    // 路径和 curl 错误信息不一定是 UTF-8，非法字节替换为 U+FFFD
    out_ << j.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    out_.flush();
}

void JsonProgressSink::onStart(const DownloadTask& task, std::optional<int64_t> total)
{
    json j = {
        {"event", "start"},
        {"url", task.url},
        {"path", task.filePath},
        {"total", SizeOrNull(total)},
        {"proxy", task.proxy.empty() ? json(nullptr) : json(task.proxy)},
        {"retryInterval", task.retryInterval.count()},
        {"verifyTls", task.verifyTls}
    };
    emit(j);
}

void JsonProgressSink::onAttempt(int attempt, int64_t offset)
{
    emit({{"event", "attempt"}, {"attempt", attempt}, {"offset", offset}});
}

void JsonProgressSink::onProgress(const ProgressSample& sample)
{
    emit({{"event", "progress"}, {"offset", sample.offset}, {"total", SizeOrNull(sample.total)}, {"rate", sample.rate}});
}

void JsonProgressSink::onCorrupt(const std::string& path, int64_t size)
{
    emit({{"event", "corrupt"}, {"path", path}, {"size", size}});
}

void JsonProgressSink::onRetry(const RetryNotice& notice)
{
    emit({
        {"event", "retry"},
        {"attempt", notice.attempt},
        {"offset", notice.offset},
        {"total", SizeOrNull(notice.total)},
        {"wait", notice.wait.count()},
        {"reason", notice.reason}
    });
}

void JsonProgressSink::onFinished(const DownloadResult& result)
{
    emit({
        {"event", "finished"},
        {"outcome", OutcomeName(result.outcome)},
        {"path", result.filePath},
        {"bytesOnDisk", result.bytesOnDisk},
        {"total", SizeOrNull(result.expectedSize)},
        {"attempts", result.attempts},
        {"message", result.message},
        {"exitCode", result.exitCode()}
    });
}

}
