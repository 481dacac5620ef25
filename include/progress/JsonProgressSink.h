#pragma once
#include <ostream>
#include <nlohmann/json.hpp>
#include "ProgressSink.h"

namespace RGET
{

// 每个事件输出一行 JSON，方便其他程序解析
class JsonProgressSink : public ProgressSink
{
public:
    explicit JsonProgressSink(std::ostream& out) : out_(out) {}

    void onStart(const DownloadTask& task, std::optional<int64_t> total) override;
    void onAttempt(int attempt, int64_t offset) override;
    void onProgress(const ProgressSample& sample) override;
    void onCorrupt(const std::string& path, int64_t size) override;
    void onRetry(const RetryNotice& notice) override;
    void onFinished(const DownloadResult& result) override;

private:
    void emit(const nlohmann::json& j);

    std::ostream& out_;
};

}
