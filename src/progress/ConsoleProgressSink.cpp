#include "ConsoleProgressSink.h"
#include "rg_func.h"

namespace RGET
{

void ConsoleProgressSink::onStart(const DownloadTask& task, std::optional<int64_t> total)
{
    std::string name = FilenameFromUrl(task.url);
    if(total)
    {
        fprintf(out_, "开始下载：%s（总大小：%s）\n", name.c_str(), FormatSize(static_cast<double>(*total)).c_str());
    }
    else
    {
        fprintf(out_, "开始下载：%s（服务器未声明大小，无法续传）\n", name.c_str());
    }
    fprintf(out_, "保存位置：%s\n", task.filePath.c_str());
    if(!task.proxy.empty())
    {
        fprintf(out_, "使用代理：%s\n", task.proxy.c_str());
    }
    fprintf(out_, "重试间隔：%lld秒\n", static_cast<long long>(task.retryInterval.count()));
    fflush(out_);
}

void ConsoleProgressSink::onAttempt(int attempt, int64_t offset)
{
    fprintf(out_, "\n第%d次尝试：从%s开始续传\n", attempt, FormatSize(static_cast<double>(offset)).c_str());
    fflush(out_);
}

void ConsoleProgressSink::onProgress(const ProgressSample& sample)
{
    std::string done = FormatSize(static_cast<double>(sample.offset));
    std::string speed = FormatSize(sample.rate) + "/s";

    if(sample.total && *sample.total > 0)
    {
        double percent = static_cast<double>(sample.offset) / static_cast<double>(*sample.total) * 100;
        fprintf(out_, "\r%.1f%% (%s/%s) %s    ", percent, done.c_str(),
                FormatSize(static_cast<double>(*sample.total)).c_str(), speed.c_str());
    }
    else
    {
        fprintf(out_, "\r%s %s    ", done.c_str(), speed.c_str());
    }
    fflush(out_);
}

void ConsoleProgressSink::onCorrupt(const std::string& path, int64_t size)
{
    (void)path;
    fprintf(out_, "\n检测到文件损坏（%s），重新开始下载\n", FormatSize(static_cast<double>(size)).c_str());
    fflush(out_);
}

void ConsoleProgressSink::onRetry(const RetryNotice& notice)
{
    if(showErrorDetail_ && !notice.reason.empty())
    {
        fprintf(out_, "\n第%d次尝试失败：%s\n", notice.attempt, notice.reason.c_str());
    }
    else
    {
        fprintf(out_, "\n第%d次尝试失败\n", notice.attempt);
    }

    std::string total = notice.total ? FormatSize(static_cast<double>(*notice.total)) : "未知";
    fprintf(out_, "当前已下载：%s/%s\n", FormatSize(static_cast<double>(notice.offset)).c_str(), total.c_str());
    fprintf(out_, "等待%lld秒后自动重试...\n", static_cast<long long>(notice.wait.count()));
    fflush(out_);
}

void ConsoleProgressSink::onFinished(const DownloadResult& result)
{
    switch(result.outcome)
    {
    case Outcome::Succeeded:
        onProgress(ProgressSample{result.bytesOnDisk, result.expectedSize, 0});
        fprintf(out_, "\n\n下载完成！文件保存至：%s\n", result.filePath.c_str());
        break;
    case Outcome::Cancelled:
        fprintf(out_, "\n\n用户中断下载，已保存进度：%s（%lld 字节）\n",
                FormatSize(static_cast<double>(result.bytesOnDisk)).c_str(),
                static_cast<long long>(result.bytesOnDisk));
        fprintf(out_, "文件路径：%s（再次执行将从第 %lld 字节继续下载）\n",
                result.filePath.c_str(), static_cast<long long>(result.bytesOnDisk));
        break;
    case Outcome::Failed:
        if(result.reason == FailReason::ProbeFailed)
        {
            if(showErrorDetail_)
            {
                fprintf(out_, "获取文件信息失败：%s\n", result.message.c_str());
            }
            else
            {
                fprintf(out_, "获取文件信息失败\n");
            }
        }
        else if(result.reason == FailReason::FileError)
        {
            fprintf(out_, "\n文件错误：%s\n", result.message.c_str());
        }
        else
        {
            fprintf(out_, "\n已尝试%d次仍未完成，下载失败。当前已下载：%s，再次执行可继续\n",
                    result.attempts, FormatSize(static_cast<double>(result.bytesOnDisk)).c_str());
        }
        break;
    case Outcome::Pending:
        break;
    }
    fflush(out_);
}

}
