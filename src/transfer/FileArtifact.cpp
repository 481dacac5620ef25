#include "FileArtifact.h"
#include <filesystem>
#include <system_error>
#include <cerrno>
#include "rg_logger.h"
#include "rg_macro.h"

namespace fs = std::filesystem;

namespace RGET
{

int64_t FileArtifact::diskSize() const
{
    std::error_code ec;
    if(!fs::is_regular_file(path_, ec))
    {
        return -1;
    }
    auto sz = fs::file_size(path_, ec);
    return ec ? -1 : static_cast<int64_t>(sz);
}

bool FileArtifact::remove() const
{
    std::error_code ec;
    fs::remove(path_, ec);
    if(ec)
    {
        Logger::rg_log_error_core(RG_LOG_ERR, ec.value(), "删除文件 %s 失败", path_.c_str());
        return false;
    }
    return true;
}

bool FileArtifact::open(std::ofstream& out, bool append) const
{
    std::ios::openmode mode = std::ios::binary | std::ios::out;
    mode |= append ? std::ios::app : std::ios::trunc;
    out.open(path_, mode);
    if(!out.is_open())
    {
        Logger::rg_log_error_core(RG_LOG_ERR, errno, "打开文件 %s 失败", path_.c_str());
        return false;
    }
    return true;
}

}
