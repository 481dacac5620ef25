#include "IntegrityChecker.h"
#include <filesystem>
#include <fstream>
#include <system_error>
#include "rg_macro.h"

namespace fs = std::filesystem;

namespace RGET
{

bool IntegrityChecker::check(const std::string& path, std::optional<int64_t> expectedSize)
{
    std::error_code ec;
    if(!fs::is_regular_file(path, ec))
    {
        return false;
    }

    auto actual = fs::file_size(path, ec);
    if(ec)
    {
        return false;
    }
    if(expectedSize && static_cast<int64_t>(actual) != *expectedSize)
    {
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if(!in.is_open())
    {
        return false;
    }
    char header[RG_INTEGRITY_HEAD_BYTES];
    in.read(header, sizeof(header));
    return in.gcount() > 0;
}

}
