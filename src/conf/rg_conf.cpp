#include "rg_conf.h"
#include <fstream>
#include <string>
#include <functional>
#include <algorithm>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <cctype>
#include <strings.h>
#include <limits.h>
#include <unistd.h>
#include "rg_logger.h"
#include "rg_macro.h"

namespace RGET
{

static std::string ResolveConfPath(const char* confname)
{
    if(strchr(confname, '/') != nullptr)
    {
        return confname;
    }

    char exePath[PATH_MAX];
    ssize_t count = readlink("/proc/self/exe", exePath, PATH_MAX - 1);
    if(count == -1)
    {
        return confname;
    }
    exePath[count] = '\0';

    std::string exeDir = std::string(exePath).substr(0, std::string(exePath).find_last_of('/'));
    return exeDir + "/../config/" + confname;
}

bool RgConf::LoadConf(const char* confname)
{
    std::string configPath = ResolveConfPath(confname);

    std::ifstream conf_file(configPath);
    if(!conf_file.is_open())
    {
        Logger::rg_log_error_core(RG_LOG_INFO, errno, "无法打开配置文件 %s", configPath.c_str());
        return false;
    }
    m_ConfigItemList.clear();
    m_path = configPath;

    std::function<void(std::string&)> Trim = [](std::string& str) {
        str.erase(str.begin(), std::find_if(str.begin(), str.end(), [](unsigned char ch) {
            return !std::isspace(ch);
        }));
        str.erase(std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
            return !std::isspace(ch);
        }).base(), str.end());
    };

    std::string line;
    while(std::getline(conf_file, line))
    {
        Trim(line);
        // 空行、注释行、[节]
        if(line.empty() || line[0] == ';' || line[0] == '#' || line[0] == '[')
        {
            continue;
        }

        auto delimiterPos = line.find('=');
        if(delimiterPos != std::string::npos)
        {
            rgConfItemPtr item = std::make_unique<rgConfItem>();
            memset(item.get(), 0, sizeof(rgConfItem));

            std::string key = line.substr(0, delimiterPos);
            std::string value = line.substr(delimiterPos + 1);
            Trim(key);
            Trim(value);

            strncpy(item->ItemName, key.c_str(), sizeof(item->ItemName)-1);
            strncpy(item->ItemContent, value.c_str(), sizeof(item->ItemContent)-1);

            m_ConfigItemList.push_back(std::move(item));
        }
    }
    return true;
}

const char* RgConf::GetString(const char* key)
{
    auto it = std::find_if(m_ConfigItemList.begin(), m_ConfigItemList.end(),
        [key](const rgConfItemPtr& item) {
            return strcasecmp(item->ItemName, key) == 0;
        });

    if(it != m_ConfigItemList.end())
    {
        return (*it)->ItemContent;
    }
    return nullptr;
}

int RgConf::GetIntDefault(const char* key, const int default_value)
{
    const char* value = GetString(key);
    if(value == nullptr || value[0] == '\0')
    {
        return default_value;
    }
    return atoi(value);
}

bool RgConf::GetBoolDefault(const char* key, const bool default_value)
{
    const char* value = GetString(key);
    if(value == nullptr || value[0] == '\0')
    {
        return default_value;
    }
    if(strcasecmp(value, "1") == 0 || strcasecmp(value, "true") == 0 ||
       strcasecmp(value, "yes") == 0 || strcasecmp(value, "on") == 0)
    {
        return true;
    }
    if(strcasecmp(value, "0") == 0 || strcasecmp(value, "false") == 0 ||
       strcasecmp(value, "no") == 0 || strcasecmp(value, "off") == 0)
    {
        return false;
    }
    return default_value;
}

}
