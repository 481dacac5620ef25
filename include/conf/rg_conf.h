#pragma once
#include <memory>
#include <string>
#include <vector>

namespace RGET
{

// 配置文件中的一项 key = value
typedef struct
{
    char ItemName[50];
    char ItemContent[500];
}rgConfItem;

class RgConf
{
private:
    RgConf(){};
public:
    ~RgConf(){};

public:
    static RgConf* getInstance() {
        static RgConf instance;
        return &instance;
    }

    RgConf(const RgConf&) = delete;
    RgConf& operator=(const RgConf&) = delete;

public:
    using rgConfItemPtr = std::unique_ptr<rgConfItem>;

    // 不含 '/' 的名字到 <可执行文件目录>/../config/ 下找，否则按路径打开
    bool LoadConf(const char* confname);
    const char* GetString(const char* key);
    int GetIntDefault(const char* key, const int default_value);
    bool GetBoolDefault(const char* key, const bool default_value);
    void Clear() { m_ConfigItemList.clear(); }

    // 实际载入的配置文件路径
    const std::string& Path() const { return m_path; }

public:
    std::vector<rgConfItemPtr> m_ConfigItemList;

private:
    std::string m_path;
};

}
