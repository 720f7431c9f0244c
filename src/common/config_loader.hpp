#pragma once

#include "common/config.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace endurain {
namespace common {

class ConfigLoader {
public:
    static AppConfig Load(const std::string& path);
    static AppConfig LoadFromString(const std::string& json);
    static AppConfig LoadFromEnvOrDefault();
private:
    static AppConfig FromJson(const nlohmann::json& j);
    static nlohmann::json ReadFile(const std::string& path);
    // 环境变量覆盖敏感字段
    static void ApplyEnvOverrides(AppConfig& cfg);
};

// 获取全局配置单例
const AppConfig& GlobalConfig();

}
}
