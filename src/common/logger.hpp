#pragma once

#include "common/config.hpp"

#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace endurain {
namespace common {

void InitLogger(const LoggingConfig& config);
void ShutdownLogger();

// 获取全局日志器
std::shared_ptr<spdlog::logger> GetLogger();

// 截断敏感标识, 日志中只保留前缀
inline std::string Redact(const std::string& value, std::size_t keep = 8) {
    if (value.size() <= keep) {
        return value;
    }
    return value.substr(0, keep) + "...";
}

// 日志宏定义
#define ENDURAIN_LOG_DEBUG(...)    ::endurain::common::GetLogger()->debug(__VA_ARGS__)
#define ENDURAIN_LOG_INFO(...)     ::endurain::common::GetLogger()->info(__VA_ARGS__)
#define ENDURAIN_LOG_WARN(...)     ::endurain::common::GetLogger()->warn(__VA_ARGS__)
#define ENDURAIN_LOG_ERROR(...)    ::endurain::common::GetLogger()->error(__VA_ARGS__)
#define ENDURAIN_LOG_CRITICAL(...) ::endurain::common::GetLogger()->critical(__VA_ARGS__)

}
}
