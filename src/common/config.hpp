#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace endurain {
namespace common {

// 服务器配置结构体
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 50061;
};

// 日志配置结构体
struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e][%^%l%$][%t] %v";
    bool console = true;
    std::string file = "";
    int max_file_size_mb = 0;   // 大于 0 时按大小滚动
    int max_files = 5;
};

// 会话与令牌安全配置
struct SecurityConfig {
    std::string secret_key = "";
    int refresh_token_ttl_days = 7;
    int access_token_ttl_minutes = 15;
    int rotation_grace_seconds = 60;
    int oauth_state_ttl_seconds = 600;
    int link_token_ttl_seconds = 60;
    int password_hash_iterations = 100000;
    std::string grace_policy = "reject";   // reject | rotate
    bool session_idle_timeout_enabled = false;
    int session_idle_timeout_hours = 24;
    int session_absolute_timeout_hours = 720;
};

// 锁定阶梯中的一级
struct LockoutStep {
    int failures = 0;
    int lockout_seconds = 0;
};

// MFA 配置结构体
struct MfaConfig {
    std::vector<LockoutStep> lockout_ladder{{5, 300}, {10, 1800}, {15, 7200}};
    int pending_login_max_age_seconds = 600;
    int attempt_max_age_seconds = 86400;
    std::string backend = "memory";        // memory | redis
};

// 周期清理配置
struct MaintenanceConfig {
    int sweep_interval_seconds = 300;
};

// Mysql配置结构体
struct MysqlConfig {
    std::string host = "127.0.0.1";
    int port = 3306;
    std::string user = "endurain";
    std::string password = "";
    std::string database = "endurain";
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int read_timeout_ms = 2000;
    int write_timeout_ms = 2000;
    bool enabled = false;
};

// 存储配置结构体
struct StorageConfig {
    MysqlConfig mysql;
};

// Redis配置结构体
struct RedisConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password = "";
    int db = 0;
    int pool_size = 4;
    int connection_timeout_ms = 500;
    int socket_timeout_ms = 500;
    bool enabled = false;
};

// 缓存配置结构体
struct CacheConfig {
    RedisConfig redis;
};

// 应用配置结构体
struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    SecurityConfig security;
    MfaConfig mfa;
    MaintenanceConfig maintenance;
    StorageConfig storage;
    CacheConfig cache;
};

}
}
