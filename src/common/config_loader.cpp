#include "common/config_loader.hpp"

#include "config_path.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace endurain {
namespace common {

namespace {
AppConfig g_config;
std::once_flag g_config_once; // 全局配置初始化标志

// 检测配置文件路径
std::string DetectConfigPath() {
    if (const char* env = std::getenv("ENDURAIN_AUTH_CONFIG")) {
        return env;
    }
    return GetConfigPath("app.example.json");
}

} // namespace

AppConfig ConfigLoader::Load(const std::string& path) {
    auto json = ReadFile(path);
    auto cfg = FromJson(json);
    ApplyEnvOverrides(cfg);
    return cfg;
}

AppConfig ConfigLoader::LoadFromString(const std::string& json) {
    auto cfg = FromJson(nlohmann::json::parse(json, nullptr, true, true));
    ApplyEnvOverrides(cfg);
    return cfg;
}

AppConfig ConfigLoader::LoadFromEnvOrDefault() {
    return Load(DetectConfigPath());
}

const AppConfig& GlobalConfig() {
    std::call_once(g_config_once, []() {
        g_config = ConfigLoader::LoadFromEnvOrDefault();
    });
    return g_config;
}

nlohmann::json ConfigLoader::ReadFile(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }
    return nlohmann::json::parse(ifs, nullptr, true, true);
}

void ConfigLoader::ApplyEnvOverrides(AppConfig& cfg) {
    if (const char* secret = std::getenv("ENDURAIN_SECRET_KEY")) {
        cfg.security.secret_key = secret;
    }
    if (const char* password = std::getenv("ENDURAIN_DB_PASSWORD")) {
        cfg.storage.mysql.password = password;
    }
}

// 从JSON对象构建配置结构体
AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig cfg;
    // Server配置
    if (j.contains("server")) {
        const auto& server = j["server"];
        cfg.server.host = server.value("host", cfg.server.host);
        cfg.server.port = server.value("port", cfg.server.port);
    }
    // Logging配置
    if (j.contains("logging")) {
        const auto& logging = j["logging"];
        cfg.logging.level = logging.value("level", cfg.logging.level);
        cfg.logging.pattern = logging.value("pattern", cfg.logging.pattern);
        cfg.logging.console = logging.value("console", cfg.logging.console);
        cfg.logging.file = logging.value("file", cfg.logging.file);
        cfg.logging.max_file_size_mb = logging.value("max_file_size_mb", cfg.logging.max_file_size_mb);
        cfg.logging.max_files = logging.value("max_files", cfg.logging.max_files);
        if (cfg.logging.max_file_size_mb < 0 || cfg.logging.max_files <= 0) {
            throw std::runtime_error("Invalid logging rotation settings");
        }
    }
    // Security配置
    if (j.contains("security")) {
        const auto& security = j["security"];
        auto& sec = cfg.security;
        sec.secret_key = security.value("secret_key", sec.secret_key);
        sec.refresh_token_ttl_days = security.value("refresh_token_ttl_days", sec.refresh_token_ttl_days);
        sec.access_token_ttl_minutes = security.value("access_token_ttl_minutes", sec.access_token_ttl_minutes);
        sec.rotation_grace_seconds = security.value("rotation_grace_seconds", sec.rotation_grace_seconds);
        sec.oauth_state_ttl_seconds = security.value("oauth_state_ttl_seconds", sec.oauth_state_ttl_seconds);
        sec.link_token_ttl_seconds = security.value("link_token_ttl_seconds", sec.link_token_ttl_seconds);
        sec.password_hash_iterations = security.value("password_hash_iterations", sec.password_hash_iterations);
        sec.grace_policy = security.value("grace_policy", sec.grace_policy);
        sec.session_idle_timeout_enabled =
            security.value("session_idle_timeout_enabled", sec.session_idle_timeout_enabled);
        sec.session_idle_timeout_hours = security.value("session_idle_timeout_hours", sec.session_idle_timeout_hours);
        sec.session_absolute_timeout_hours =
            security.value("session_absolute_timeout_hours", sec.session_absolute_timeout_hours);
    }
    // MFA配置
    if (j.contains("mfa")) {
        const auto& mfa = j["mfa"];
        cfg.mfa.pending_login_max_age_seconds =
            mfa.value("pending_login_max_age_seconds", cfg.mfa.pending_login_max_age_seconds);
        cfg.mfa.attempt_max_age_seconds = mfa.value("attempt_max_age_seconds", cfg.mfa.attempt_max_age_seconds);
        cfg.mfa.backend = mfa.value("backend", cfg.mfa.backend);
        if (mfa.contains("lockout_ladder") && mfa["lockout_ladder"].is_array()) {
            cfg.mfa.lockout_ladder.clear();
            for (const auto& step : mfa["lockout_ladder"]) {
                LockoutStep s;
                s.failures = step.value("failures", 0);
                s.lockout_seconds = step.value("lockout_seconds", 0);
                if (s.failures <= 0 || s.lockout_seconds <= 0) {
                    throw std::runtime_error("Invalid mfa.lockout_ladder entry: " + step.dump());
                }
                cfg.mfa.lockout_ladder.push_back(s);
            }
            // 阶梯按失败次数升序排列
            std::sort(cfg.mfa.lockout_ladder.begin(), cfg.mfa.lockout_ladder.end(),
                      [](const LockoutStep& a, const LockoutStep& b) { return a.failures < b.failures; });
        }
    }
    // Maintenance配置
    if (j.contains("maintenance")) {
        cfg.maintenance.sweep_interval_seconds =
            j["maintenance"].value("sweep_interval_seconds", cfg.maintenance.sweep_interval_seconds);
    }
    // Storage配置
    if (j.contains("storage")) {
        const auto& storage = j["storage"];
        if (storage.contains("mysql")) {
            const auto& mysql = storage["mysql"];
            cfg.storage.mysql.host = mysql.value("host", cfg.storage.mysql.host);
            cfg.storage.mysql.port = mysql.value("port", cfg.storage.mysql.port);
            cfg.storage.mysql.user = mysql.value("user", cfg.storage.mysql.user);
            cfg.storage.mysql.password = mysql.value("password", cfg.storage.mysql.password);
            cfg.storage.mysql.database = mysql.value("database", cfg.storage.mysql.database);
            cfg.storage.mysql.pool_size = mysql.value("pool_size", cfg.storage.mysql.pool_size);
            cfg.storage.mysql.connection_timeout_ms = mysql.value("connection_timeout_ms", cfg.storage.mysql.connection_timeout_ms);
            cfg.storage.mysql.read_timeout_ms = mysql.value("read_timeout_ms", cfg.storage.mysql.read_timeout_ms);
            cfg.storage.mysql.write_timeout_ms = mysql.value("write_timeout_ms", cfg.storage.mysql.write_timeout_ms);
            cfg.storage.mysql.enabled = mysql.value("enabled", cfg.storage.mysql.enabled);
        }
    }
    // Cache配置
    if (j.contains("cache")) {
        const auto& cache = j["cache"];
        if (cache.contains("redis")) {
            const auto& redis = cache["redis"];
            cfg.cache.redis.host = redis.value("host", cfg.cache.redis.host);
            cfg.cache.redis.port = redis.value("port", cfg.cache.redis.port);
            cfg.cache.redis.password = redis.value("password", cfg.cache.redis.password);
            cfg.cache.redis.db = redis.value("db", cfg.cache.redis.db);
            cfg.cache.redis.pool_size = redis.value("pool_size", cfg.cache.redis.pool_size);
            cfg.cache.redis.connection_timeout_ms = redis.value("connection_timeout_ms", cfg.cache.redis.connection_timeout_ms);
            cfg.cache.redis.socket_timeout_ms = redis.value("socket_timeout_ms", cfg.cache.redis.socket_timeout_ms);
            cfg.cache.redis.enabled = redis.value("enabled", cfg.cache.redis.enabled);
        }
    }
    return cfg;
}

}
}
