#include "cache/redis_client.hpp"

#include <chrono>
#include <iterator>

namespace endurain {
namespace cache {

namespace {

common::Status RedisError(const char* action, const sw::redis::Error& err) {
    return common::Status::Unavailable(std::string("Redis ") + action + " failed: " + err.what());
}

}

RedisClient::RedisClient(const common::RedisConfig& config)
    : config_(config) {}

RedisClient::~RedisClient() = default;

common::Status RedisClient::Connect() {
    if (!config_.enabled) {
        return common::Status::Unavailable("Redis is disabled in the configuration");
    }
    if (redis_) {
        return common::Status::OK();
    }

    try {
        sw::redis::ConnectionOptions opts;
        opts.host = config_.host;
        opts.port = config_.port;
        if (!config_.password.empty()) {
            opts.password = config_.password;
        }
        opts.db = config_.db;
        opts.connect_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);
        opts.socket_timeout = std::chrono::milliseconds(config_.socket_timeout_ms);

        sw::redis::ConnectionPoolOptions pool_opts;
        pool_opts.size = static_cast<std::size_t>(config_.pool_size);
        pool_opts.wait_timeout = std::chrono::milliseconds(config_.connection_timeout_ms);

        auto redis = std::make_shared<sw::redis::Redis>(opts, pool_opts);
        // 连接池是懒建立的, 用 PING 确认服务可达
        redis->ping();
        redis_ = std::move(redis);
        return common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return RedisError("connect", err);
    }
}

common::Status RedisClient::Set(const std::string& key, const std::string& value) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        redis_->set(key, value);
        return common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return RedisError("SET", err);
    }
}

common::Status RedisClient::SetEx(const std::string& key, const std::string& value, int ttl_seconds) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        redis_->set(key, value, std::chrono::seconds(ttl_seconds));
        return common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return RedisError("SET EX", err);
    }
}

common::StatusOr<std::string> RedisClient::Get(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        auto val = redis_->get(key);
        if (!val) {
            return common::Status::NotFound("Key not found");
        }
        return common::StatusOr<std::string>(*val);
    } catch (const sw::redis::Error& err) {
        return RedisError("GET", err);
    }
}

common::Status RedisClient::Del(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        redis_->del(key);
        return common::Status::OK();
    } catch (const sw::redis::Error& err) {
        return RedisError("DEL", err);
    }
}

common::StatusOr<bool> RedisClient::Exists(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        return common::StatusOr<bool>(redis_->exists(key) > 0);
    } catch (const sw::redis::Error& err) {
        return RedisError("EXISTS", err);
    }
}

common::StatusOr<std::unordered_map<std::string, std::string>> RedisClient::HGetAll(const std::string& key) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        std::unordered_map<std::string, std::string> fields;
        redis_->hgetall(key, std::inserter(fields, fields.begin()));
        return common::StatusOr<std::unordered_map<std::string, std::string>>(std::move(fields));
    } catch (const sw::redis::Error& err) {
        return RedisError("HGETALL", err);
    }
}

common::StatusOr<std::vector<long long>> RedisClient::EvalIntegers(const std::string& script,
                                                                   const std::vector<std::string>& keys,
                                                                   const std::vector<std::string>& args) {
    auto status = Connect();
    if (!status.IsOk()) {
        return status;
    }
    try {
        std::vector<long long> result;
        redis_->eval(script, keys.begin(), keys.end(), args.begin(), args.end(), std::back_inserter(result));
        return common::StatusOr<std::vector<long long>>(std::move(result));
    } catch (const sw::redis::Error& err) {
        return RedisError("EVAL", err);
    }
}

}
}
