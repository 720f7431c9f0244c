#pragma once

#include "common/config.hpp"
#include "common/status.hpp"
#include "common/status_or.hpp"

#include <sw/redis++/redis++.h>

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace endurain {
namespace cache {

// redis++ 的薄封装, 把异常转换为 Status
class RedisClient {
public:
    explicit RedisClient(const common::RedisConfig& config);
    ~RedisClient();

    // 懒连接, 已连接时直接返回 OK
    common::Status Connect();

    common::Status Set(const std::string& key, const std::string& value);
    common::Status SetEx(const std::string& key, const std::string& value, int ttl_seconds);
    common::StatusOr<std::string> Get(const std::string& key);
    common::Status Del(const std::string& key);
    common::StatusOr<bool> Exists(const std::string& key);

    // 键不存在时返回空表
    common::StatusOr<std::unordered_map<std::string, std::string>> HGetAll(const std::string& key);

    // 执行返回整数数组的 Lua 脚本
    common::StatusOr<std::vector<long long>> EvalIntegers(const std::string& script,
                                                          const std::vector<std::string>& keys,
                                                          const std::vector<std::string>& args);

private:
    common::RedisConfig config_;
    std::shared_ptr<sw::redis::Redis> redis_;
};

}
}
