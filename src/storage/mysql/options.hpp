#pragma once

#include "common/config.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace endurain {
namespace storage {

// 连接池与单个连接的参数
struct Options {
    std::string host = "127.0.0.1";
    std::uint16_t port = 3306;
    std::string user = "endurain";
    std::string password;
    std::string database = "endurain";
    std::size_t pool_size = 4;
    std::chrono::milliseconds acquire_timeout{500};
    std::chrono::milliseconds connect_timeout{500};
    std::chrono::milliseconds read_timeout{2000};
    std::chrono::milliseconds write_timeout{2000};
    std::string charset = "utf8mb4";

    static Options FromConfig(const common::MysqlConfig& config) {
        Options options;
        options.host = config.host;
        options.port = static_cast<std::uint16_t>(config.port);
        options.user = config.user;
        options.password = config.password;
        options.database = config.database;
        options.pool_size = config.pool_size > 0 ? static_cast<std::size_t>(config.pool_size) : 1;
        options.acquire_timeout = std::chrono::milliseconds(config.connection_timeout_ms);
        options.connect_timeout = std::chrono::milliseconds(config.connection_timeout_ms);
        options.read_timeout = std::chrono::milliseconds(config.read_timeout_ms);
        options.write_timeout = std::chrono::milliseconds(config.write_timeout_ms);
        return options;
    }
};

}
}
