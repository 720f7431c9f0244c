#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/options.hpp"

#include <mysql/mysql.h>
#include <memory>

namespace endurain {
namespace storage {

// 独占一个 MYSQL 句柄, 析构时关闭
class Connection {
public:
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    ~Connection();

    static common::StatusOr<std::unique_ptr<Connection>> Create(const Options& options);

    // 归还连接池前的存活检查
    bool Ping() const;

    MYSQL* Raw() const noexcept { return handle_; }
    const Options& GetOptions() const noexcept { return options_; }

private:
    Connection(MYSQL* handle, Options options);

    MYSQL* handle_ = nullptr;
    Options options_;
};

}
}
