#pragma once

#include "common/status.hpp"
#include "storage/mysql/connection_pool.hpp"

#include <memory>
#include <string>

namespace endurain {
namespace storage {

// 持有一个连接的事务; 未提交即析构时回滚
class Transaction {
public:
    explicit Transaction(std::shared_ptr<ConnectionPool> pool);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    common::Status Begin();
    common::Status Commit();
    common::Status Rollback();

    // 执行一条写语句, affected_rows 可为空
    common::Status Execute(const std::string& sql, std::uint64_t* affected_rows = nullptr);

    MYSQL* Raw() const noexcept { return conn_; }

private:
    std::shared_ptr<ConnectionPool> pool_;
    ConnectionPool::Lease lease_;
    MYSQL* conn_ = nullptr;
    bool active_ = false;
};

}
}
