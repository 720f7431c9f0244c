#include "storage/mysql/transaction.hpp"

#include "common/logger.hpp"
#include "storage/mysql/mysql_util.hpp"

namespace endurain {
namespace storage {

Transaction::Transaction(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {}

Transaction::~Transaction() {
    if (active_) {
        auto status = Rollback();
        if (!status.IsOk()) {
            ENDURAIN_LOG_ERROR("Transaction rollback failed: {}", status.Message());
        }
    }
}

common::Status Transaction::Begin() {
    auto lease = pool_->Acquire();
    if (!lease.IsOk()) {
        return lease.GetStatus();
    }
    lease_ = std::move(lease.Value());
    conn_ = lease_.Raw();
    if (mysql_autocommit(conn_, 0) != 0) {
        return MapMySqlError(conn_);
    }
    active_ = true;
    return common::Status::OK();
}

common::Status Transaction::Commit() {
    if (!active_) {
        return common::Status::FailedPrecondition("Transaction is not active");
    }
    if (mysql_commit(conn_) != 0) {
        auto status = MapMySqlError(conn_);
        auto rollback = Rollback();
        if (!rollback.IsOk()) {
            ENDURAIN_LOG_ERROR("Rollback after failed commit failed: {}", rollback.Message());
        }
        return status;
    }
    active_ = false;
    mysql_autocommit(conn_, 1);
    return common::Status::OK();
}

common::Status Transaction::Rollback() {
    if (!active_) {
        return common::Status::OK();
    }
    active_ = false;
    bool failed = mysql_rollback(conn_) != 0;
    auto status = failed ? MapMySqlError(conn_) : common::Status::OK();
    mysql_autocommit(conn_, 1);
    return status;
}

common::Status Transaction::Execute(const std::string& sql, std::uint64_t* affected_rows) {
    if (!active_) {
        return common::Status::FailedPrecondition("Transaction is not active");
    }
    return storage::Execute(conn_, sql, affected_rows);
}

}
}
