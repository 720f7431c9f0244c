#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"
#include "storage/mysql/connection.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

namespace endurain {
namespace storage {

// 有上限的 MySQL 连接池, 连接按需创建
class ConnectionPool {
public:
    explicit ConnectionPool(Options options);

    // 租出的连接, 析构时归还
    class Lease {
    public:
        Lease() = default;
        Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection);
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        ~Lease();

        Connection* operator->() noexcept { return connection_.get(); }
        MYSQL* Raw() const noexcept { return connection_ ? connection_->Raw() : nullptr; }
        explicit operator bool() const noexcept { return connection_ != nullptr; }

    private:
        void Release() noexcept;

        ConnectionPool* pool_ = nullptr;
        std::unique_ptr<Connection> connection_;
    };

    // 无空闲连接且已达上限时最多等待 acquire_timeout
    common::StatusOr<Lease> Acquire();

    const Options& GetOptions() const noexcept { return options_; }

private:
    void Return(std::unique_ptr<Connection> connection);

    Options options_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::unique_ptr<Connection>> idle_;
    std::size_t open_connections_ = 0;
};

}
}
