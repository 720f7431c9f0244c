#include "storage/mysql/connection_pool.hpp"

namespace endurain {
namespace storage {

ConnectionPool::ConnectionPool(Options options)
    : options_(std::move(options)) {}

ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection)
    : pool_(pool), connection_(std::move(connection)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)) {
    other.pool_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        Release();
        pool_ = other.pool_;
        connection_ = std::move(other.connection_);
        other.pool_ = nullptr;
    }
    return *this;
}

ConnectionPool::Lease::~Lease() {
    Release();
}

void ConnectionPool::Lease::Release() noexcept {
    if (pool_ && connection_) {
        pool_->Return(std::move(connection_));
    }
    pool_ = nullptr;
}

common::StatusOr<ConnectionPool::Lease> ConnectionPool::Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (idle_.empty() && open_connections_ >= options_.pool_size) {
        if (!cv_.wait_for(lock, options_.acquire_timeout, [this]() {
                return !idle_.empty() || open_connections_ < options_.pool_size;
            })) {
            return common::Status::Unavailable("Timed out waiting for a MySQL connection");
        }
    }

    if (!idle_.empty()) {
        auto connection = std::move(idle_.front());
        idle_.pop_front();
        return common::StatusOr<Lease>(Lease(this, std::move(connection)));
    }

    // 占住名额后在锁外建连
    ++open_connections_;
    lock.unlock();
    auto created = Connection::Create(options_);
    if (!created.IsOk()) {
        std::lock_guard<std::mutex> guard(mutex_);
        --open_connections_;
        cv_.notify_one();
        return created.GetStatus();
    }
    return common::StatusOr<Lease>(Lease(this, std::move(created.Value())));
}

void ConnectionPool::Return(std::unique_ptr<Connection> connection) {
    // 断开的连接直接丢弃, 释放名额
    bool alive = connection->Ping();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (alive) {
            idle_.push_back(std::move(connection));
        } else {
            --open_connections_;
        }
    }
    cv_.notify_one();
}

}
}
