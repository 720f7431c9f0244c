#include "core/mfa/mfa_state_store.hpp"

namespace endurain {
namespace core {

InMemoryMfaStateStore::InMemoryMfaStateStore(std::shared_ptr<const common::Clock> clock, MfaStoreLimits limits)
    : clock_(std::move(clock)), limits_(limits) {}

bool InMemoryMfaStateStore::AttemptExpired(const AttemptRecord& record, std::int64_t now) const {
    if (record.lockout_until != 0 && now <= record.lockout_until) {
        return false;
    }
    std::int64_t reference = record.lockout_until > record.last_failure_at ? record.lockout_until
                                                                            : record.last_failure_at;
    return now - reference > limits_.attempt_max_age_seconds;
}

bool InMemoryMfaStateStore::PendingExpired(const PendingLogin& pending, std::int64_t now) const {
    return now - pending.created_at > limits_.pending_login_max_age_seconds;
}

common::StatusOr<AttemptRecord> InMemoryMfaStateStore::GetAttempts(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attempts_.find(key);
    if (it == attempts_.end()) {
        return common::Status::NotFound("No failed attempts recorded");
    }
    if (AttemptExpired(it->second, clock_->NowSeconds())) {
        attempts_.erase(it);
        return common::Status::NotFound("No failed attempts recorded");
    }
    return common::StatusOr<AttemptRecord>(it->second);
}

common::StatusOr<IncrementResult> InMemoryMfaStateStore::IncrementWithPolicy(const std::string& key,
                                                                             const LockoutPolicy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::int64_t now = clock_->NowSeconds();
    auto it = attempts_.find(key);
    if (it != attempts_.end() && AttemptExpired(it->second, now)) {
        attempts_.erase(it);
        it = attempts_.end();
    }

    IncrementResult result;
    if (it != attempts_.end()) {
        auto& record = it->second;
        // 锁定期内不递增, 防止刷请求重置时钟
        if (record.lockout_until != 0 && now <= record.lockout_until) {
            result.failed_count = record.failed_count;
            result.lockout_until = record.lockout_until;
            return common::StatusOr<IncrementResult>(result);
        }
        result.failed_count = record.failed_count + 1;
    } else {
        result.failed_count = 1;
    }

    int seconds = policy.LockoutSecondsFor(result.failed_count);
    if (seconds > 0) {
        result.lockout_until = now + seconds;
        result.lockout_applied = true;
    }
    attempts_[key] = AttemptRecord{result.failed_count, result.lockout_until, now};
    return common::StatusOr<IncrementResult>(result);
}

common::Status InMemoryMfaStateStore::ResetAttempts(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    attempts_.erase(key);
    return common::Status::OK();
}

common::Status InMemoryMfaStateStore::PutPending(const std::string& username, const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_[username] = PendingLogin{user_id, clock_->NowSeconds()};
    return common::Status::OK();
}

common::StatusOr<PendingLogin> InMemoryMfaStateStore::GetPending(const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(username);
    if (it == pending_.end()) {
        return common::Status::NotFound("No pending login");
    }
    if (PendingExpired(it->second, clock_->NowSeconds())) {
        pending_.erase(it);
        return common::Status::NotFound("No pending login");
    }
    return common::StatusOr<PendingLogin>(it->second);
}

common::Status InMemoryMfaStateStore::DeletePending(const std::string& username) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(username);
    return common::Status::OK();
}

common::StatusOr<std::size_t> InMemoryMfaStateStore::SweepExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::int64_t now = clock_->NowSeconds();
    std::size_t removed = 0;
    for (auto it = attempts_.begin(); it != attempts_.end();) {
        if (AttemptExpired(it->second, now)) {
            it = attempts_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (PendingExpired(it->second, now)) {
            it = pending_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return common::StatusOr<std::size_t>(removed);
}

}
}
