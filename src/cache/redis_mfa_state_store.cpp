#include "cache/redis_mfa_state_store.hpp"

#include "common/logger.hpp"

#include <charconv>
#include <vector>

namespace endurain {
namespace cache {

namespace {

// KEYS[1] = 计数键
// ARGV = now, attempt_max_age, 然后是按 failures 升序的 (failures, seconds) 对
// 返回 {count, until, applied}
constexpr char kIncrementScript[] = R"lua(
local now = tonumber(ARGV[1])
local max_age = tonumber(ARGV[2])
local count = tonumber(redis.call('HGET', KEYS[1], 'count') or '0')
local until_ts = tonumber(redis.call('HGET', KEYS[1], 'until') or '0')
if until_ts ~= 0 and now <= until_ts then
  return {count, until_ts, 0}
end
count = count + 1
local seconds = 0
for i = 3, #ARGV, 2 do
  if count >= tonumber(ARGV[i]) then
    seconds = tonumber(ARGV[i + 1])
  end
end
local applied = 0
until_ts = 0
if seconds > 0 then
  until_ts = now + seconds
  applied = 1
end
redis.call('HSET', KEYS[1], 'count', count, 'until', until_ts, 'last', now)
redis.call('EXPIRE', KEYS[1], max_age + seconds)
return {count, until_ts, applied}
)lua";

bool ParseInt64(const std::string& text, std::int64_t* out) {
    const char* begin = text.data();
    const char* end = begin + text.size();
    auto result = std::from_chars(begin, end, *out);
    return result.ec == std::errc() && result.ptr == end;
}

}

RedisMfaStateStore::RedisMfaStateStore(std::shared_ptr<RedisClient> client,
                                       std::shared_ptr<const common::Clock> clock,
                                       core::MfaStoreLimits limits,
                                       std::string key_prefix)
    : client_(std::move(client)),
      clock_(std::move(clock)),
      limits_(limits),
      key_prefix_(std::move(key_prefix)) {}

common::StatusOr<core::AttemptRecord> RedisMfaStateStore::GetAttempts(const std::string& key) {
    auto fields = client_->HGetAll(AttemptsKey(key));
    if (!fields.IsOk()) {
        return fields.GetStatus();
    }
    if (fields.Value().empty()) {
        return common::Status::NotFound("No failed attempts recorded");
    }
    std::int64_t count = 0;
    std::int64_t until = 0;
    std::int64_t last = 0;
    auto& values = fields.Value();
    if (!ParseInt64(values["count"], &count) || !ParseInt64(values["until"], &until) ||
        !ParseInt64(values["last"], &last)) {
        ENDURAIN_LOG_ERROR("Malformed MFA attempt record for {}", key);
        return common::Status::Internal("Malformed MFA attempt record");
    }
    core::AttemptRecord record;
    record.failed_count = static_cast<int>(count);
    record.lockout_until = until;
    record.last_failure_at = last;
    return common::StatusOr<core::AttemptRecord>(record);
}

common::StatusOr<core::IncrementResult> RedisMfaStateStore::IncrementWithPolicy(const std::string& key,
                                                                                const core::LockoutPolicy& policy) {
    std::vector<std::string> keys{AttemptsKey(key)};
    std::vector<std::string> args{std::to_string(clock_->NowSeconds()),
                                  std::to_string(limits_.attempt_max_age_seconds)};
    for (const auto& step : policy.Ladder()) {
        args.push_back(std::to_string(step.failures));
        args.push_back(std::to_string(step.lockout_seconds));
    }
    auto reply = client_->EvalIntegers(kIncrementScript, keys, args);
    if (!reply.IsOk()) {
        return reply.GetStatus();
    }
    if (reply.Value().size() != 3) {
        return common::Status::Internal("Unexpected reply from MFA increment script");
    }
    core::IncrementResult result;
    result.failed_count = static_cast<int>(reply.Value()[0]);
    result.lockout_until = reply.Value()[1];
    result.lockout_applied = reply.Value()[2] != 0;
    return common::StatusOr<core::IncrementResult>(result);
}

common::Status RedisMfaStateStore::ResetAttempts(const std::string& key) {
    return client_->Del(AttemptsKey(key));
}

common::Status RedisMfaStateStore::PutPending(const std::string& username, const std::string& user_id) {
    // 值格式: <created_at>:<user_id>
    std::string value = std::to_string(clock_->NowSeconds()) + ":" + user_id;
    return client_->SetEx(PendingKey(username), value, limits_.pending_login_max_age_seconds);
}

common::StatusOr<core::PendingLogin> RedisMfaStateStore::GetPending(const std::string& username) {
    auto value = client_->Get(PendingKey(username));
    if (!value.IsOk()) {
        if (value.GetStatus().Code() == common::StatusCode::kNotFound) {
            return common::Status::NotFound("No pending login");
        }
        return value.GetStatus();
    }
    const std::string& text = value.Value();
    auto sep = text.find(':');
    core::PendingLogin pending;
    if (sep == std::string::npos || !ParseInt64(text.substr(0, sep), &pending.created_at)) {
        ENDURAIN_LOG_ERROR("Malformed pending login record for {}", username);
        return common::Status::Internal("Malformed pending login record");
    }
    pending.user_id = text.substr(sep + 1);
    return common::StatusOr<core::PendingLogin>(std::move(pending));
}

common::Status RedisMfaStateStore::DeletePending(const std::string& username) {
    return client_->Del(PendingKey(username));
}

common::StatusOr<std::size_t> RedisMfaStateStore::SweepExpired() {
    return common::StatusOr<std::size_t>(std::size_t{0});
}

}
}
