#include "core/mfa/backup_code_vault.hpp"

#include "common/logger.hpp"
#include "crypto/random.hpp"

#include <algorithm>
#include <cctype>

namespace endurain {
namespace core {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
static_assert(sizeof(kAlphabet) - 1 == 32, "backup code alphabet must have 32 symbols");
constexpr int kCodeLength = 8;
constexpr int kMaxCodeCount = 50;

bool InAlphabet(char c) {
    for (const char* p = kAlphabet; *p != '\0'; ++p) {
        if (*p == c) {
            return true;
        }
    }
    return false;
}

std::string Normalize(const std::string& candidate) {
    std::string out;
    out.reserve(candidate.size());
    for (char c : candidate) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

} // namespace

BackupCodeVault::BackupCodeVault(std::shared_ptr<BackupCodeRepository> repository,
                                 std::shared_ptr<const crypto::PasswordHasher> hasher,
                                 std::shared_ptr<const common::Clock> clock)
    : repository_(std::move(repository)), hasher_(std::move(hasher)), clock_(std::move(clock)) {}

common::StatusOr<std::string> BackupCodeVault::GenerateBackupCode() {
    auto bytes = crypto::RandomBytes(kCodeLength);
    if (!bytes.IsOk()) {
        return bytes.GetStatus();
    }
    std::string code;
    code.reserve(kCodeLength + 1);
    for (int i = 0; i < kCodeLength; ++i) {
        if (i == kCodeLength / 2) {
            code.push_back('-');
        }
        // 256 是 32 的整数倍, 取低 5 位无偏
        code.push_back(kAlphabet[static_cast<unsigned char>(bytes.Value()[i]) & 0x1F]);
    }
    return common::StatusOr<std::string>(std::move(code));
}

bool BackupCodeVault::LooksLikeBackupCode(const std::string& candidate) {
    std::string code = Normalize(candidate);
    if (code.size() != static_cast<std::size_t>(kCodeLength + 1) || code[kCodeLength / 2] != '-') {
        return false;
    }
    for (std::size_t i = 0; i < code.size(); ++i) {
        if (i == kCodeLength / 2) {
            continue;
        }
        if (!InAlphabet(code[i])) {
            return false;
        }
    }
    return true;
}

common::StatusOr<std::vector<std::string>> BackupCodeVault::Generate(const std::string& user_id, int count) {
    if (count <= 0 || count > kMaxCodeCount) {
        return common::Status::InvalidArgument("Backup code count out of range");
    }
    std::int64_t now = clock_->NowSeconds();
    std::vector<std::string> plaintext;
    std::vector<BackupCode> records;
    plaintext.reserve(count);
    records.reserve(count);
    for (int i = 0; i < count; ++i) {
        auto code = GenerateBackupCode();
        if (!code.IsOk()) {
            return code.GetStatus();
        }
        auto hash = hasher_->Hash(code.Value());
        if (!hash.IsOk()) {
            return hash.GetStatus();
        }
        BackupCode record;
        record.user_id = user_id;
        record.code_hash = hash.Value();
        record.created_at = now;
        records.push_back(std::move(record));
        plaintext.push_back(std::move(code.Value()));
    }

    auto status = repository_->Replace(user_id, records);
    if (!status.IsOk()) {
        ENDURAIN_LOG_ERROR("Failed to store backup codes for user {}: {}", user_id, status.Message());
        return status;
    }
    ENDURAIN_LOG_INFO("Generated {} backup codes for user {}", count, user_id);
    return common::StatusOr<std::vector<std::string>>(std::move(plaintext));
}

common::StatusOr<bool> BackupCodeVault::VerifyAndConsume(const std::string& user_id, const std::string& candidate) {
    auto unused = repository_->ListUnused(user_id);
    if (!unused.IsOk()) {
        return unused.GetStatus();
    }
    std::string code = Normalize(candidate);

    // 不提前退出, 避免泄露码的数量与位置
    const BackupCode* match = nullptr;
    for (const auto& record : unused.Value()) {
        bool ok = hasher_->Verify(code, record.code_hash);
        if (ok && match == nullptr) {
            match = &record;
        }
    }
    if (match == nullptr) {
        return common::StatusOr<bool>(false);
    }

    auto consumed = repository_->MarkUsed(match->id, user_id, clock_->NowSeconds());
    if (!consumed.IsOk()) {
        return consumed.GetStatus();
    }
    if (consumed.Value()) {
        ENDURAIN_LOG_INFO("Backup code consumed for user {}", user_id);
    }
    return consumed;
}

common::StatusOr<BackupCodeStatus> BackupCodeVault::GetStatus(const std::string& user_id) {
    auto codes = repository_->ListForUser(user_id);
    if (!codes.IsOk()) {
        return codes.GetStatus();
    }
    BackupCodeStatus status;
    for (const auto& code : codes.Value()) {
        ++status.total;
        if (code.used) {
            ++status.used;
        }
        if (!status.created_at || code.created_at < *status.created_at) {
            status.created_at = code.created_at;
        }
    }
    status.unused = status.total - status.used;
    status.has_codes = status.total > 0;
    return common::StatusOr<BackupCodeStatus>(status);
}

}
}
