#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace endurain {
namespace core {

// 一次性恢复码, 只保存口令哈希
struct BackupCode {
    std::int64_t id = 0;
    std::string user_id;
    std::string code_hash;
    bool used = false;
    std::optional<std::int64_t> used_at;
    std::int64_t created_at = 0;
};

}
}
