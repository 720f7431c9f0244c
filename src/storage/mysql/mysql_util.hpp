#pragma once

#include "common/status.hpp"
#include "common/status_or.hpp"

#include <mysql/mysql.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace endurain {
namespace storage {

struct ResultDeleter {
    void operator()(MYSQL_RES* result) const {
        if (result != nullptr) {
            mysql_free_result(result);
        }
    }
};
using ResultPtr = std::unique_ptr<MYSQL_RES, ResultDeleter>;

// 1062 (唯一键冲突) 映射为 AlreadyExists, 连接类错误映射为 Unavailable, 其余为 Internal
common::Status MapMySqlError(MYSQL* conn);

std::string Escape(MYSQL* conn, const std::string& value);
// 转义并加单引号
std::string Quote(MYSQL* conn, const std::string& value);
// 空值写为 NULL
std::string QuoteNullable(MYSQL* conn, const std::optional<std::string>& value);

std::int64_t ParseInt64(const char* field);
std::optional<std::string> NullableString(const char* field);

// 执行写语句
common::Status Execute(MYSQL* conn, const std::string& sql, std::uint64_t* affected_rows = nullptr);
// 执行查询并取回完整结果集
common::StatusOr<ResultPtr> Query(MYSQL* conn, const std::string& sql);

}
}
