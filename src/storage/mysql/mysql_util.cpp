#include "storage/mysql/mysql_util.hpp"

#include <mysql/errmsg.h>
#include <fmt/format.h>

#include <cstdlib>
#include <vector>

namespace endurain {
namespace storage {

common::Status MapMySqlError(MYSQL* conn) {
    if (conn == nullptr) {
        return common::Status::Unavailable("No MySQL connection");
    }
    unsigned int err = mysql_errno(conn);
    if (err == 1062) {
        return common::Status::AlreadyExists(mysql_error(conn));
    }
    if (err == CR_SERVER_GONE_ERROR || err == CR_SERVER_LOST || err == CR_CONNECTION_ERROR ||
        err == CR_CONN_HOST_ERROR) {
        return common::Status::Unavailable(mysql_error(conn));
    }
    return common::Status::Internal(mysql_error(conn));
}

std::string Escape(MYSQL* conn, const std::string& value) {
    std::vector<char> buffer(value.size() * 2 + 1);
    unsigned long length = mysql_real_escape_string(conn, buffer.data(), value.c_str(),
                                                    static_cast<unsigned long>(value.size()));
    return std::string(buffer.data(), length);
}

std::string Quote(MYSQL* conn, const std::string& value) {
    return fmt::format("'{}'", Escape(conn, value));
}

std::string QuoteNullable(MYSQL* conn, const std::optional<std::string>& value) {
    return value ? Quote(conn, *value) : std::string("NULL");
}

std::int64_t ParseInt64(const char* field) {
    if (field == nullptr) {
        return 0;
    }
    return std::strtoll(field, nullptr, 10);
}

std::optional<std::string> NullableString(const char* field) {
    if (field == nullptr) {
        return std::nullopt;
    }
    return std::string(field);
}

common::Status Execute(MYSQL* conn, const std::string& sql, std::uint64_t* affected_rows) {
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn);
    }
    if (affected_rows != nullptr) {
        *affected_rows = mysql_affected_rows(conn);
    }
    return common::Status::OK();
}

common::StatusOr<ResultPtr> Query(MYSQL* conn, const std::string& sql) {
    if (mysql_real_query(conn, sql.c_str(), sql.size()) != 0) {
        return MapMySqlError(conn);
    }
    ResultPtr result(mysql_store_result(conn));
    if (!result) {
        if (mysql_field_count(conn) != 0) {
            return MapMySqlError(conn);
        }
        return common::Status::Internal("Query returned no result set");
    }
    return common::StatusOr<ResultPtr>(std::move(result));
}

}
}
