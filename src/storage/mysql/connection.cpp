#include "storage/mysql/connection.hpp"

#include <string>

namespace endurain {
namespace storage {

namespace {

common::Status ConnectError(const std::string& context, MYSQL* handle) {
    std::string message = context;
    if (handle != nullptr) {
        message += ": ";
        message += mysql_error(handle);
    }
    return common::Status::Unavailable(message);
}

// libmysqlclient 的超时以秒为单位, 不足 1 秒按 1 秒处理
unsigned int ToTimeoutSeconds(std::chrono::milliseconds timeout) {
    auto seconds = timeout.count() / 1000;
    return static_cast<unsigned int>(seconds > 0 ? seconds : 1);
}

}

Connection::Connection(MYSQL* handle, Options options)
    : handle_(handle), options_(std::move(options)) {}

Connection::~Connection() {
    if (handle_ != nullptr) {
        mysql_close(handle_);
        handle_ = nullptr;
    }
}

common::StatusOr<std::unique_ptr<Connection>> Connection::Create(const Options& options) {
    MYSQL* handle = mysql_init(nullptr);
    if (handle == nullptr) {
        return ConnectError("mysql_init failed", nullptr);
    }

    unsigned int connect_timeout = ToTimeoutSeconds(options.connect_timeout);
    unsigned int read_timeout = ToTimeoutSeconds(options.read_timeout);
    unsigned int write_timeout = ToTimeoutSeconds(options.write_timeout);
    mysql_options(handle, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout);
    mysql_options(handle, MYSQL_OPT_READ_TIMEOUT, &read_timeout);
    mysql_options(handle, MYSQL_OPT_WRITE_TIMEOUT, &write_timeout);

    if (!mysql_real_connect(handle,
                            options.host.c_str(),
                            options.user.c_str(),
                            options.password.c_str(),
                            options.database.c_str(),
                            options.port,
                            nullptr,
                            0)) {
        common::Status status = ConnectError("mysql_real_connect failed", handle);
        mysql_close(handle);
        return status;
    }

    if (!options.charset.empty() && mysql_set_character_set(handle, options.charset.c_str()) != 0) {
        common::Status status = ConnectError("mysql_set_character_set failed", handle);
        mysql_close(handle);
        return status;
    }

    return common::StatusOr<std::unique_ptr<Connection>>(
        std::unique_ptr<Connection>(new Connection(handle, options)));
}

bool Connection::Ping() const {
    return handle_ != nullptr && mysql_ping(handle_) == 0;
}

}
}
