#pragma once

#include <fillin/error.hpp>
#include <variant>

namespace fillin {

template<typename T>
class Result {
    std::variant<T, FillinError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from FillinError so FILLIN_TRY can return errors across Result<T> types
    Result(FillinError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(FillinError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<FillinError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    FillinError& error() & { return std::get<FillinError>(data_); }
    const FillinError& error() const& { return std::get<FillinError>(data_); }
    FillinError&& error() && { return std::get<FillinError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define FILLIN_TRY(expr) \
    do { \
        auto _fillin_result = (expr); \
        if (_fillin_result.is_err()) return std::move(_fillin_result).error(); \
    } while(0)

} // namespace fillin
