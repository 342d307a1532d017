#pragma once

#include <bracelint/error.hpp>
#include <utility>
#include <variant>

namespace bracelint {

template<typename T>
class Result {
    std::variant<T, BraceLintError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from BraceLintError so BRACELINT_TRY can return errors across Result<T> types
    Result(BraceLintError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(BraceLintError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<BraceLintError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    BraceLintError& error() & { return std::get<BraceLintError>(data_); }
    const BraceLintError& error() const& { return std::get<BraceLintError>(data_); }
    BraceLintError&& error() && { return std::get<BraceLintError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define BRACELINT_TRY(expr) \
    do { \
        auto _bracelint_result = (expr); \
        if (_bracelint_result.is_err()) return std::move(_bracelint_result).error(); \
    } while(0)

} // namespace bracelint
