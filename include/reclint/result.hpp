#pragma once

#include <reclint/error.hpp>
#include <variant>
#include <functional>

namespace reclint {

template<typename T>
class Result {
    std::variant<T, ReclintError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from ReclintError so RECLINT_TRY can return errors across Result<T> types
    Result(ReclintError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ReclintError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ReclintError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    ReclintError& error() & { return std::get<ReclintError>(data_); }
    const ReclintError& error() const& { return std::get<ReclintError>(data_); }
    ReclintError&& error() && { return std::get<ReclintError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) -> Result<decltype(f(std::declval<T&>()))> {
        using U = decltype(f(std::declval<T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) -> decltype(f(std::declval<T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) {
        if (is_ok()) {
            return *this;
        }
        return f(error());
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define RECLINT_TRY(expr) \
    do { \
        auto _reclint_result = (expr); \
        if (_reclint_result.is_err()) return std::move(_reclint_result).error(); \
    } while(0)

} // namespace reclint
