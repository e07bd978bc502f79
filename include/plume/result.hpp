#pragma once

#include <plume/error.hpp>
#include <variant>
#include <functional>

namespace plume {

template<typename T>
class Result {
    std::variant<T, PlumeError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from PlumeError so PLUME_TRY can return errors across Result<T> types
    Result(PlumeError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(PlumeError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<PlumeError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    PlumeError& error() & { return std::get<PlumeError>(data_); }
    const PlumeError& error() const& { return std::get<PlumeError>(data_); }
    PlumeError&& error() && { return std::get<PlumeError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    // Value or a fallback when this holds an error
    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

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

#define PLUME_TRY(expr) \
    do { \
        auto _plume_result = (expr); \
        if (_plume_result.is_err()) return std::move(_plume_result).error(); \
    } while(0)

} // namespace plume
