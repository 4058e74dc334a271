#pragma once

#include <tid/error.hpp>
#include <variant>
#include <functional>

namespace tid {

template<typename T>
class Result {
    std::variant<T, TidError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from TidError so TID_TRY can return errors across Result<T> types
    Result(TidError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(TidError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<TidError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    TidError& error() & { return std::get<TidError>(data_); }
    const TidError& error() const& { return std::get<TidError>(data_); }
    TidError&& error() && { return std::get<TidError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    template<typename F>
    auto map(F&& f) const -> Result<decltype(f(std::declval<const T&>()))> {
        using U = decltype(f(std::declval<const T&>()));
        if (is_ok()) {
            return Result<U>::ok(f(value()));
        }
        return Result<U>::err(error());
    }

    template<typename F>
    auto and_then(F&& f) const -> decltype(f(std::declval<const T&>())) {
        if (is_ok()) {
            return f(value());
        }
        using RetType = decltype(f(std::declval<const T&>()));
        return RetType::err(error());
    }

    template<typename F>
    Result or_else(F&& f) const {
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

#define TID_TRY(expr) \
    do { \
        auto _tid_result = (expr); \
        if (_tid_result.is_err()) return std::move(_tid_result).error(); \
    } while(0)

} // namespace tid
