#pragma once

#include <stash/error.hpp>
#include <variant>
#include <functional>

namespace stash {

template<typename T>
class Result {
    std::variant<T, StashError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from StashError so STASH_TRY can return errors across Result<T> types
    Result(StashError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(StashError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<StashError>(data_); }

    // Shorthand for callers that branch on the error kind
    bool is_err(StashError::Code c) const {
        return is_err() && std::get<StashError>(data_).code == c;
    }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    StashError& error() & { return std::get<StashError>(data_); }
    const StashError& error() const& { return std::get<StashError>(data_); }
    StashError&& error() && { return std::get<StashError>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? std::get<T>(data_) : std::move(fallback);
    }

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
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define STASH_TRY(expr) \
    do { \
        auto _stash_result = (expr); \
        if (_stash_result.is_err()) return std::move(_stash_result).error(); \
    } while(0)

} // namespace stash
