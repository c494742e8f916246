#pragma once

#include <stackup/error.hpp>
#include <variant>
#include <utility>

namespace stackup {

template<typename T>
class Result {
    std::variant<T, StackupError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from StackupError so STACKUP_TRY can forward errors between Result types
    Result(StackupError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(StackupError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<StackupError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    StackupError& error() & { return std::get<StackupError>(data_); }
    const StackupError& error() const& { return std::get<StackupError>(data_); }
    StackupError&& error() && { return std::get<StackupError>(std::move(data_)); }

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
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define STACKUP_TRY(expr) \
    do { \
        auto _stackup_result = (expr); \
        if (_stackup_result.is_err()) return std::move(_stackup_result).error(); \
    } while(0)

} // namespace stackup
