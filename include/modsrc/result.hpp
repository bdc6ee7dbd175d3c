#pragma once

#include <modsrc/error.hpp>
#include <utility>
#include <variant>

namespace modsrc {

// Value-or-error return type used across the library.
// Errors are never thrown; callers branch on is_ok()/is_err().
template<typename T>
class Result {
    std::variant<T, ModsrcError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit so MODSRC_TRY can forward an error into any Result<U>
    Result(ModsrcError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(ModsrcError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<ModsrcError>(data_); }

    // True when this holds an error of the given code
    bool is_err(ModsrcError::Code code) const {
        return is_err() && error().code == code;
    }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    ModsrcError& error() & { return std::get<ModsrcError>(data_); }
    const ModsrcError& error() const& { return std::get<ModsrcError>(data_); }
    ModsrcError&& error() && { return std::get<ModsrcError>(std::move(data_)); }

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

#define MODSRC_TRY(expr) \
    do { \
        auto _modsrc_result = (expr); \
        if (_modsrc_result.is_err()) return std::move(_modsrc_result).error(); \
    } while(0)

} // namespace modsrc
