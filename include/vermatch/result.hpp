#pragma once

#include <vermatch/error.hpp>
#include <variant>
#include <utility>

namespace vermatch {

template<typename T>
class Result {
    std::variant<T, VermatchError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from VermatchError so VERMATCH_TRY can return errors across Result<T> types
    Result(VermatchError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(VermatchError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<VermatchError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    VermatchError& error() & { return std::get<VermatchError>(data_); }
    const VermatchError& error() const& { return std::get<VermatchError>(data_); }
    VermatchError&& error() && { return std::get<VermatchError>(std::move(data_)); }

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
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define VERMATCH_TRY(expr) \
    do { \
        auto _vermatch_result = (expr); \
        if (_vermatch_result.is_err()) return std::move(_vermatch_result).error(); \
    } while(0)

} // namespace vermatch
