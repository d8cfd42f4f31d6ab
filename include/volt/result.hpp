#pragma once

#include <volt/error.hpp>
#include <variant>
#include <utility>

namespace volt {

template<typename T>
class Result {
    std::variant<T, VoltError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from VoltError so VOLT_TRY can return errors across Result<T> types
    Result(VoltError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(VoltError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<VoltError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    VoltError& error() & { return std::get<VoltError>(data_); }
    const VoltError& error() const& { return std::get<VoltError>(data_); }
    VoltError&& error() && { return std::get<VoltError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

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

#define VOLT_TRY(expr) \
    do { \
        auto _volt_result = (expr); \
        if (_volt_result.is_err()) return std::move(_volt_result).error(); \
    } while(0)

} // namespace volt
