#pragma once

#include <workon/error.hpp>
#include <utility>
#include <variant>

namespace workon {

template<typename T>
class Result {
    std::variant<T, WorkonError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from WorkonError so WORKON_TRY can forward errors across Result<T> types
    Result(WorkonError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(WorkonError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<WorkonError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    WorkonError& error() & { return std::get<WorkonError>(data_); }
    const WorkonError& error() const& { return std::get<WorkonError>(data_); }
    WorkonError&& error() && { return std::get<WorkonError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define WORKON_TRY(expr) \
    do { \
        auto _workon_result = (expr); \
        if (_workon_result.is_err()) return std::move(_workon_result).error(); \
    } while(0)

} // namespace workon
