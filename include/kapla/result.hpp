#pragma once

#include <kapla/error.hpp>
#include <variant>
#include <utility>

namespace kapla {

// Value-or-error return type used by every fallible kapla operation.
template<typename T>
class Result {
    std::variant<T, KaplaError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from KaplaError so KAPLA_TRY can return errors across Result<T> types
    Result(KaplaError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(KaplaError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<KaplaError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    KaplaError& error() & { return std::get<KaplaError>(data_); }
    const KaplaError& error() const& { return std::get<KaplaError>(data_); }
    KaplaError&& error() && { return std::get<KaplaError>(std::move(data_)); }

    T value_or(T fallback) const& {
        if (is_ok()) return value();
        return fallback;
    }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define KAPLA_TRY(expr) \
    do { \
        auto _kapla_result = (expr); \
        if (_kapla_result.is_err()) return std::move(_kapla_result).error(); \
    } while(0)

#define KAPLA_CONCAT_INNER(a, b) a##b
#define KAPLA_CONCAT(a, b) KAPLA_CONCAT_INNER(a, b)

// Evaluate expr, return its error, otherwise move its value into decl:
//   KAPLA_TRY_ASSIGN(auto graph, DependencyGraph::build(pkgs));
#define KAPLA_TRY_ASSIGN(decl, expr) \
    auto KAPLA_CONCAT(_kapla_r_, __LINE__) = (expr); \
    if (KAPLA_CONCAT(_kapla_r_, __LINE__).is_err()) \
        return std::move(KAPLA_CONCAT(_kapla_r_, __LINE__)).error(); \
    decl = std::move(KAPLA_CONCAT(_kapla_r_, __LINE__)).value()

} // namespace kapla
