#pragma once

#include <feedstore/error.hpp>
#include <utility>
#include <variant>

namespace feedstore {

template<typename T>
class Result {
    std::variant<T, FeedStoreError> data_;

    explicit Result(T val) : data_(std::move(val)) {}

public:
    // Implicit from FeedStoreError so FEEDSTORE_TRY can return errors across Result<T> types
    Result(FeedStoreError err) : data_(std::move(err)) {}
    static Result ok(T val) { return Result(std::move(val)); }
    static Result err(FeedStoreError e) { return Result(std::move(e)); }

    bool is_ok() const { return std::holds_alternative<T>(data_); }
    bool is_err() const { return std::holds_alternative<FeedStoreError>(data_); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    FeedStoreError& error() & { return std::get<FeedStoreError>(data_); }
    const FeedStoreError& error() const& { return std::get<FeedStoreError>(data_); }
    FeedStoreError&& error() && { return std::get<FeedStoreError>(std::move(data_)); }

    explicit operator bool() const { return is_ok(); }
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define FEEDSTORE_TRY(expr) \
    do { \
        auto _feedstore_result = (expr); \
        if (_feedstore_result.is_err()) return std::move(_feedstore_result).error(); \
    } while(0)

} // namespace feedstore
