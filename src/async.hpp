#pragma once
#include <exception>
#include <functional>
#include <optional>
#include <utility>

namespace middleman {

// Outcome of an asynchronous operation: a value or the error that replaced it.
// value() rethrows the carried error, so callers can inspect failures with
// ordinary try/catch.
template <typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {} // NOLINT(google-explicit-constructor)

    static Result failure(std::exception_ptr error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool ok() const { return !error_; }
    const std::exception_ptr& error() const { return error_; }

    const T& value() const {
        if (error_) std::rethrow_exception(error_);
        return *value_;
    }

    T& value() {
        if (error_) std::rethrow_exception(error_);
        return *value_;
    }

private:
    Result() = default;

    std::optional<T> value_;
    std::exception_ptr error_;
};

template <>
class Result<void> {
public:
    Result() = default;

    static Result failure(std::exception_ptr error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    bool ok() const { return !error_; }
    const std::exception_ptr& error() const { return error_; }

    void value() const {
        if (error_) std::rethrow_exception(error_);
    }

private:
    std::exception_ptr error_;
};

template <typename T>
using Callback = std::function<void(Result<T>)>;

} // namespace middleman
