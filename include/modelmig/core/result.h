#ifndef MODELMIG_CORE_RESULT_H_
#define MODELMIG_CORE_RESULT_H_

#include <string>
#include <optional>
#include <type_traits>
#include <memory>
#include <stdexcept>
#include <vector>
#include "modelmig/core/error.h"

namespace modelmig {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * Usage:
 * ```
 * Result<int> foo() {
 *     if (error_condition) {
 *         return NotFoundError("thing not found");
 *     }
 *     return Result<int>(42);
 * }
 *
 * auto result = foo();
 * if (result.ok()) {
 *     int value = result.value();
 * } else if (result.code() == Error::Code::NOT_FOUND) {
 *     std::string error = result.error();
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(std::nullopt) {}

    // Any Error subclass converts; the code survives the slice
    Result(const Error& error) : value_(), error_(error) {}

    // Move constructor
    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    // Move assignment
    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_.has_value(); }
    std::string error() const {
        if (!error_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return error_->what();
    }
    const Error& err() const {
        if (!error_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_;
    }
    Error::Code code() const { return error_ ? error_->code() : Error::Code::UNKNOWN; }
    bool is(Error::Code code) const { return error_ && error_->code() == code; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        return Result<T>(Error(message, code));
    }

private:
    T value_;
    std::optional<Error> error_;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() : error_(std::nullopt) {}
    Result(const Error& error) : error_(error) {}

    bool ok() const { return !error_.has_value(); }
    std::string error() const {
        if (!error_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return error_->what();
    }
    const Error& err() const {
        if (!error_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_;
    }
    Error::Code code() const { return error_ ? error_->code() : Error::Code::UNKNOWN; }
    bool is(Error::Code code) const { return error_ && error_->code() == code; }

    static Result<void> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        return Result<void>(Error(message, code));
    }

private:
    std::optional<Error> error_;
};

} // namespace core
} // namespace modelmig

#endif // MODELMIG_CORE_RESULT_H_
