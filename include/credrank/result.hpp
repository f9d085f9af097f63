#pragma once

#include "credrank/error.hpp"

#include <optional>
#include <string>
#include <utility>

namespace credrank {

/**
 * Value or (ErrorCode, message), returned by the public facade
 */
template<typename T>
class Result {
public:
    static Result success(T value) {
        Result result;
        result.value_ = std::move(value);
        return result;
    }

    static Result failure(ErrorCode code, std::string message) {
        Result result;
        result.code_ = code;
        result.message_ = std::move(message);
        return result;
    }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    // InvalidArgumentError when called on a failure
    const T& value() const& {
        CREDRANK_CHECK_ARGUMENT(ok(), "result holds " + std::string(error_code_name(code_)) + ": " + message_);
        return *value_;
    }

    T&& value() && {
        CREDRANK_CHECK_ARGUMENT(ok(), "result holds " + std::string(error_code_name(code_)) + ": " + message_);
        return std::move(*value_);
    }

    ErrorCode error_code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    Result() = default;

    std::optional<T> value_;
    ErrorCode code_ = ErrorCode::SUCCESS;
    std::string message_;
};

} // namespace credrank
