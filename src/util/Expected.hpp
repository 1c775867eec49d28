#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace gitcontext {

enum class ErrorCode {
    None = 0,
    InvalidArgs,
    NotFound,
    MalformedObject,
    IoError,
    InternalError
};

inline const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::MalformedObject: return "malformed-object";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::InternalError: return "internal-error";
    }
    return "unknown";
}

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/**
 * @brief Exception raised at the accessor boundary in strict mode
 *
 * Carries the ErrorCode of the Error that caused it so callers can tell a
 * missing repository apart from a corrupt one.
 */
class GitContextError : public std::runtime_error {
public:
    explicit GitContextError(const Error& err)
        : std::runtime_error(err.message), errorCode(err.code) {}

    ErrorCode code() const { return errorCode; }

private:
    ErrorCode errorCode;
};

template <typename T>
class Expected {
public:
    Expected(const T& value) : hasValue(true), value_(value) {}
    Expected(T&& value) : hasValue(true), value_(std::move(value)) {}
    Expected(const Error& err) : hasValue(false), error_(err) {}
    Expected(Error&& err) : hasValue(false), error_(std::move(err)) {}

    bool has_value() const { return hasValue; }
    explicit operator bool() const { return hasValue; }
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

private:
    bool hasValue{false};
    T value_{};
    Error error_{};
};

template <>
class Expected<void> {
public:
    Expected() : ok(true) {}
    Expected(const Error& err) : ok(false), error_(err) {}
    Expected(Error&& err) : ok(false), error_(std::move(err)) {}
    bool has_value() const { return ok; }
    explicit operator bool() const { return ok; }
    const Error& error() const { return error_; }

private:
    bool ok{false};
    Error error_{};
};

}
