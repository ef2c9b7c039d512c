// Result.hpp
#pragma once
#include <string>
#include <utility>

enum class ErrorCode {
    None,
    InvalidInput,
    Cancelled,
    DeadlineExceeded,
    Io,
    Operation,
    Internal
};

struct SyncError {
    ErrorCode code = ErrorCode::None;
    std::string message;

    SyncError() = default;
    SyncError(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    // keeps the code, prefixes the message with what was being attempted
    SyncError wrap(const std::string& context) const {
        return SyncError(code, context + ": " + message);
    }
};

template<typename T>
struct Result {
    bool success;
    ErrorCode code;
    std::string message;
    T data;

    static Result<T> Ok(T data) {
        return {true, ErrorCode::None, "", std::move(data)};
    }

    static Result<T> Error(ErrorCode code, const std::string& msg) {
        return {false, code, msg, T{}};
    }

    static Result<T> Error(const SyncError& err) {
        return {false, err.code, err.message, T{}};
    }

    // failure that still hands a usable value back to the caller
    static Result<T> Error(const SyncError& err, T data) {
        return {false, err.code, err.message, std::move(data)};
    }

    SyncError error() const {
        return SyncError(code, message);
    }
};

// Specialization for void
template<>
struct Result<void> {
    bool success;
    ErrorCode code;
    std::string message;

    static Result<void> Ok() {
        return {true, ErrorCode::None, ""};
    }

    static Result<void> Error(ErrorCode code, const std::string& msg) {
        return {false, code, msg};
    }

    static Result<void> Error(const SyncError& err) {
        return {false, err.code, err.message};
    }

    SyncError error() const {
        return SyncError(code, message);
    }
};
