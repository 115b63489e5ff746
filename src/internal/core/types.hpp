// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ChartDB - Core Types                                                        ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <stdexcept>
#include <utility>
#include <type_traits>

namespace chartdb {

// ==============================================================================
// Error Handling
// ==============================================================================

/// Error codes shared by every ChartDB module
enum class ErrorCode : std::uint32_t {
    Success = 0,

    // Backing document
    StorageReadFailure = 100,
    FileNotFound = 101,
    DocumentCorrupted = 102,
    StorageWriteFailure = 110,

    // Record operations
    NotFound = 200,
    InvalidArgument = 201,

    // Query collaborator
    QueryFailed = 300,
    ConnectionFailed = 301,

    InternalError = 999,
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::StorageReadFailure: return "Storage read failure";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::DocumentCorrupted: return "Document corrupted";
        case ErrorCode::StorageWriteFailure: return "Storage write failure";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::QueryFailed: return "Query failed";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/// Error with context
class Error {
public:
    Error() noexcept : code_(ErrorCode::Success) {}

    explicit Error(ErrorCode code) noexcept : code_(code) {}

    Error(ErrorCode code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] bool ok() const noexcept { return code_ == ErrorCode::Success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !ok(); }

    /// Missing, unreadable and corrupted documents are all read failures
    [[nodiscard]] bool is_read_failure() const noexcept {
        return code_ == ErrorCode::StorageReadFailure
            || code_ == ErrorCode::FileNotFound
            || code_ == ErrorCode::DocumentCorrupted;
    }

    [[nodiscard]] std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_to_string(code_));
        }
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// ==============================================================================
// Result<T>
// ==============================================================================

/// Tag type for constructing error result
struct ErrorTag {};
inline constexpr ErrorTag error_tag{};

/// Result type for operations that can fail
template<typename T>
class Result {
public:
    using value_type = T;
    using error_type = Error;

    // Success constructors
    Result(const T& value) : storage_(value), has_value_(true) {}
    Result(T&& value) : storage_(std::move(value)), has_value_(true) {}

    // Error constructors
    Result(ErrorTag, const Error& err) : storage_(err), has_value_(false) {}
    Result(ErrorTag, Error&& err) : storage_(std::move(err)), has_value_(false) {}
    Result(ErrorTag, ErrorCode code) : storage_(Error(code)), has_value_(false) {}
    Result(ErrorTag, ErrorCode code, std::string msg)
        : storage_(Error(code, std::move(msg))), has_value_(false) {}

    // Copy/Move
    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    // Observers
    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] T& value() & {
        if (!has_value_) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value_) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value_) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] const Error& error() const& {
        if (has_value_) throw std::runtime_error("Result has value, not error");
        return std::get<Error>(storage_);
    }

    // Accessors
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }
    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T&& operator*() && { return std::move(value()); }

    // Value or default
    template<typename U>
    [[nodiscard]] T value_or(U&& default_value) const& {
        return has_value_ ? value() : static_cast<T>(std::forward<U>(default_value));
    }

    template<typename U>
    [[nodiscard]] T value_or(U&& default_value) && {
        return has_value_ ? std::move(value()) : static_cast<T>(std::forward<U>(default_value));
    }

private:
    std::variant<T, Error> storage_;
    bool has_value_;
};

// ==============================================================================
// Result<void> specialization (Status)
// ==============================================================================

template<>
class Result<void> {
public:
    using value_type = void;
    using error_type = Error;

    // Success constructor
    Result() : error_(), has_value_(true) {}

    // Error constructors
    Result(ErrorTag, const Error& err) : error_(err), has_value_(false) {}
    Result(ErrorTag, Error&& err) : error_(std::move(err)), has_value_(false) {}
    Result(ErrorTag, ErrorCode code) : error_(code), has_value_(false) {}
    Result(ErrorTag, ErrorCode code, std::string msg)
        : error_(code, std::move(msg)), has_value_(false) {}

    // Copy/Move
    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    // Observers
    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    void value() const {
        if (!has_value_) throw std::runtime_error("Result has no value");
    }

    [[nodiscard]] const Error& error() const& {
        if (has_value_) throw std::runtime_error("Result has value, not error");
        return error_;
    }

private:
    Error error_;
    bool has_value_;
};

/// Status is an alias for Result<void>
using Status = Result<void>;

// ==============================================================================
// Factory functions
// ==============================================================================

/// Create success result with value
template<typename T>
[[nodiscard]] Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

/// Create success status (void result)
[[nodiscard]] inline Status Ok() {
    return Status();
}

/// Create error result
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code) {
    return Result<T>(error_tag, code);
}

template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(error_tag, code, std::move(message));
}

template<typename T>
[[nodiscard]] Result<T> Err(const Error& error) {
    return Result<T>(error_tag, error);
}

/// Create error status
[[nodiscard]] inline Status Err(ErrorCode code) {
    return Status(error_tag, code);
}

[[nodiscard]] inline Status Err(ErrorCode code, std::string message) {
    return Status(error_tag, code, std::move(message));
}

[[nodiscard]] inline Status Err(const Error& error) {
    return Status(error_tag, error);
}

} // namespace chartdb
