#pragma once

/**
 * @file Result.h
 * @brief Consistent error handling types for PeerDrop
 *
 * Provides a Result<T, E> type similar to Rust's Result or C++23's std::expected.
 * Every operation that crosses the core boundary returns one of these instead
 * of throwing.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace PeerDrop {

/**
 * @brief Error codes for PeerDrop operations
 */
enum class ErrorCode {
    Success = 0,

    // Configuration errors (100-199)
    ConfigurationError = 100,

    // Network errors (200-299)
    NetworkError = 200,
    Timeout = 201,
    Cancelled = 202,

    // Protocol errors (300-399)
    ProtocolError = 300,
    ConnectionClosed = 301,

    // Crypto errors (400-499)
    AuthenticationFailure = 400,

    // Discovery errors (500-599)
    SerializationError = 500,

    // File system errors (600-699)
    FileError = 600,

    // General errors (700-799)
    CryptoError = 700,
    InternalError = 799
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigurationError: return "Configuration error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Timed out";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::AuthenticationFailure: return "Authentication failure";
        case ErrorCode::SerializationError: return "Serialization error";
        case ErrorCode::FileError: return "File error";
        case ErrorCode::CryptoError: return "Crypto error";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/// ConnectionClosed is reported separately but belongs to the protocol range
inline bool isProtocolError(ErrorCode code) {
    const int value = static_cast<int>(code);
    return value >= 300 && value < 400;
}

/**
 * @brief Error type with code and optional message
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    /// "<code name>: <message>" for user-facing output
    std::string describe() const {
        return std::string(errorCodeToString(code)) + ": " + message;
    }

    bool operator==(const Error& other) const { return code == other.code; }
    bool operator!=(const Error& other) const { return code != other.code; }
};

/**
 * @brief Result type for operations that can fail
 *
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 *
 * Usage:
 * @code
 * Result<ChunkCipher> cipher = ChunkCipher::create(key);
 * if (!cipher) {
 *     logger.error(cipher.error().describe(), "App");
 *     return;
 * }
 * auto chunk = cipher->encryptChunk(data);
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    /// Construct success result
    Result(T value) : data_(std::move(value)) {}

    /// Construct error result
    Result(E error) : data_(std::move(error)) {}

    /// Check if result is success
    bool ok() const { return std::holds_alternative<T>(data_); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Check if result is error
    bool isError() const { return std::holds_alternative<E>(data_); }

    /// Get success value (throws if error)
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    /// Get success value with default
    T valueOr(T defaultValue) const {
        if (ok()) return std::get<T>(data_);
        return defaultValue;
    }

    /// Get error (throws if success)
    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    /// Dereference operator (get value)
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }

    /// Arrow operator (access value members)
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Specialization for void success type
 */
template<typename E>
class Result<void, E> {
public:
    /// Construct success result
    Result() : error_(std::nullopt) {}

    /// Construct error result
    Result(E error) : error_(std::move(error)) {}

    /// Check if result is success
    bool ok() const { return !error_.has_value(); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Check if result is error
    bool isError() const { return error_.has_value(); }

    /// Get error (throws if success)
    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

/// Create a success result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Create a void success result
inline Result<void> Ok() {
    return Result<void>();
}

/// Create an error result
template<typename T = void>
Result<T> Err(ErrorCode code) {
    return Result<T>(Error{code});
}

/// Create an error result with message
template<typename T = void>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

} // namespace PeerDrop
