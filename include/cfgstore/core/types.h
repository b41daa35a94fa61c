#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace cfgstore {

// Type aliases
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using RecordId = int64_t;

// Error types
enum class ErrorCode {
    Success = 0,
    ConnectionFailed,
    SchemaError,
    IntegrityError,
    NotFound,
    Duplicate,
    CryptoError,
    ConcurrencyConflict,
    InvalidOrUsed,
    InvalidArgument,
    InvalidState,
    InvalidData,
    DatabaseError,
    Timeout,
    ResourceExhausted,
    FileNotFound,
    WriteError,
    NotSupported,
    NotInitialized,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::SchemaError: return "Schema migration failed";
        case ErrorCode::IntegrityError: return "Integrity check failed";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::Duplicate: return "Duplicate key";
        case ErrorCode::CryptoError: return "Crypto error";
        case ErrorCode::ConcurrencyConflict: return "Concurrency conflict";
        case ErrorCode::InvalidOrUsed: return "Invalid or already used";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::WriteError: return "Write error";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Errors that must stop the owning process from advertising the store.
 */
constexpr bool isFatalAtOpen(ErrorCode error) {
    return error == ErrorCode::ConnectionFailed || error == ErrorCode::SchemaError ||
           error == ErrorCode::IntegrityError;
}

/**
 * @brief Errors a caller may retry by re-running the whole logical operation.
 */
constexpr bool isTransient(ErrorCode error) {
    return error == ErrorCode::Timeout || error == ErrorCode::ConcurrencyConflict ||
           error == ErrorCode::ResourceExhausted;
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + error_.message);
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace cfgstore

// fmt library support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<cfgstore::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(cfgstore::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", cfgstore::errorToString(error));
    }
};
