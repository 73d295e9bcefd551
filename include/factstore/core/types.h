#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace factstore {

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    InvalidData,
    ValidationError,
    MissingCapability,
    EmbeddingFailure,
    StorageError,
    DatabaseError,
    NetworkError,
    Timeout,
    NotInitialized,
    InternalError
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::ValidationError: return "Validation error";
        case ErrorCode::MissingCapability: return "Missing capability";
        case ErrorCode::EmbeddingFailure: return "Embedding failure";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::InternalError: return "Internal error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const {
        return code == c;
    }

    bool operator!=(ErrorCode c) const {
        return code != c;
    }

    friend bool operator==(ErrorCode c, const Error& error) {
        return error.code == c;
    }

    friend bool operator!=(ErrorCode c, const Error& error) {
        return error.code != c;
    }
};

// Result type for operations that can fail
template<typename T>
class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    explicit operator bool() const noexcept {
        return has_value();
    }

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
template<>
class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept {
        return error_.code == ErrorCode::Success;
    }

    explicit operator bool() const noexcept {
        return has_value();
    }

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

} // namespace factstore

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template<>
struct fmt::formatter<factstore::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(factstore::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", factstore::errorToString(error));
    }
};
