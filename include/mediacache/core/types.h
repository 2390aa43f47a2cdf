#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mediacache {

// Type aliases
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    ServerError,
    TlsVerificationFailed,
    OperationCancelled,
    InvalidState,
    InvalidData,
    NotFound,
    IoError,
    WriteError,
    PermissionDenied,
    ResourceExhausted,
    NotInitialized,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::TlsVerificationFailed: return "TLS verification failed";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::WriteError: return "Write error";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::Unknown: return "Unknown error";
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
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
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
            throw std::runtime_error("Result contains error");
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

// Byte helpers
inline ByteSpan asBytes(std::string_view s) {
    return {reinterpret_cast<const std::byte*>(s.data()), s.size()};
}

inline ByteVector toByteVector(ByteSpan bytes) {
    return ByteVector(bytes.begin(), bytes.end());
}

} // namespace mediacache

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<mediacache::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(mediacache::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", mediacache::errorToString(error));
    }
};

namespace mediacache {

// Common constants
inline constexpr std::size_t kOneMegabyte = 1024 * 1024;
inline constexpr std::size_t kDefaultCountLimit = 100;
inline constexpr std::size_t kDefaultCostLimit = 100 * kOneMegabyte;

} // namespace mediacache
