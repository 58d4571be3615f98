#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace attachd {

// Type aliases
using ByteVector = std::vector<std::byte>;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    NotFound,
    NotArchive,
    ExtractionError,
    InvalidPath,
    StorageError,
    UpstreamFetchError,
    InvalidArgument,
    InvalidData,
    Timeout,
    OperationCancelled,
    ResourceExhausted,
    NotInitialized,
    NetworkError,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotArchive: return "Not an archive";
        case ErrorCode::ExtractionError: return "Extraction error";
        case ErrorCode::InvalidPath: return "Invalid path";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::UpstreamFetchError: return "Upstream fetch error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::InternalError: return "Internal error";
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

// Simple Result type for operations that can fail
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

} // namespace attachd

// Format support for ErrorCode
#include <format>
template<>
struct std::formatter<attachd::ErrorCode> {
    constexpr auto parse(std::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(attachd::ErrorCode error, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", attachd::errorToString(error));
    }
};

// fmt library support for ErrorCode (for spdlog)
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template<>
struct fmt::formatter<attachd::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(attachd::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", attachd::errorToString(error));
    }
};
#endif

namespace attachd {

// Common constants
inline constexpr size_t DEFAULT_BUFFER_SIZE = 64 * 1024;  // 64KB
inline constexpr size_t BINARY_SNIFF_SIZE = 8000;

} // namespace attachd
