#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ankidirect {

// Type aliases
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;

// Return true to abandon the current operation as soon as possible
using ShouldCancel = std::function<bool()>;

// Error types
enum class ErrorCode {
    Success = 0,
    RemoteRejected,
    NoDataFound,
    Transport,
    MalformedResponse,
    InvalidIdentifier,
    ValidationFailed,
    MissingMediaSource,
    Io,
    OperationCancelled,
    InvalidArgument,
    InternalError
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::RemoteRejected: return "Rejected by service";
        case ErrorCode::NoDataFound: return "No data found";
        case ErrorCode::Transport: return "Transport error";
        case ErrorCode::MalformedResponse: return "Malformed response";
        case ErrorCode::InvalidIdentifier: return "Invalid identifier";
        case ErrorCode::ValidationFailed: return "Validation failed";
        case ErrorCode::MissingMediaSource: return "Missing media source";
        case ErrorCode::Io: return "I/O error";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
    }
    return "Unknown error";
}

// Context kept for responses that did not match the expected result shape.
struct MalformedResponseInfo {
    std::string expectedShape;
    nlohmann::json received;
    std::string diagnostic;
};

// Error struct for detailed error information.
// The message carries the variant payload: the service's error text for RemoteRejected,
// the field name for ValidationFailed, the filename for MissingMediaSource and the raw
// identifier for InvalidIdentifier.
struct Error {
    ErrorCode code;
    std::string message;
    std::optional<MalformedResponseInfo> malformed;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    // Human-readable rendering for logs and CLI output
    std::string describe() const {
        std::string out = errorToString(code);
        if (!message.empty() && message != errorToString(code)) {
            out += ": ";
            out += message;
        }
        if (malformed) {
            out += " (expected ";
            out += malformed->expectedShape;
            out += "; ";
            out += malformed->diagnostic;
            out += ")";
        }
        return out;
    }

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

inline Error makeMalformedResponse(std::string expectedShape, nlohmann::json received,
                                   std::string diagnostic) {
    Error err{ErrorCode::MalformedResponse, "response does not match " + expectedShape};
    err.malformed = MalformedResponseInfo{std::move(expectedShape), std::move(received),
                                          std::move(diagnostic)};
    return err;
}

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

} // namespace ankidirect

// fmt library support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template<>
struct fmt::formatter<ankidirect::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) {
        return ctx.begin();
    }

    template<typename FormatContext>
    auto format(ankidirect::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", ankidirect::errorToString(error));
    }
};
