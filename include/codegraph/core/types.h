#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace codegraph {

using TimePoint = std::chrono::system_clock::time_point;

enum class ErrorCode {
    Success = 0,
    FileNotFound,
    PermissionDenied,
    InvalidArgument,
    InvalidData,
    InvalidState,
    NotFound,
    NotSupported,
    ParseError,
    Timeout,
    DatabaseError,
    /// Graph store used before connect() or after close()
    NotConnected,
    /// Backing database cannot be opened or no connection is available
    ServiceUnavailable,
    InternalError,
};

constexpr const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::PermissionDenied:
            return "Permission denied";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InvalidData:
            return "Invalid data";
        case ErrorCode::InvalidState:
            return "Invalid state";
        case ErrorCode::NotFound:
            return "Not found";
        case ErrorCode::NotSupported:
            return "Not supported";
        case ErrorCode::ParseError:
            return "Parse error";
        case ErrorCode::Timeout:
            return "Timed out";
        case ErrorCode::DatabaseError:
            return "Database error";
        case ErrorCode::NotConnected:
            return "Not connected";
        case ErrorCode::ServiceUnavailable:
            return "Service unavailable";
        case ErrorCode::InternalError:
            return "Internal error";
    }
    return "Unknown error";
}

struct Error {
    ErrorCode code = ErrorCode::Success;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}
};

/**
 * @brief Value or Error. Public APIs of the graph store and the extractor
 * report failures through Result instead of throwing.
 *
 * value() and error() throw std::logic_error when called on the wrong
 * alternative.
 */
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(Error error) : data_(std::move(error)) {}
    Result(ErrorCode code) : data_(Error{code}) {}

    [[nodiscard]] bool has_value() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        check();
        return std::get<0>(data_);
    }
    T& value() & {
        check();
        return std::get<0>(data_);
    }
    T&& value() && {
        check();
        return std::get<0>(std::move(data_));
    }

    const Error& error() const {
        if (has_value())
            throw std::logic_error("Result holds a value");
        return std::get<1>(data_);
    }

private:
    void check() const {
        if (!has_value())
            throw std::logic_error("Result holds an error: " + std::get<1>(data_).message);
    }

    std::variant<T, Error> data_;
};

template <> class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code) : error_(Error{code}) {}

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (error_)
            throw std::logic_error("Result holds an error: " + error_->message);
    }

    const Error& error() const {
        if (!error_)
            throw std::logic_error("Result holds a value");
        return *error_;
    }

private:
    std::optional<Error> error_;
};

} // namespace codegraph
