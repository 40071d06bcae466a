#pragma once

#include <string>
#include <variant>
#include <stdexcept>

namespace vortex_l0 {

/**
 * @brief Failure categories for outbound calls and parsing
 */
enum class ErrorType {
    None,
    NetworkError,     ///< Transport failed (DNS, connect, TLS, reset)
    HttpError,        ///< Server answered with a non-2xx status
    ParseError,       ///< Body was not the JSON we expected
    InvalidArgument,
    Timeout,          ///< Deadline elapsed before a response arrived
    Cancelled,        ///< Caller cancelled the token
    Unknown
};

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;
    int http_status = 0;  ///< Set for HttpError only

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }
};

/**
 * @brief Holds either a value of type T or an Error.
 *
 * Used on the external-service path so that failures travel as values
 * and never cross the plugin boundary as exceptions.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Throws if error
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Throws if success
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_timeout_error(const std::string& message = "Request timed out") {
    return Error(ErrorType::Timeout, message);
}

inline Error make_cancelled_error(const std::string& message = "Request cancelled") {
    return Error(ErrorType::Cancelled, message);
}

inline Error make_http_error(int status, const std::string& body) {
    Error e(ErrorType::HttpError, "API error (" + std::to_string(status) + "): " + body);
    e.http_status = status;
    return e;
}

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None:            return "none";
        case ErrorType::NetworkError:    return "network";
        case ErrorType::HttpError:       return "http";
        case ErrorType::ParseError:      return "parse";
        case ErrorType::InvalidArgument: return "invalid_argument";
        case ErrorType::Timeout:         return "timeout";
        case ErrorType::Cancelled:       return "cancelled";
        default:                         return "unknown";
    }
}

} // namespace vortex_l0
