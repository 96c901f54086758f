// include/riskdesk/core/error.hpp

#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace riskdesk {

/**
 * @brief Error codes used across the engine
 * The first group is visible to callers of the engine, the rest are internal
 * and get translated or degraded before they reach a caller
 */
enum class ErrorCode {
    NONE = 0,
    UNKNOWN_ERROR = 1,

    // Caller-visible taxonomy
    VALIDATION_ERROR = 2,   // Bad symbol, range or allocation. Never retried
    NOT_FOUND = 3,          // Symbol unknown to every provider. Never retried
    TRANSIENT_ERROR = 4,    // Network, 5xx, timeout, malformed payload
    RATE_LIMITED = 5,       // Provider quota exhausted
    TIMEOUT_ERROR = 6,      // Caller stopped waiting on a shared fetch
    CANCELLED = 7,          // Caller abandoned the request
    INSUFFICIENT_DATA = 8,  // Too few observations for a statistic

    // Storage errors
    DATABASE_ERROR = 9,
    CONNECTION_ERROR = 10,
    NOT_INITIALIZED = 11,

    // Data and parsing errors
    INVALID_DATA = 12,
    CONVERSION_ERROR = 13,
    JSON_PARSE_ERROR = 14,

    // File and I/O errors
    FILE_NOT_FOUND = 15,
    FILE_IO_ERROR = 16,

    // Custom error range
    CUSTOM_ERROR_START = 1000
};

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::VALIDATION_ERROR:
            return "VALIDATION_ERROR";
        case ErrorCode::NOT_FOUND:
            return "NOT_FOUND";
        case ErrorCode::TRANSIENT_ERROR:
            return "TRANSIENT_ERROR";
        case ErrorCode::RATE_LIMITED:
            return "RATE_LIMITED";
        case ErrorCode::TIMEOUT_ERROR:
            return "TIMEOUT_ERROR";
        case ErrorCode::CANCELLED:
            return "CANCELLED";
        case ErrorCode::INSUFFICIENT_DATA:
            return "INSUFFICIENT_DATA";
        case ErrorCode::DATABASE_ERROR:
            return "DATABASE_ERROR";
        case ErrorCode::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case ErrorCode::NOT_INITIALIZED:
            return "NOT_INITIALIZED";
        case ErrorCode::INVALID_DATA:
            return "INVALID_DATA";
        case ErrorCode::CONVERSION_ERROR:
            return "CONVERSION_ERROR";
        case ErrorCode::JSON_PARSE_ERROR:
            return "JSON_PARSE_ERROR";
        case ErrorCode::FILE_NOT_FOUND:
            return "FILE_NOT_FOUND";
        case ErrorCode::FILE_IO_ERROR:
            return "FILE_IO_ERROR";
        default:
            return "UNKNOWN_ERROR";
    }
}

/**
 * @brief Exception type carried by failed Results
 */
class RiskDeskError : public std::runtime_error {
public:
    /**
     * @brief Constructor for RiskDeskError
     * @param code The error code
     * @param message Detailed error message
     * @param component Component where error occurred
     */
    RiskDeskError(ErrorCode code, const std::string& message, const std::string& component = "")
        : std::runtime_error(message), code_(code), component_(component) {}

    virtual ~RiskDeskError() = default;

    /**
     * @brief Copy preserving the dynamic type
     */
    virtual std::unique_ptr<RiskDeskError> clone() const {
        return std::make_unique<RiskDeskError>(*this);
    }

    /**
     * @brief Get the error code
     * @return ErrorCode representing the type of error
     */
    ErrorCode code() const noexcept {
        return code_;
    }

    /**
     * @brief Get the component where error occurred
     * @return String identifying the component
     */
    const std::string& component() const noexcept {
        return component_;
    }

    /**
     * @brief Convert error to string representation
     * @return Formatted error string
     */
    std::string to_string() const {
        return "Error in " + component_ + ": " + what() + " (" + error_code_to_string(code_) +
               ")";
    }

private:
    ErrorCode code_;
    std::string component_;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The type of the successful result
 */
template <typename T>
class Result {
public:
    /**
     * @brief Constructor for success case
     * @param value The successful result
     * @tparam U The type of the successful result
     */
    template <typename U = T>
    Result(U&& value) : value_(std::forward<U>(value)), error_(nullptr) {}

    /**
     * @brief Constructor for error case
     * @param error The error that occurred
     */
    Result(std::unique_ptr<RiskDeskError> error) : error_(std::move(error)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_(std::move(other.error_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_ = std::move(other.error_);
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool is_ok() const {
        return error_ == nullptr;
    }

    bool is_error() const {
        return error_ != nullptr;
    }

    /**
     * @brief Get the success value
     * @return Reference to the contained value
     * @throws RiskDeskError if result represents an error
     */
    const T& value() const {
        if (error_)
            throw *error_;
        return value_;
    }

    /**
     * @brief Get the error if present
     * @return Pointer to the error, or nullptr if success
     */
    const RiskDeskError* error() const {
        return error_.get();
    }

private:
    T value_;
    std::unique_ptr<RiskDeskError> error_;
};

// Specialization for void
template <>
class Result<void> {
public:
    Result() : error_(nullptr) {}
    Result(std::unique_ptr<RiskDeskError> error) : error_(std::move(error)) {}

    bool is_ok() const {
        return error_ == nullptr;
    }
    bool is_error() const {
        return error_ != nullptr;
    }

    void value() const {
        if (error_)
            throw *error_;
    }

    const RiskDeskError* error() const {
        return error_.get();
    }

private:
    std::unique_ptr<RiskDeskError> error_;
};

/**
 * @brief Helper for creating error results
 * @tparam T The type of the successful result
 * @param code The error code
 * @param message The error message
 * @param component The component where error occurred
 * @return Result representing the error
 */
template <typename T>
Result<T> make_error(ErrorCode code, const std::string& message,
                     const std::string& component = "") {
    return Result<T>(std::make_unique<RiskDeskError>(code, message, component));
}

/**
 * @brief Re-wrap the error of one Result into a Result of another type
 * @param component Replaces the original component when given. Without it the
 *        error is copied as is, derived error types included
 */
template <typename T, typename U>
Result<T> forward_error(const Result<U>& failed, const std::string& component = "") {
    const RiskDeskError* err = failed.error();
    if (component.empty()) {
        return Result<T>(err->clone());
    }
    return make_error<T>(err->code(), err->what(), component);
}

}  // namespace riskdesk
