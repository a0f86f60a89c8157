#pragma once

#include <optional>
#include <string>
#include <utility>

namespace piishield {

/**
 * @brief Error categories surfaced to callers
 *
 * Stable set; the calling layer maps these onto its own transport
 * (HTTP status codes and the like).
 */
enum class ErrorCategory {
    NONE,
    EMPTY_INPUT,
    INVALID_RANGE,          // Span outside text bounds (internal invariant violation)
    DETECTOR_ERROR,
    VAULT_ERROR,
    SESSION_NOT_FOUND,
    NOT_FOUND,
    MAPPING_EXPIRED,
    ACCESS_DENIED,          // Session belongs to another owner
    PLACEHOLDER_ERROR,
    CONFIG_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:              return "NONE";
        case ErrorCategory::EMPTY_INPUT:       return "EMPTY_INPUT";
        case ErrorCategory::INVALID_RANGE:     return "INVALID_RANGE";
        case ErrorCategory::DETECTOR_ERROR:    return "DETECTOR_ERROR";
        case ErrorCategory::VAULT_ERROR:       return "VAULT_ERROR";
        case ErrorCategory::SESSION_NOT_FOUND: return "SESSION_NOT_FOUND";
        case ErrorCategory::NOT_FOUND:         return "NOT_FOUND";
        case ErrorCategory::MAPPING_EXPIRED:   return "MAPPING_EXPIRED";
        case ErrorCategory::ACCESS_DENIED:     return "ACCESS_DENIED";
        case ErrorCategory::PLACEHOLDER_ERROR: return "PLACEHOLDER_ERROR";
        case ErrorCategory::CONFIG_ERROR:      return "CONFIG_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    /// Re-wrap another result's error (for propagation across value types)
    template<typename U>
    static Result propagate(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Result for operations with no value on success
 */
template<>
class Result<void> {
public:
    static Result ok() {
        Result r;
        r.success_ = true;
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    template<typename U>
    static Result propagate(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

using Status = Result<void>;

} // namespace piishield
