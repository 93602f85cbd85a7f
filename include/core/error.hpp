#pragma once

#include <string>
#include <optional>

namespace cypherbridge {

/**
 * @brief Error categories for bridge execution
 */
enum class ErrorCategory {
    NONE,
    SCHEMA_MISMATCH,
    EXECUTION_ERROR,
    CONNECTION_ERROR,
    CONFIG_ERROR,
    IO_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:             return "NONE";
        case ErrorCategory::SCHEMA_MISMATCH:  return "SCHEMA_MISMATCH";
        case ErrorCategory::EXECUTION_ERROR:  return "EXECUTION_ERROR";
        case ErrorCategory::CONNECTION_ERROR: return "CONNECTION_ERROR";
        case ErrorCategory::CONFIG_ERROR:     return "CONFIG_ERROR";
        case ErrorCategory::IO_ERROR:         return "IO_ERROR";
        case ErrorCategory::INTERNAL_ERROR:   return "INTERNAL_ERROR";
        default:                              return "UNKNOWN";
    }
}

/**
 * @brief Result type for operations that can fail
 *
 * Exactly one of value or (category, message) is set.
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

} // namespace cypherbridge
