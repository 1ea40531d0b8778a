#pragma once

#include <string>
#include <optional>

namespace ccdash {

/**
 * @brief Error categories for the usage engine
 */
enum class ErrorCategory {
    NONE,
    INVALID_WINDOW,
    IO_ERROR,
    PARSE_ERROR,
    CACHE_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

inline const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:           return "none";
        case ErrorCategory::INVALID_WINDOW: return "invalid_window";
        case ErrorCategory::IO_ERROR:       return "io_error";
        case ErrorCategory::PARSE_ERROR:    return "parse_error";
        case ErrorCategory::CACHE_ERROR:    return "cache_error";
        case ErrorCategory::CONFIG_ERROR:   return "config_error";
        case ErrorCategory::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown";
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

    /// Carry another result's failure over to this value type.
    template<typename U>
    static Result error_from(const Result<U>& other) {
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

} // namespace ccdash
