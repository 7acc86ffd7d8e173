#pragma once

#include <string>
#include <optional>

namespace clipstash {

/**
 * @brief Error categories for the capture pipeline and query surface
 */
enum class ErrorCategory {
    NONE,
    CAPTURE_ERROR,             // Clipboard source unreadable (transient, retried next tick)
    CLASSIFICATION_DEGRADED,   // Recognized payload type with malformed content
    STORAGE_IO_ERROR,          // Database or artifact filesystem failure
    INTEGRITY_VIOLATION,       // Image row whose artifact is missing on disk
    NOT_FOUND,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                    return "none";
        case ErrorCategory::CAPTURE_ERROR:           return "capture_error";
        case ErrorCategory::CLASSIFICATION_DEGRADED: return "classification_degraded";
        case ErrorCategory::STORAGE_IO_ERROR:        return "storage_io_error";
        case ErrorCategory::INTEGRITY_VIOLATION:     return "integrity_violation";
        case ErrorCategory::NOT_FOUND:               return "not_found";
        case ErrorCategory::CONFIG_ERROR:            return "config_error";
        case ErrorCategory::INTERNAL_ERROR:          return "internal_error";
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

    // Re-wrap another Result's error under this value type
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

/**
 * @brief Result for operations with no value
 */
struct Done {};
using Status = Result<Done>;

inline Status ok_status() { return Status::ok(Done{}); }

} // namespace clipstash
