#pragma once

#include <string>
#include <optional>

namespace redactor {

/**
 * @brief Error categories reported by the redaction pipeline
 */
enum class ErrorCategory {
    NONE,
    INPUT_TOO_LARGE,        // Input exceeds the configured size ceiling
    BINARY_UNSUPPORTED,     // Input contains a null byte
    INVALID_PATH,           // Missing, unreadable or non-regular file
    INTEGRITY_ERROR,        // Manifest built against stale content
    MANIFEST_MISMATCH,      // Patch-time hash mismatch or no record for file
    UNLOCATABLE_REDACTION,  // Manifest entry cannot be replayed
    INVALID_MANIFEST,       // Manifest missing or malformed
    IO_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::INPUT_TOO_LARGE: return "INPUT_TOO_LARGE";
        case ErrorCategory::BINARY_UNSUPPORTED: return "BINARY_UNSUPPORTED";
        case ErrorCategory::INVALID_PATH: return "INVALID_PATH";
        case ErrorCategory::INTEGRITY_ERROR: return "INTEGRITY_ERROR";
        case ErrorCategory::MANIFEST_MISMATCH: return "MANIFEST_MISMATCH";
        case ErrorCategory::UNLOCATABLE_REDACTION: return "UNLOCATABLE_REDACTION";
        case ErrorCategory::INVALID_MANIFEST: return "INVALID_MANIFEST";
        case ErrorCategory::IO_ERROR: return "IO_ERROR";
        default: return "UNKNOWN";
    }
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

    /// Re-wrap the failure of a Result with a different value type
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

} // namespace redactor
