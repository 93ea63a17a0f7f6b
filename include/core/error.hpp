#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace privgate {

/**
 * @brief Error categories for the privacy gate
 */
enum class ErrorCategory {
    NONE,
    DETECTOR_UNAVAILABLE,
    INVALID_POLICY,
    OFFSET_INVARIANT_VIOLATION,
    CONFIG_ERROR,
    UPSTREAM_ERROR,
    BLOCKED,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:                       return "none";
        case ErrorCategory::DETECTOR_UNAVAILABLE:       return "detector_unavailable";
        case ErrorCategory::INVALID_POLICY:             return "invalid_policy";
        case ErrorCategory::OFFSET_INVARIANT_VIOLATION: return "offset_invariant_violation";
        case ErrorCategory::CONFIG_ERROR:               return "config_error";
        case ErrorCategory::UPSTREAM_ERROR:             return "upstream_error";
        case ErrorCategory::BLOCKED:                    return "blocked";
        case ErrorCategory::INTERNAL_ERROR:             return "internal_error";
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
 * @brief Raised by collaborator adapters (entity recognizer, HTTP services)
 * when the backing resource cannot answer. Caught at the detector boundary.
 */
class DetectorUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace privgate
