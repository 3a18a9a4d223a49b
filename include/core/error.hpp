#pragma once

#include <optional>
#include <string>

namespace ingestgate {

/**
 * @brief Error categories for stream lifecycle and ingestion
 */
enum class ErrorCategory {
    NONE,
    NOT_FOUND,                // No stream cached for the destination key
    CREATION_ERROR,           // Provider failed to produce a stream
    SCHEMA_RESOLUTION_ERROR,  // Descriptor/schema unusable (a creation error variant)
    CLOSE_ERROR,              // Close failed (logged, never propagated by the registry)
    SUBMIT_ERROR,             // Stream rejected a record
    FLUSH_ERROR,
    INVALID_RECORD,           // Record failed schema validation
    BACKPRESSURE,             // In-flight ceiling reached in reject mode
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "none";
        case ErrorCategory::NOT_FOUND: return "not_found";
        case ErrorCategory::CREATION_ERROR: return "creation_error";
        case ErrorCategory::SCHEMA_RESOLUTION_ERROR: return "schema_resolution_error";
        case ErrorCategory::CLOSE_ERROR: return "close_error";
        case ErrorCategory::SUBMIT_ERROR: return "submit_error";
        case ErrorCategory::FLUSH_ERROR: return "flush_error";
        case ErrorCategory::INVALID_RECORD: return "invalid_record";
        case ErrorCategory::BACKPRESSURE: return "backpressure";
        case ErrorCategory::INTERNAL_ERROR: return "internal_error";
    }
    return "unknown";
}

/// True for categories that mean "no stream could be produced".
inline bool is_creation_error(ErrorCategory category) {
    return category == ErrorCategory::CREATION_ERROR ||
           category == ErrorCategory::SCHEMA_RESOLUTION_ERROR;
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
 * @brief Value-less Result for operations with only a success/failure outcome
 */
class Status {
public:
    static Status ok() {
        return Status{};
    }

    static Status error(ErrorCategory category, std::string message) {
        Status s;
        s.error_category_ = category;
        s.error_message_ = std::move(message);
        return s;
    }

    bool is_ok() const { return error_category_ == ErrorCategory::NONE; }
    bool is_error() const { return !is_ok(); }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace ingestgate
