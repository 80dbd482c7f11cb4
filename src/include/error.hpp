#pragma once

#include <string>
#include <vector>
#include <crow.h>

namespace querygate {

// Error categories for classification and HTTP status mapping
enum class ErrorCategory {
    Configuration,     // Config file/structure issues
    Validation,        // Parameter validation failures
    Parse,             // Malformed request body
    NotFound,          // No endpoint for method and path
    BadRequest,        // Request shape unusable for the endpoint
    Database,          // Statement execution errors
    AdmissionRejected, // Concurrency capacity exhausted
    NetworkDenied,     // Client address outside the allow-list
    AuthFailed,        // Missing or unknown credential
    Timeout,           // Request deadline elapsed
    Internal           // Internal/programming errors
};

struct FieldError {
    std::string field;
    std::string message;
};

// Error details structure
struct Error {
    ErrorCategory category;
    std::string message;
    std::string details;        // server-side detail, never sent unless exposure is enabled
    int http_status_code;

    // Category specific context
    std::vector<FieldError> field_errors;
    std::string content_type;
    std::string statement_id;
    std::string method;
    std::string path;
    int retry_after_seconds = 0;

    // Factory methods for common error types
    static Error Config(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Configuration, msg, details, 500};
    }

    static Error Validation(std::vector<FieldError> errors) {
        Error error{ErrorCategory::Validation, "Validation failed", "", 400};
        error.field_errors = std::move(errors);
        return error;
    }

    static Error Parse(const std::string& msg, const std::string& content_type) {
        Error error{ErrorCategory::Parse, msg, "", 400};
        error.content_type = content_type;
        return error;
    }

    static Error NotFound(const std::string& method, const std::string& path) {
        Error error{ErrorCategory::NotFound, "No endpoint found for " + method + " " + path, "", 404};
        error.method = method;
        error.path = path;
        return error;
    }

    static Error BadRequest(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::BadRequest, msg, details, 400};
    }

    static Error Database(const std::string& statement_id, const std::string& engine_message) {
        Error error{ErrorCategory::Database, "SQL execution failed", engine_message, 500};
        error.statement_id = statement_id;
        return error;
    }

    static Error AdmissionRejected(int retry_after_seconds) {
        Error error{ErrorCategory::AdmissionRejected, "Server is at capacity, retry later", "", 429};
        error.retry_after_seconds = retry_after_seconds;
        return error;
    }

    static Error NetworkDenied(const std::string& address) {
        return Error{ErrorCategory::NetworkDenied, "Access denied", "Client address not allowed: " + address, 403};
    }

    static Error AuthFailed(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::AuthFailed, msg, details, 401};
    }

    static Error Timeout(long long timeout_ms) {
        return Error{ErrorCategory::Timeout, "Request timed out",
                     "Pipeline exceeded " + std::to_string(timeout_ms) + " ms", 504};
    }

    static Error Internal(const std::string& msg, const std::string& details = "") {
        return Error{ErrorCategory::Internal, msg, details, 500};
    }

    // Convert error to JSON representation (admission layer and health responses)
    crow::json::wvalue toJson() const;

    // Convert error to HTTP response using toJson() as body
    crow::response toHttpResponse() const;

    // Get category name as string
    std::string getCategoryName() const;

    // Single line description for server-side logs
    std::string describe() const;
};

// Expected<T, E> is a sum type that can hold either a success value or an error
// This is the Result type pattern for operations that can fail
template<typename T, typename E = Error>
class Expected {
public:
    // Constructor for value types (T && lvalue ref, excluding E type and Expected itself)
    template<typename U,
             typename std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>,
                                       int> = 0>
    Expected(U&& val) : has_value_(true) {
        new (&value_) T(std::forward<U>(val));
    }

    // Constructor for error types, only enabled when U decays to E
    template<typename U,
             typename std::enable_if_t<std::is_same_v<std::decay_t<U>, E>,
                                       int> = 0>
    Expected(U&& err) : has_value_(false) {
        new (&error_) E(std::forward<U>(err));
    }

    Expected(const Expected&) = delete;
    Expected& operator=(const Expected&) = delete;

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_) {
            new (&value_) T(std::move(other.value_));
        } else {
            new (&error_) E(std::move(other.error_));
        }
    }

    Expected& operator=(Expected&& other) noexcept {
        if (this != &other) {
            this->~Expected();
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&value_) T(std::move(other.value_));
            } else {
                new (&error_) E(std::move(other.error_));
            }
        }
        return *this;
    }

    ~Expected() {
        if (has_value_) {
            value_.~T();
        } else {
            error_.~E();
        }
    }

    bool has_value() const { return has_value_; }
    explicit operator bool() const { return has_value_; }

    T& value() {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected");
        return value_;
    }

    const T& value() const {
        if (!has_value_) throw std::runtime_error("Accessing value of error Expected");
        return value_;
    }

    E& error() {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    const E& error() const {
        if (has_value_) throw std::runtime_error("Accessing error of success Expected");
        return error_;
    }

    T& operator*() { return value(); }
    const T& operator*() const { return value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    union {
        T value_;
        E error_;
    };
    bool has_value_;
};

// Result<T> means Expected<T, Error>
template<typename T>
using Result = Expected<T, Error>;

} // namespace querygate
