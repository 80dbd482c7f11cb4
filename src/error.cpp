#include "error.hpp"

#include <sstream>

namespace querygate {

std::string Error::getCategoryName() const {
    switch (category) {
        case ErrorCategory::Configuration:
            return "Configuration";
        case ErrorCategory::Validation:
            return "Validation";
        case ErrorCategory::Parse:
            return "Parse";
        case ErrorCategory::NotFound:
            return "NotFound";
        case ErrorCategory::BadRequest:
            return "BadRequest";
        case ErrorCategory::Database:
            return "Database";
        case ErrorCategory::AdmissionRejected:
            return "AdmissionRejected";
        case ErrorCategory::NetworkDenied:
            return "NetworkDenied";
        case ErrorCategory::AuthFailed:
            return "AuthFailed";
        case ErrorCategory::Timeout:
            return "Timeout";
        case ErrorCategory::Internal:
            return "Internal";
    }
    return "Unknown";
}

crow::json::wvalue Error::toJson() const {
    crow::json::wvalue error_json;
    error_json["success"] = false;
    error_json["error"] = getCategoryName();
    error_json["message"] = message;
    return error_json;
}

crow::response Error::toHttpResponse() const {
    crow::response res(http_status_code, toJson());
    if (category == ErrorCategory::AdmissionRejected && retry_after_seconds > 0) {
        res.set_header("Retry-After", std::to_string(retry_after_seconds));
    }
    return res;
}

std::string Error::describe() const {
    std::ostringstream oss;
    oss << getCategoryName() << " (" << http_status_code << "): " << message;
    if (!details.empty()) {
        oss << " [" << details << "]";
    }
    if (!statement_id.empty()) {
        oss << " sqlId=" << statement_id;
    }
    if (!content_type.empty()) {
        oss << " contentType=" << content_type;
    }
    for (const auto& field_error : field_errors) {
        oss << " {" << field_error.field << ": " << field_error.message << "}";
    }
    return oss.str();
}

} // namespace querygate
