#include "response_serializer.hpp"
#include "string_utils.hpp"
#include "xml_codec.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <vector>

namespace querygate {

ResponseSerializer::ResponseSerializer(ErrorHandlingConfig config)
    : config_(config)
{}

crow::response ResponseSerializer::success(const EndpointDefinition& endpoint, const ExecutionResult& result,
                                           const std::string& accept_header) const {
    const auto format = negotiateMediaFormat(accept_header);
    const Value body = endpoint.responseFormat == ResponseFormat::RAW ? rawBody(result) : wrappedBody(result);

    crow::response res(successStatus(result));
    res.set_header("Content-Type", contentTypeFor(format));
    res.body = encode(body, format);
    return res;
}

int ResponseSerializer::successStatus(const ExecutionResult& result) {
    if (!result.success) {
        return 500;
    }
    switch (result.sqlType) {
        case SqlType::INSERT:
            return 201;
        case SqlType::UPDATE:
        case SqlType::DELETE:
            return result.affectedRows > 0 ? 200 : 404;
        case SqlType::SELECT:
        case SqlType::BATCH:
            return 200;
    }
    return 200;
}

Value ResponseSerializer::wrappedBody(const ExecutionResult& result) {
    Value body = Value::object();
    body.set("success", result.success);
    body.set("sqlType", sqlTypeName(result.sqlType));

    if (result.rows) {
        body.set("data", Value::list(*result.rows));
        body.set("count", static_cast<int64_t>(result.rows->size()));
    }
    if (result.sqlType != SqlType::SELECT) {
        body.set("affectedRows", result.affectedRows);
    }
    if (result.generatedId) {
        body.set("generatedId", *result.generatedId);
    }
    if (result.batchCount > 0) {
        body.set("batchCount", result.batchCount);
    }
    if (result.message) {
        body.set("message", *result.message);
    }
    return body;
}

Value ResponseSerializer::rawBody(const ExecutionResult& result) {
    Value body = Value::object();
    switch (result.sqlType) {
        case SqlType::SELECT:
            return Value::list(result.rows ? *result.rows : Value::List{});
        case SqlType::INSERT:
            body.set("affectedRows", result.affectedRows);
            body.set("generatedId", result.generatedId ? *result.generatedId : Value(""));
            return body;
        case SqlType::UPDATE:
        case SqlType::DELETE:
            body.set("affectedRows", result.affectedRows);
            return body;
        case SqlType::BATCH:
            body.set("affectedRows", result.affectedRows);
            body.set("batchCount", result.batchCount);
            return body;
    }
    return body;
}

std::string ResponseSerializer::encode(const Value& body, MediaFormat format) {
    switch (format) {
        case MediaFormat::XML:
            return XmlCodec::write(body);
        case MediaFormat::JSON:
            return body.dump();
    }
    return body.dump();
}

crow::response ResponseSerializer::error(ResponseFormat format, const Error& error, const std::string& method,
                                         const std::string& path, const std::string& accept_header) const {
    crow::response res(error.http_status_code);
    if (error.category == ErrorCategory::AdmissionRejected && error.retry_after_seconds > 0) {
        res.set_header("Retry-After", std::to_string(error.retry_after_seconds));
    }

    if (format == ResponseFormat::RAW) {
        res.set_header("X-Error-Type", rawErrorType(error));
        if (!config_.expose_details) {
            res.set_header("X-Error-Message", genericMessage(error));
            return res;
        }

        res.set_header("X-Error-Message", sanitizeHeaderValue(detailedMessage(error)));
        if (!error.field_errors.empty()) {
            std::vector<std::string> messages;
            for (const auto& field_error : error.field_errors) {
                messages.push_back(field_error.message);
            }
            res.set_header("X-Error-Details", sanitizeHeaderValue(fmt::format("{}", fmt::join(messages, "; "))));
        }
        if (!error.content_type.empty()) {
            res.set_header("X-Error-ContentType", sanitizeHeaderValue(error.content_type));
        }
        if (!error.statement_id.empty()) {
            res.set_header("X-Error-SqlId", sanitizeHeaderValue(error.statement_id));
        }
        return res;
    }

    const auto media = negotiateMediaFormat(accept_header);
    res.set_header("Content-Type", contentTypeFor(media));
    res.body = encode(wrappedErrorBody(error, method, path), media);
    return res;
}

Value ResponseSerializer::wrappedErrorBody(const Error& error, const std::string& method,
                                           const std::string& path) const {
    Value body = Value::object();
    body.set("success", false);
    body.set("path", path);
    body.set("method", method);
    body.set("error", displayName(error));
    body.set("message", clientMessage(error));

    if (config_.expose_details) {
        if (!error.field_errors.empty()) {
            Value details = Value::list();
            for (const auto& field_error : error.field_errors) {
                details.push_back(Value(field_error.message));
            }
            body.set("details", std::move(details));
        }
        if (!error.content_type.empty()) {
            body.set("contentType", error.content_type);
        }
        if (!error.statement_id.empty()) {
            body.set("sqlId", error.statement_id);
        }
    }
    if (config_.expose_stack_trace) {
        body.set("stackTrace", diagnosticTrace(error));
    }
    return body;
}

std::string ResponseSerializer::clientMessage(const Error& error) const {
    return config_.expose_details ? detailedMessage(error) : genericMessage(error);
}

std::string ResponseSerializer::detailedMessage(const Error& error) {
    if (error.details.empty()) {
        return error.message;
    }
    return error.message + ": " + error.details;
}

Value ResponseSerializer::diagnosticTrace(const Error& error) {
    Value trace = Value::list();
    trace.push_back(Value(error.describe()));
    if (!error.method.empty() || !error.path.empty()) {
        trace.push_back(Value("at route " + error.method + " " + error.path));
    }
    if (!error.statement_id.empty()) {
        trace.push_back(Value("at statement " + error.statement_id));
    }
    for (const auto& field_error : error.field_errors) {
        trace.push_back(Value("at parameter " + field_error.field));
    }
    return trace;
}

std::string ResponseSerializer::displayName(const Error& error) {
    switch (error.category) {
        case ErrorCategory::Validation:
            return "Validation Error";
        case ErrorCategory::Parse:
            return "Request Body Parse Error";
        case ErrorCategory::NotFound:
            return "Endpoint Not Found";
        case ErrorCategory::BadRequest:
            return "Bad Request";
        case ErrorCategory::Database:
            return "Database Error";
        case ErrorCategory::AdmissionRejected:
            return "Too Many Requests";
        case ErrorCategory::NetworkDenied:
            return "Forbidden";
        case ErrorCategory::AuthFailed:
            return "Unauthorized";
        case ErrorCategory::Timeout:
            return "Request Timeout";
        case ErrorCategory::Configuration:
        case ErrorCategory::Internal:
            return "Internal Server Error";
    }
    return "Internal Server Error";
}

std::string ResponseSerializer::genericMessage(const Error& error) {
    switch (error.category) {
        case ErrorCategory::Validation:
            return "Request validation failed";
        case ErrorCategory::Parse:
            return "Invalid request format";
        case ErrorCategory::NotFound:
            return "The requested endpoint does not exist";
        case ErrorCategory::BadRequest:
            return "Invalid request parameters";
        case ErrorCategory::Database:
            return "A database error occurred";
        case ErrorCategory::AdmissionRejected:
            return "Server is at capacity, retry later";
        case ErrorCategory::NetworkDenied:
            return "Access denied";
        case ErrorCategory::AuthFailed:
            return "Authentication required";
        case ErrorCategory::Timeout:
            return "Request processing took too long";
        case ErrorCategory::Configuration:
        case ErrorCategory::Internal:
            return "An unexpected error occurred";
    }
    return "An unexpected error occurred";
}

std::string ResponseSerializer::rawErrorType(const Error& error) {
    switch (error.category) {
        case ErrorCategory::Validation:
            return "ValidationError";
        case ErrorCategory::Parse:
            return "ParseError";
        case ErrorCategory::NotFound:
            return "NotFound";
        case ErrorCategory::BadRequest:
            return "BadRequest";
        case ErrorCategory::Database:
            return "DatabaseError";
        case ErrorCategory::AdmissionRejected:
            return "TooManyRequests";
        case ErrorCategory::NetworkDenied:
            return "Forbidden";
        case ErrorCategory::AuthFailed:
            return "Unauthorized";
        case ErrorCategory::Timeout:
            return "Timeout";
        case ErrorCategory::Configuration:
        case ErrorCategory::Internal:
            return "InternalError";
    }
    return "InternalError";
}

} // namespace querygate
