#pragma once

#include <crow.h>
#include <string>

#include "config_manager.hpp"
#include "content_negotiation.hpp"
#include "endpoint_definition.hpp"
#include "error.hpp"
#include "sql_executor.hpp"

namespace querygate {

/**
 * Turns pipeline outcomes into HTTP responses.
 *
 * WRAPPED endpoints get an envelope with success flag and metadata, RAW
 * endpoints get the bare data. Failures on WRAPPED endpoints carry an error
 * document; on RAW endpoints the body stays empty and the error travels in
 * X-Error-* headers. Engine messages, field errors and statement ids only
 * leave the process when expose_details is on.
 */
class ResponseSerializer {
public:
    explicit ResponseSerializer(ErrorHandlingConfig config);

    crow::response success(const EndpointDefinition& endpoint, const ExecutionResult& result,
                           const std::string& accept_header) const;

    crow::response error(ResponseFormat format, const Error& error, const std::string& method,
                         const std::string& path, const std::string& accept_header) const;

    // Body content for each response style, exposed for tests
    static Value wrappedBody(const ExecutionResult& result);
    static Value rawBody(const ExecutionResult& result);
    Value wrappedErrorBody(const Error& error, const std::string& method, const std::string& path) const;

    static int successStatus(const ExecutionResult& result);
    static std::string encode(const Value& body, MediaFormat format);

    // Short label and client-safe message per error category
    static std::string displayName(const Error& error);
    static std::string genericMessage(const Error& error);
    static std::string rawErrorType(const Error& error);

    const ErrorHandlingConfig& config() const { return config_; }

private:
    std::string clientMessage(const Error& error) const;
    static std::string detailedMessage(const Error& error);
    static Value diagnosticTrace(const Error& error);

    ErrorHandlingConfig config_;
};

} // namespace querygate
