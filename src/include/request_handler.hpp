#pragma once

#include <crow.h>
#include <map>
#include <memory>
#include <string>

#include "endpoint_definition.hpp"
#include "error.hpp"
#include "gateway_request.hpp"
#include "request_validator.hpp"
#include "response_serializer.hpp"
#include "sql_executor.hpp"

namespace querygate {

/**
 * Runs one resolved request through the pipeline:
 * merge inputs, validate, execute by SQL type, serialize.
 *
 * Every failure is logged with full detail here, before the serializer
 * decides how much of it the client gets to see.
 */
class RequestHandler {
public:
    RequestHandler(std::shared_ptr<SqlExecutor> executor, ResponseSerializer serializer);

    crow::response process(const EndpointDefinition& endpoint, const GatewayRequest& request,
                           const std::map<std::string, std::string>& path_variables) const;

    // Dispatch validated parameters by the endpoint's SQL type
    Result<ExecutionResult> execute(const EndpointDefinition& endpoint, Value params) const;

    crow::response fail(const EndpointDefinition* endpoint, const GatewayRequest& request, const Error& error) const;

    const ResponseSerializer& serializer() const { return serializer_; }

private:
    Result<ExecutionResult> executeSelect(const EndpointDefinition& endpoint, const Value& params) const;
    Result<ExecutionResult> executeInsert(const EndpointDefinition& endpoint, Value& params) const;
    Result<ExecutionResult> executeModification(const EndpointDefinition& endpoint, const Value& params) const;
    Result<ExecutionResult> executeBatch(const EndpointDefinition& endpoint, const Value& params) const;

    std::shared_ptr<SqlExecutor> executor;
    RequestValidator validator;
    ResponseSerializer serializer_;
};

} // namespace querygate
