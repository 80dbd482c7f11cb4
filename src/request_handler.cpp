#include "request_handler.hpp"
#include "input_merger.hpp"

#include <algorithm>
#include <crow/logging.h>
#include <vector>

namespace querygate {

namespace {

// Key the generated identifier is echoed back under
const char* const kGeneratedIdKey = "id";

} // namespace

RequestHandler::RequestHandler(std::shared_ptr<SqlExecutor> executor, ResponseSerializer serializer)
    : executor(std::move(executor)), serializer_(std::move(serializer))
{}

crow::response RequestHandler::process(const EndpointDefinition& endpoint, const GatewayRequest& request,
                                       const std::map<std::string, std::string>& path_variables) const {
    CROW_LOG_DEBUG << "Handling request [" << request.method << "]: " << request.path
                   << " -> " << endpoint.statementId;

    auto merged = InputMerger::merge(request, path_variables);
    if (!merged) {
        return fail(&endpoint, request, merged.error());
    }

    auto validated = validator.validate(endpoint, *merged);
    if (!validated) {
        return fail(&endpoint, request, validated.error());
    }

    auto result = execute(endpoint, std::move(*validated));
    if (!result) {
        return fail(&endpoint, request, result.error());
    }

    return serializer_.success(endpoint, *result, request.getHeader("Accept"));
}

Result<ExecutionResult> RequestHandler::execute(const EndpointDefinition& endpoint, Value params) const {
    switch (endpoint.sqlType) {
        case SqlType::SELECT:
            return executeSelect(endpoint, params);
        case SqlType::INSERT:
            return executeInsert(endpoint, params);
        case SqlType::UPDATE:
        case SqlType::DELETE:
            return executeModification(endpoint, params);
        case SqlType::BATCH:
            return executeBatch(endpoint, params);
    }
    return Error::Internal("Unhandled SQL type", sqlTypeName(endpoint.sqlType));
}

Result<ExecutionResult> RequestHandler::executeSelect(const EndpointDefinition& endpoint, const Value& params) const {
    auto outcome = executor->execute(endpoint.statementId, params);
    if (!outcome) {
        return std::move(outcome.error());
    }
    CROW_LOG_DEBUG << "SELECT " << endpoint.statementId << " returned " << outcome->rows.size() << " rows";
    return ExecutionResult::forSelect(std::move(outcome->rows));
}

Result<ExecutionResult> RequestHandler::executeInsert(const EndpointDefinition& endpoint, Value& params) const {
    auto outcome = executor->execute(endpoint.statementId, params);
    if (!outcome) {
        return std::move(outcome.error());
    }

    // INSERT ... RETURNING hands the key back as the first column of the first row
    if (outcome->producedRows && !outcome->rows.empty()) {
        const Value& first_row = outcome->rows.front();
        if (first_row.isObject() && first_row.size() > 0) {
            params.set(kGeneratedIdKey, *first_row.find(first_row.keys().front()));
        }
    }

    std::optional<Value> generated_id;
    if (const Value* id = params.find(kGeneratedIdKey); id && !id->isNull()) {
        generated_id = *id;
    }

    CROW_LOG_DEBUG << "INSERT " << endpoint.statementId << " affected " << outcome->affectedRows
                   << " rows, generated id: " << (generated_id ? generated_id->toString() : "none");
    return ExecutionResult::forInsert(outcome->affectedRows, std::move(generated_id));
}

Result<ExecutionResult> RequestHandler::executeModification(const EndpointDefinition& endpoint,
                                                            const Value& params) const {
    auto outcome = executor->execute(endpoint.statementId, params);
    if (!outcome) {
        return std::move(outcome.error());
    }
    CROW_LOG_DEBUG << sqlTypeName(endpoint.sqlType) << " " << endpoint.statementId
                   << " affected " << outcome->affectedRows << " rows";
    return endpoint.sqlType == SqlType::DELETE
        ? ExecutionResult::forDelete(outcome->affectedRows)
        : ExecutionResult::forUpdate(outcome->affectedRows);
}

Result<ExecutionResult> RequestHandler::executeBatch(const EndpointDefinition& endpoint, const Value& params) const {
    if (!endpoint.batch || endpoint.batch->itemKey.empty()) {
        return Error::BadRequest("Batch configuration required for BATCH sql type", endpoint.statementId);
    }

    const std::string& item_key = endpoint.batch->itemKey;
    const Value* items = params.find(item_key);
    if (items == nullptr || items->isNull()) {
        return Error::BadRequest("Batch items not found with key: " + item_key);
    }
    if (!items->isList()) {
        return Error::BadRequest("Batch items must be a list", "Key '" + item_key + "' holds " +
                                 Value::kindName(items->kind()));
    }

    const auto& list = items->asList();
    if (list.empty()) {
        return ExecutionResult::forBatch(0, 0);
    }

    const std::size_t chunk_size = std::max<std::size_t>(1, endpoint.batch->chunkSize);
    CROW_LOG_DEBUG << "Executing BATCH " << endpoint.statementId << " with " << list.size()
                   << " items, chunk size " << chunk_size;

    int64_t total_affected = 0;
    int64_t chunk_count = 0;
    for (std::size_t offset = 0; offset < list.size(); offset += chunk_size) {
        const auto end = std::min(list.size(), offset + chunk_size);
        std::vector<Value> chunk(list.begin() + offset, list.begin() + end);

        auto affected = executor->executeBatchChunk(endpoint.statementId, chunk);
        if (!affected) {
            CROW_LOG_ERROR << "BATCH " << endpoint.statementId << " failed in chunk " << chunk_count + 1
                           << " after " << chunk_count << " committed chunks";
            return std::move(affected.error());
        }
        total_affected += *affected;
        ++chunk_count;
    }

    CROW_LOG_DEBUG << "BATCH completed: " << total_affected << " rows in " << chunk_count << " chunks";
    return ExecutionResult::forBatch(total_affected, chunk_count);
}

crow::response RequestHandler::fail(const EndpointDefinition* endpoint, const GatewayRequest& request,
                                    const Error& error) const {
    if (error.http_status_code >= 500) {
        CROW_LOG_ERROR << "Request " << request.method << " " << request.path << " failed: " << error.describe();
    } else {
        CROW_LOG_WARNING << "Request " << request.method << " " << request.path << " rejected: " << error.describe();
    }

    const auto format = endpoint ? endpoint->responseFormat : ResponseFormat::WRAPPED;
    return serializer_.error(format, error, request.method, request.path, request.getHeader("Accept"));
}

} // namespace querygate
