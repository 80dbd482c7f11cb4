#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "endpoint_definition.hpp"
#include "error.hpp"
#include "value.hpp"

namespace querygate {

/**
 * What a single statement execution produced.
 * Query-producing statements fill rows; row-count statements fill affectedRows.
 */
struct StatementOutcome {
    bool producedRows = false;
    std::vector<Value> rows;
    int64_t affectedRows = 0;
};

/**
 * Outcome of one pipeline execution, shaped per SQL type.
 * Only SELECT results carry rows; message is set only for failures.
 */
struct ExecutionResult {
    SqlType sqlType = SqlType::SELECT;
    bool success = true;
    std::optional<std::vector<Value>> rows;
    int64_t affectedRows = 0;
    std::optional<Value> generatedId;
    int64_t batchCount = 0;
    std::optional<std::string> message;

    static ExecutionResult forSelect(std::vector<Value> rows);
    static ExecutionResult forInsert(int64_t affected, std::optional<Value> generated_id);
    static ExecutionResult forUpdate(int64_t affected);
    static ExecutionResult forDelete(int64_t affected);
    static ExecutionResult forBatch(int64_t affected, int64_t chunks);
    static ExecutionResult forError(SqlType type, std::string message);
};

/**
 * Execution service the pipeline runs statements through.
 *
 * Statements are looked up by id; parameters bind by name from the
 * parameter object. Failures come back as Database errors carrying the
 * statement id and the engine message.
 */
class SqlExecutor {
public:
    virtual ~SqlExecutor() = default;

    virtual Result<StatementOutcome> execute(const std::string& statement_id, const Value& params) = 0;

    // Runs all items as one unit of work and returns the summed affected count
    virtual Result<int64_t> executeBatchChunk(const std::string& statement_id,
                                              const std::vector<Value>& items) = 0;
};

} // namespace querygate
