#include "sql_executor.hpp"

namespace querygate {

ExecutionResult ExecutionResult::forSelect(std::vector<Value> rows) {
    ExecutionResult result;
    result.sqlType = SqlType::SELECT;
    result.affectedRows = static_cast<int64_t>(rows.size());
    result.rows = std::move(rows);
    return result;
}

ExecutionResult ExecutionResult::forInsert(int64_t affected, std::optional<Value> generated_id) {
    ExecutionResult result;
    result.sqlType = SqlType::INSERT;
    result.affectedRows = affected;
    result.generatedId = std::move(generated_id);
    return result;
}

ExecutionResult ExecutionResult::forUpdate(int64_t affected) {
    ExecutionResult result;
    result.sqlType = SqlType::UPDATE;
    result.affectedRows = affected;
    return result;
}

ExecutionResult ExecutionResult::forDelete(int64_t affected) {
    ExecutionResult result;
    result.sqlType = SqlType::DELETE;
    result.affectedRows = affected;
    return result;
}

ExecutionResult ExecutionResult::forBatch(int64_t affected, int64_t chunks) {
    ExecutionResult result;
    result.sqlType = SqlType::BATCH;
    result.affectedRows = affected;
    result.batchCount = chunks;
    return result;
}

ExecutionResult ExecutionResult::forError(SqlType type, std::string message) {
    ExecutionResult result;
    result.sqlType = type;
    result.success = false;
    result.message = std::move(message);
    return result;
}

} // namespace querygate
