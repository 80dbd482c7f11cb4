#include "database_manager.hpp"

#include <chrono>
#include <crow/logging.h>
#include <stdexcept>

namespace querygate {

namespace {

// Scalar items of a batch bind to this parameter name
const char* const kBatchItemParameter = "item";

} // namespace

DatabaseManager::DatabaseManager(DuckDBConfig config, SqlLoggingConfig logging,
                                 std::shared_ptr<StatementCatalog> catalog)
    : config(std::move(config)), logging(logging), catalog(std::move(catalog))
{}

DatabaseManager::~DatabaseManager() {
    if (db) {
        duckdb_close(&db);
    }
}

void DatabaseManager::initialize() {
    std::lock_guard<std::mutex> lock(db_mutex);
    if (db) {
        return;
    }

    duckdb_config duck_config;
    createAndInitializeDuckDBConfig(duck_config);

    char* error = nullptr;
    if (duckdb_open_ext(config.db_path.c_str(), &db, duck_config, &error) == DuckDBError) {
        std::string error_message = error ? error : "Unknown error";
        duckdb_free(error);
        duckdb_destroy_config(&duck_config);
        db = nullptr;
        throw std::runtime_error("Failed to open database " + config.db_path + ": " + error_message);
    }
    duckdb_destroy_config(&duck_config);

    logDuckDBVersion();

    if (!config.init_sql.empty()) {
        CROW_LOG_INFO << "Running DuckDB init SQL";
        auto conn = createConnection();
        auto failure = conn.run(config.init_sql);
        if (!failure.empty()) {
            throw std::runtime_error("DuckDB init SQL failed: " + failure);
        }
    }
}

void DatabaseManager::createAndInitializeDuckDBConfig(duckdb_config& duck_config) {
    if (duckdb_create_config(&duck_config) == DuckDBError) {
        throw std::runtime_error("Failed to create DuckDB configuration");
    }

    for (const auto& [key, value] : config.settings) {
        if (duckdb_set_config(duck_config, key.c_str(), value.c_str()) == DuckDBError) {
            duckdb_destroy_config(&duck_config);
            throw std::runtime_error("Failed to set DuckDB configuration: " + key);
        }
    }
}

void DatabaseManager::logDuckDBVersion() {
    CROW_LOG_INFO << "DuckDB library version: " << duckdb_library_version()
                  << ", database: " << config.db_path;
}

DuckDBConnection DatabaseManager::createConnection() {
    if (db == nullptr) {
        throw std::runtime_error("Database not initialized");
    }
    return DuckDBConnection(db);
}

std::optional<StatementDefinition> DatabaseManager::lookup(const std::string& statement_id) const {
    return catalog ? catalog->find(statement_id) : std::nullopt;
}

Result<StatementOutcome> DatabaseManager::execute(const std::string& statement_id, const Value& params) {
    auto statement = lookup(statement_id);
    if (!statement) {
        return Error::Database(statement_id, "Unknown statement id: " + statement_id);
    }

    const auto started = std::chrono::steady_clock::now();
    try {
        auto conn = createConnection();
        DuckDBPreparedStatement prepared(conn.get(), statement->sql);
        if (!prepared.ok()) {
            return Error::Database(statement_id, prepared.error());
        }

        auto bind_error = bindParameters(prepared.get(), params);
        if (!bind_error.empty()) {
            return Error::Database(statement_id, bind_error);
        }

        DuckDBResult result;
        auto state = duckdb_execute_prepared(prepared.get(), result.get());
        result.set_initialized();
        if (state == DuckDBError) {
            return Error::Database(statement_id, result.error());
        }

        auto outcome = collectOutcome(*result.get());
        logExecution(statement_id, &params, std::chrono::steady_clock::now() - started);
        return outcome;
    } catch (const std::exception& e) {
        return Error::Database(statement_id, e.what());
    }
}

Result<int64_t> DatabaseManager::executeBatchChunk(const std::string& statement_id, const std::vector<Value>& items) {
    auto statement = lookup(statement_id);
    if (!statement) {
        return Error::Database(statement_id, "Unknown statement id: " + statement_id);
    }

    const auto started = std::chrono::steady_clock::now();
    try {
        auto conn = createConnection();
        auto failure = conn.run("BEGIN TRANSACTION");
        if (!failure.empty()) {
            return Error::Database(statement_id, failure);
        }

        auto rollback = [&](const std::string& reason) {
            auto rollback_failure = conn.run("ROLLBACK");
            if (!rollback_failure.empty()) {
                CROW_LOG_ERROR << "Rollback of " << statement_id << " chunk failed: " << rollback_failure;
            }
            return Error::Database(statement_id, reason);
        };

        DuckDBPreparedStatement prepared(conn.get(), statement->sql);
        if (!prepared.ok()) {
            return rollback(prepared.error());
        }

        int64_t affected = 0;
        for (const auto& item : items) {
            duckdb_clear_bindings(prepared.get());

            Value bindings = item;
            if (!item.isObject()) {
                bindings = Value::object();
                bindings.set(kBatchItemParameter, item);
            }

            auto bind_error = bindParameters(prepared.get(), bindings);
            if (!bind_error.empty()) {
                return rollback(bind_error);
            }

            DuckDBResult result;
            auto state = duckdb_execute_prepared(prepared.get(), result.get());
            result.set_initialized();
            if (state == DuckDBError) {
                return rollback(result.error());
            }
            affected += collectOutcome(*result.get()).affectedRows;
        }

        failure = conn.run("COMMIT");
        if (!failure.empty()) {
            return rollback(failure);
        }

        logExecution(statement_id, nullptr, std::chrono::steady_clock::now() - started);
        CROW_LOG_DEBUG << "Committed chunk of " << items.size() << " items for " << statement_id
                       << ", " << affected << " rows affected";
        return affected;
    } catch (const std::exception& e) {
        return Error::Database(statement_id, e.what());
    }
}

bool DatabaseManager::ping() {
    try {
        auto conn = createConnection();
        return conn.run("SELECT 1").empty();
    } catch (const std::exception& e) {
        CROW_LOG_WARNING << "Database ping failed: " << e.what();
        return false;
    }
}

std::string DatabaseManager::bindParameters(duckdb_prepared_statement stmt, const Value& params) {
    const idx_t count = duckdb_nparams(stmt);
    for (idx_t index = 1; index <= count; ++index) {
        DuckDBString name(duckdb_parameter_name(stmt, index));
        const Value* value = name.is_null() ? nullptr : params.find(name.to_string());

        if (bindValue(stmt, index, value) == DuckDBError) {
            return "Failed to bind parameter $" + name.to_string();
        }
    }
    return "";
}

duckdb_state DatabaseManager::bindValue(duckdb_prepared_statement stmt, idx_t index, const Value* value) {
    if (!value) {
        return duckdb_bind_null(stmt, index);
    }
    switch (value->kind()) {
        case Value::Kind::Null:
            return duckdb_bind_null(stmt, index);
        case Value::Kind::Boolean:
            return duckdb_bind_boolean(stmt, index, value->asBool());
        case Value::Kind::Integer:
            return duckdb_bind_int64(stmt, index, value->asInt());
        case Value::Kind::Double:
            return duckdb_bind_double(stmt, index, value->asDouble());
        case Value::Kind::String:
            return duckdb_bind_varchar(stmt, index, value->asString().c_str());
        case Value::Kind::List:
        case Value::Kind::Object:
            return duckdb_bind_varchar(stmt, index, value->dump().c_str());
    }
    return duckdb_bind_null(stmt, index);
}

StatementOutcome DatabaseManager::collectOutcome(duckdb_result& result) {
    StatementOutcome outcome;

    if (duckdb_result_return_type(result) != DUCKDB_RESULT_TYPE_QUERY_RESULT) {
        outcome.affectedRows = static_cast<int64_t>(duckdb_rows_changed(&result));
        return outcome;
    }

    outcome.producedRows = true;
    const idx_t column_count = duckdb_column_count(&result);
    const idx_t row_count = duckdb_row_count(&result);

    for (idx_t row = 0; row < row_count; row++) {
        Value record = Value::object();
        for (idx_t col = 0; col < column_count; col++) {
            record.set(duckdb_column_name(&result, col), cellToValue(result, col, row));
        }
        outcome.rows.push_back(std::move(record));
    }
    outcome.affectedRows = static_cast<int64_t>(row_count);
    return outcome;
}

Value DatabaseManager::cellToValue(duckdb_result& result, idx_t col, idx_t row) {
    if (duckdb_value_is_null(&result, col, row)) {
        return Value();
    }

    switch (duckdb_column_type(&result, col)) {
        case DUCKDB_TYPE_BOOLEAN:
            return Value(duckdb_value_boolean(&result, col, row));
        case DUCKDB_TYPE_TINYINT:
        case DUCKDB_TYPE_SMALLINT:
        case DUCKDB_TYPE_INTEGER:
        case DUCKDB_TYPE_BIGINT:
        case DUCKDB_TYPE_UTINYINT:
        case DUCKDB_TYPE_USMALLINT:
        case DUCKDB_TYPE_UINTEGER:
            return Value(static_cast<int64_t>(duckdb_value_int64(&result, col, row)));
        case DUCKDB_TYPE_FLOAT:
        case DUCKDB_TYPE_DOUBLE:
        case DUCKDB_TYPE_DECIMAL:
            return Value(duckdb_value_double(&result, col, row));
        default: {
            // Dates, timestamps, UUIDs, HUGEINT and nested types render as text
            DuckDBString text(duckdb_value_varchar(&result, col, row));
            return Value(text.to_string());
        }
    }
}

void DatabaseManager::logExecution(const std::string& statement_id, const Value* params,
                                   std::chrono::steady_clock::duration elapsed) const {
    if (!logging.enabled) {
        return;
    }

    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
    std::string parameters;
    if (logging.log_parameters && params) {
        parameters = " params=" + params->dump();
    }

    if (elapsed_ms >= logging.slow_query_threshold) {
        CROW_LOG_WARNING << "Slow statement " << statement_id << " took " << elapsed_ms.count() << " ms" << parameters;
    } else {
        CROW_LOG_DEBUG << "Executed " << statement_id << " in " << elapsed_ms.count() << " ms" << parameters;
    }
}

} // namespace querygate
