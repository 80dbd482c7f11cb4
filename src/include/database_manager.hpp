#pragma once

#include <chrono>
#include <duckdb.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config_manager.hpp"
#include "duckdb_raii.hpp"
#include "sql_executor.hpp"
#include "statement_catalog.hpp"

namespace querygate {

/**
 * SqlExecutor over an embedded DuckDB database.
 *
 * Statements come from the catalog and use DuckDB named parameters ($name),
 * bound by name from the parameter object. Each call opens its own
 * connection, so calls from different workers do not contend.
 */
class DatabaseManager : public SqlExecutor {
public:
    DatabaseManager(DuckDBConfig config, SqlLoggingConfig logging, std::shared_ptr<StatementCatalog> catalog);
    ~DatabaseManager() override;

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    // Opens the database and runs the init SQL; throws std::runtime_error on failure
    void initialize();
    bool isInitialized() const { return db != nullptr; }

    Result<StatementOutcome> execute(const std::string& statement_id, const Value& params) override;
    Result<int64_t> executeBatchChunk(const std::string& statement_id, const std::vector<Value>& items) override;

    // SELECT 1 liveness query behind /health
    bool ping();

    std::shared_ptr<StatementCatalog> getCatalog() const { return catalog; }

private:
    DuckDBConnection createConnection();

    std::optional<StatementDefinition> lookup(const std::string& statement_id) const;

    static std::string bindParameters(duckdb_prepared_statement stmt, const Value& params);
    static duckdb_state bindValue(duckdb_prepared_statement stmt, idx_t index, const Value* value);
    static StatementOutcome collectOutcome(duckdb_result& result);
    static Value cellToValue(duckdb_result& result, idx_t col, idx_t row);

    void logExecution(const std::string& statement_id, const Value* params,
                      std::chrono::steady_clock::duration elapsed) const;

    void createAndInitializeDuckDBConfig(duckdb_config& config);
    void logDuckDBVersion();

    DuckDBConfig config;
    SqlLoggingConfig logging;
    std::shared_ptr<StatementCatalog> catalog;

    duckdb_database db = nullptr;
    std::mutex db_mutex;
};

} // namespace querygate
