#pragma once

#include <duckdb.h>
#include <stdexcept>
#include <string>
#include <utility>

namespace querygate {

/**
 * Owns a string allocated by DuckDB, such as a parameter name.
 * Frees it with duckdb_free() when going out of scope.
 * Move-only.
 */
class DuckDBString {
public:
    /**
     * Takes ownership of a DuckDB-allocated pointer, which may be null.
     */
    explicit DuckDBString(const char* ptr) noexcept : ptr_(const_cast<char*>(ptr)) {}

    /**
     * Frees the pointer if one is held.
     */
    ~DuckDBString() { reset(); }

    DuckDBString(const DuckDBString&) = delete;
    DuckDBString& operator=(const DuckDBString&) = delete;

    /**
     * Transfers ownership; the source is left empty.
     */
    DuckDBString(DuckDBString&& other) noexcept : ptr_(std::exchange(other.ptr_, nullptr)) {}

    /**
     * Frees the current pointer, then takes over the other one.
     */
    DuckDBString& operator=(DuckDBString&& other) noexcept {
        if (this != &other) {
            reset();
            ptr_ = std::exchange(other.ptr_, nullptr);
        }
        return *this;
    }

    /**
     * Raw pointer, still owned by this object.
     */
    const char* get() const noexcept { return ptr_; }

    /**
     * Copy of the string, empty when the pointer is null.
     */
    std::string to_string() const { return ptr_ ? std::string(ptr_) : ""; }

    /**
     * True when DuckDB handed back no string.
     */
    bool is_null() const noexcept { return ptr_ == nullptr; }

private:
    void reset() noexcept {
        if (ptr_) {
            duckdb_free(ptr_);
            ptr_ = nullptr;
        }
    }

    char* ptr_;
};

/**
 * Owns a duckdb_result. DuckDB requires the result to be destroyed even when
 * the query failed, so callers mark it initialized right after any call that
 * fills it.
 */
class DuckDBResult {
public:
    /**
     * Creates an empty result that owns nothing yet.
     */
    DuckDBResult() noexcept : has_result_(false) {}

    /**
     * Destroys the result if it was initialized.
     */
    ~DuckDBResult() { reset(); }

    DuckDBResult(const DuckDBResult&) = delete;
    DuckDBResult& operator=(const DuckDBResult&) = delete;

    DuckDBResult(DuckDBResult&& other) noexcept : result_(other.result_), has_result_(other.has_result_) {
        other.has_result_ = false;
    }
    DuckDBResult& operator=(DuckDBResult&& other) noexcept {
        if (this != &other) {
            reset();
            result_ = other.result_;
            has_result_ = std::exchange(other.has_result_, false);
        }
        return *this;
    }

    /**
     * Pointer to pass to duckdb_query() or duckdb_execute_prepared().
     */
    duckdb_result* get() noexcept { return &result_; }
    const duckdb_result* get() const noexcept { return &result_; }

    /**
     * Marks the result as filled; call after every query, successful or not.
     */
    void set_initialized() noexcept { has_result_ = true; }

    /**
     * True when the result needs destroying.
     */
    bool has_result() const noexcept { return has_result_; }

    /**
     * Engine error text, or "Unknown error" when DuckDB reported none.
     */
    std::string error() {
        const char* message = has_result_ ? duckdb_result_error(&result_) : nullptr;
        return message ? std::string(message) : std::string("Unknown error");
    }

    /**
     * Destroys the result early; safe to call more than once.
     */
    void reset() noexcept {
        if (has_result_) {
            duckdb_destroy_result(&result_);
            has_result_ = false;
        }
    }

private:
    duckdb_result result_{};
    bool has_result_;
};

/**
 * One connection to an open database, disconnected on destruction.
 * Connections are cheap; one is opened per unit of work.
 */
class DuckDBConnection {
public:
    /**
     * Connects to the database.
     * @throws std::runtime_error if DuckDB refuses the connection
     */
    explicit DuckDBConnection(duckdb_database db) {
        if (duckdb_connect(db, &conn_) == DuckDBError) {
            throw std::runtime_error("Failed to create database connection");
        }
    }
    ~DuckDBConnection() { duckdb_disconnect(&conn_); }

    DuckDBConnection(const DuckDBConnection&) = delete;
    DuckDBConnection& operator=(const DuckDBConnection&) = delete;

    duckdb_connection get() const noexcept { return conn_; }

    // Runs a statement without parameters; returns the engine error, empty on success
    std::string run(const std::string& sql) {
        DuckDBResult result;
        auto state = duckdb_query(conn_, sql.c_str(), result.get());
        result.set_initialized();
        return state == DuckDBError ? result.error() : std::string();
    }

private:
    duckdb_connection conn_ = nullptr;
};

/**
 * Owns a prepared statement. duckdb_destroy_prepare() must run even when
 * preparation failed, which the destructor guarantees.
 */
class DuckDBPreparedStatement {
public:
    /**
     * Prepares the SQL on the connection. Check ok() before binding.
     */
    DuckDBPreparedStatement(duckdb_connection conn, const std::string& sql) {
        prepared_ = duckdb_prepare(conn, sql.c_str(), &stmt_) == DuckDBSuccess;
    }
    ~DuckDBPreparedStatement() { duckdb_destroy_prepare(&stmt_); }

    DuckDBPreparedStatement(const DuckDBPreparedStatement&) = delete;
    DuckDBPreparedStatement& operator=(const DuckDBPreparedStatement&) = delete;

    /**
     * True when the SQL was accepted by the engine.
     */
    bool ok() const noexcept { return prepared_; }

    duckdb_prepared_statement get() const noexcept { return stmt_; }

    /**
     * Preparation error text, e.g. a syntax error with its position.
     */
    std::string error() const {
        const char* message = duckdb_prepare_error(stmt_);
        return message ? std::string(message) : std::string("Unknown error");
    }

private:
    duckdb_prepared_statement stmt_ = nullptr;
    bool prepared_ = false;
};

} // namespace querygate
