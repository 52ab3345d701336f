#pragma once

#include <libpq-fe.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>

namespace rowq {

// Positional parameters for $1..$n; std::nullopt binds SQL NULL
using QueryParams = std::vector<std::optional<std::string>>;

class DatabaseConnection {
private:
    PGconn* conn_;

public:
    DatabaseConnection(const std::string& connection_string,
                       int statement_timeout_ms,
                       int lock_timeout_ms,
                       int idle_in_transaction_timeout_ms);
    ~DatabaseConnection();

    // Non-copyable, movable
    DatabaseConnection(const DatabaseConnection&) = delete;
    DatabaseConnection& operator=(const DatabaseConnection&) = delete;
    DatabaseConnection(DatabaseConnection&& other) noexcept;
    DatabaseConnection& operator=(DatabaseConnection&& other) noexcept;

    bool is_valid() const;

    std::string last_error() const;

    PGresult* exec(const std::string& query);
    PGresult* exec_params(const std::string& query, const QueryParams& params);

    // Transaction support
    bool begin_transaction();
    bool commit_transaction();
    bool rollback_transaction();
};

class DatabasePool {
private:
    std::queue<std::unique_ptr<DatabaseConnection>> available_connections_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::string connection_string_;
    size_t pool_size_;
    size_t current_size_;
    int acquisition_timeout_ms_;
    int statement_timeout_ms_;
    int lock_timeout_ms_;
    int idle_in_transaction_timeout_ms_;

    std::unique_ptr<DatabaseConnection> create_connection();

public:
    DatabasePool(const std::string& connection_string,
                 size_t pool_size = 4,
                 int acquisition_timeout_ms = 10000,
                 int statement_timeout_ms = 30000,
                 int lock_timeout_ms = 10000,
                 int idle_in_transaction_timeout_ms = 30000);
    ~DatabasePool();

    std::unique_ptr<DatabaseConnection> get_connection();
    void return_connection(std::unique_ptr<DatabaseConnection> conn);

    size_t size() const { return current_size_; }
    size_t available() const;
};

// RAII connection wrapper
class ScopedConnection {
private:
    DatabasePool* pool_;
    std::unique_ptr<DatabaseConnection> conn_;

public:
    explicit ScopedConnection(DatabasePool* pool);
    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    DatabaseConnection* operator->() { return conn_.get(); }
    DatabaseConnection& operator*() { return *conn_; }
    bool is_valid() const { return conn_ && conn_->is_valid(); }
};

// RAII transaction: rolls back on scope exit unless commit() succeeded
class Transaction {
private:
    DatabaseConnection& conn_;
    bool finished_;

public:
    explicit Transaction(DatabaseConnection& conn);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();
};

// Result wrapper for easier handling
class QueryResult {
private:
    PGresult* result_;

public:
    explicit QueryResult(PGresult* result) : result_(result) {}
    ~QueryResult() { if (result_) PQclear(result_); }

    // Non-copyable, movable
    QueryResult(const QueryResult&) = delete;
    QueryResult& operator=(const QueryResult&) = delete;
    QueryResult(QueryResult&& other) noexcept : result_(other.result_) { other.result_ = nullptr; }
    QueryResult& operator=(QueryResult&& other) noexcept {
        if (this != &other) {
            if (result_) PQclear(result_);
            result_ = other.result_;
            other.result_ = nullptr;
        }
        return *this;
    }

    bool is_valid() const { return result_ != nullptr; }
    bool is_success() const {
        return result_ && (PQresultStatus(result_) == PGRES_COMMAND_OK ||
                          PQresultStatus(result_) == PGRES_TUPLES_OK);
    }

    // Throws StoreUnavailable carrying the server error when the statement failed
    void expect_success(const std::string& context) const;

    int num_rows() const { return result_ ? PQntuples(result_) : 0; }
    int num_fields() const { return result_ ? PQnfields(result_) : 0; }
    long affected_rows() const;

    std::string get_value(int row, int col) const {
        if (!result_ || row >= num_rows() || col >= num_fields()) return "";
        const char* val = PQgetvalue(result_, row, col);
        return val ? std::string(val) : "";
    }

    std::string get_value(int row, const std::string& field_name) const {
        if (!result_) return "";
        int col = PQfnumber(result_, field_name.c_str());
        if (col == -1) return "";
        return get_value(row, col);
    }

    bool is_null(int row, int col) const {
        return result_ && PQgetisnull(result_, row, col);
    }

    bool is_null(int row, const std::string& field_name) const {
        if (!result_) return true;
        int col = PQfnumber(result_, field_name.c_str());
        return col == -1 || is_null(row, col);
    }

    std::optional<std::string> get_optional(int row, const std::string& field_name) const {
        if (is_null(row, field_name)) return std::nullopt;
        return get_value(row, field_name);
    }

    // Decodes a bytea column returned in text format
    std::optional<std::vector<uint8_t>> get_bytes(int row, const std::string& field_name) const;

    std::string error_message() const {
        return result_ ? PQresultErrorMessage(result_) : "No result";
    }
};

// Renders bytes in the bytea hex input format ("\x0a1b...") for text-mode parameters
std::string to_bytea_literal(const std::vector<uint8_t>& bytes);

} // namespace rowq
