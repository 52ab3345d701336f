#include "rowq/database.hpp"
#include "rowq/errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>

namespace rowq {

// DatabaseConnection Implementation
DatabaseConnection::DatabaseConnection(const std::string& connection_string,
                                       int statement_timeout_ms,
                                       int lock_timeout_ms,
                                       int idle_in_transaction_timeout_ms)
    : conn_(nullptr) {
    conn_ = PQconnectdb(connection_string.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string error = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw StoreUnavailable("Failed to connect to database: " + error);
    }

    PQsetClientEncoding(conn_, "UTF8");

    // Timeouts go through SET so they also work behind PgBouncer
    std::string set_timeouts =
        "SET statement_timeout = " + std::to_string(statement_timeout_ms) + "; " +
        "SET lock_timeout = " + std::to_string(lock_timeout_ms) + "; " +
        "SET idle_in_transaction_session_timeout = " + std::to_string(idle_in_transaction_timeout_ms) + ";";

    PGresult* result = PQexec(conn_, set_timeouts.c_str());
    if (PQresultStatus(result) != PGRES_COMMAND_OK) {
        std::string error = PQerrorMessage(conn_);
        PQclear(result);
        PQfinish(conn_);
        conn_ = nullptr;
        throw StoreUnavailable("Failed to set timeout parameters: " + error);
    }
    PQclear(result);
}

DatabaseConnection::~DatabaseConnection() {
    if (conn_) {
        PQfinish(conn_);
    }
}

DatabaseConnection::DatabaseConnection(DatabaseConnection&& other) noexcept
    : conn_(other.conn_) {
    other.conn_ = nullptr;
}

DatabaseConnection& DatabaseConnection::operator=(DatabaseConnection&& other) noexcept {
    if (this != &other) {
        if (conn_) PQfinish(conn_);
        conn_ = other.conn_;
        other.conn_ = nullptr;
    }
    return *this;
}

bool DatabaseConnection::is_valid() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

std::string DatabaseConnection::last_error() const {
    return conn_ ? PQerrorMessage(conn_) : "connection closed";
}

PGresult* DatabaseConnection::exec(const std::string& query) {
    if (!is_valid()) return nullptr;
    return PQexec(conn_, query.c_str());
}

PGresult* DatabaseConnection::exec_params(const std::string& query, const QueryParams& params) {
    if (!is_valid()) return nullptr;

    std::vector<const char*> param_values;
    param_values.reserve(params.size());

    for (const auto& param : params) {
        param_values.push_back(param ? param->c_str() : nullptr);
    }

    return PQexecParams(conn_, query.c_str(), static_cast<int>(params.size()),
                        nullptr, param_values.data(), nullptr, nullptr, 0);
}

bool DatabaseConnection::begin_transaction() {
    auto result = QueryResult(exec("BEGIN ISOLATION LEVEL READ COMMITTED"));
    return result.is_success();
}

bool DatabaseConnection::commit_transaction() {
    auto result = QueryResult(exec("COMMIT"));
    return result.is_success();
}

bool DatabaseConnection::rollback_transaction() {
    auto result = QueryResult(exec("ROLLBACK"));
    return result.is_success();
}

// DatabasePool Implementation
DatabasePool::DatabasePool(const std::string& connection_string,
                           size_t pool_size,
                           int acquisition_timeout_ms,
                           int statement_timeout_ms,
                           int lock_timeout_ms,
                           int idle_in_transaction_timeout_ms)
    : available_connections_(), mutex_(), condition_(),
      connection_string_(connection_string),
      pool_size_(pool_size > 0 ? pool_size : 1),
      current_size_(0),
      acquisition_timeout_ms_(acquisition_timeout_ms),
      statement_timeout_ms_(statement_timeout_ms),
      lock_timeout_ms_(lock_timeout_ms),
      idle_in_transaction_timeout_ms_(idle_in_transaction_timeout_ms) {

    // Pre-populate the pool
    std::string last_error;
    for (size_t i = 0; i < pool_size_; ++i) {
        try {
            auto conn = create_connection();
            available_connections_.push(std::move(conn));
            ++current_size_;
        } catch (const StoreUnavailable& e) {
            last_error = e.what();
            spdlog::error("Failed to create initial database connection: {}", e.what());
        }
    }

    if (current_size_ == 0) {
        throw StoreUnavailable("Failed to create any database connections: " + last_error);
    }

    spdlog::info("Database pool initialized with {}/{} connections (acquisition timeout: {}ms, statement timeout: {}ms)",
                 current_size_, pool_size_, acquisition_timeout_ms_, statement_timeout_ms_);
}

DatabasePool::~DatabasePool() {
    std::lock_guard<std::mutex> lock(mutex_);
    while (!available_connections_.empty()) {
        available_connections_.pop();
    }
}

std::unique_ptr<DatabaseConnection> DatabasePool::create_connection() {
    return std::make_unique<DatabaseConnection>(connection_string_,
                                                statement_timeout_ms_,
                                                lock_timeout_ms_,
                                                idle_in_transaction_timeout_ms_);
}

std::unique_ptr<DatabaseConnection> DatabasePool::get_connection() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!condition_.wait_for(lock, std::chrono::milliseconds(acquisition_timeout_ms_),
                             [this] { return !available_connections_.empty(); })) {

        // Pool is drained; a fresh connection lets us recover once PostgreSQL is back
        spdlog::warn("Pool timeout - attempting to create new connection (pool: {}/{})", current_size_, pool_size_);

        lock.unlock();
        std::unique_ptr<DatabaseConnection> new_conn;
        try {
            new_conn = create_connection();
        } catch (const StoreUnavailable& e) {
            spdlog::error("Failed to create connection on timeout: {}", e.what());
            throw StoreUnavailable("Database connection pool timeout (waited " +
                                   std::to_string(acquisition_timeout_ms_) + "ms): " + e.what());
        }
        lock.lock();

        ++current_size_;
        spdlog::info("Created new connection during timeout, pool now {}/{}", current_size_, pool_size_);
        return new_conn;
    }

    auto conn = std::move(available_connections_.front());
    available_connections_.pop();

    if (!conn->is_valid()) {
        spdlog::warn("Invalid connection found in pool, replacing it");
        --current_size_;

        lock.unlock();
        auto new_conn = create_connection();
        lock.lock();

        ++current_size_;
        return new_conn;
    }

    return conn;
}

void DatabasePool::return_connection(std::unique_ptr<DatabaseConnection> conn) {
    if (!conn) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (conn->is_valid()) {
        if (current_size_ > pool_size_) {
            // Overflow connection opened during a timeout; let it go
            --current_size_;
            return;
        }
        available_connections_.push(std::move(conn));
        condition_.notify_one();
        return;
    }

    spdlog::warn("Returned invalid connection to pool, attempting to create replacement");
    --current_size_;

    try {
        auto new_conn = create_connection();
        available_connections_.push(std::move(new_conn));
        ++current_size_;
        spdlog::info("Successfully replaced invalid connection, pool at {}/{}", current_size_, pool_size_);
    } catch (const StoreUnavailable& e) {
        spdlog::error("Exception creating replacement connection: {} - pool size now {}/{}",
                      e.what(), current_size_, pool_size_);
    }
    condition_.notify_one();
}

size_t DatabasePool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return available_connections_.size();
}

// ScopedConnection Implementation
ScopedConnection::ScopedConnection(DatabasePool* pool) : pool_(pool) {
    if (!pool_) {
        throw InvalidArgument("Database pool cannot be null");
    }
    conn_ = pool_->get_connection();
}

ScopedConnection::~ScopedConnection() {
    if (pool_ && conn_) {
        pool_->return_connection(std::move(conn_));
    }
}

// Transaction Implementation
Transaction::Transaction(DatabaseConnection& conn) : conn_(conn), finished_(false) {
    if (!conn_.begin_transaction()) {
        throw StoreUnavailable("Failed to begin transaction: " + conn_.last_error());
    }
}

Transaction::~Transaction() {
    if (!finished_) {
        if (!conn_.rollback_transaction()) {
            spdlog::warn("Rollback failed: {}", conn_.last_error());
        }
    }
}

void Transaction::commit() {
    finished_ = true;
    if (!conn_.commit_transaction()) {
        std::string error = conn_.last_error();
        if (!conn_.rollback_transaction()) {
            spdlog::warn("Rollback after failed commit also failed: {}", conn_.last_error());
        }
        throw StoreUnavailable("Failed to commit transaction: " + error);
    }
}

// QueryResult Implementation
void QueryResult::expect_success(const std::string& context) const {
    if (!is_success()) {
        throw StoreUnavailable(context + ": " + error_message());
    }
}

long QueryResult::affected_rows() const {
    if (!result_) return 0;
    const char* tuples = PQcmdTuples(result_);
    return (tuples && *tuples) ? std::strtol(tuples, nullptr, 10) : 0;
}

std::optional<std::vector<uint8_t>> QueryResult::get_bytes(int row, const std::string& field_name) const {
    if (is_null(row, field_name)) return std::nullopt;

    int col = PQfnumber(result_, field_name.c_str());
    const char* escaped = PQgetvalue(result_, row, col);

    size_t length = 0;
    unsigned char* raw = PQunescapeBytea(reinterpret_cast<const unsigned char*>(escaped), &length);
    if (!raw) {
        throw StoreUnavailable("Failed to decode bytea column '" + field_name + "'");
    }
    std::vector<uint8_t> bytes(raw, raw + length);
    PQfreemem(raw);
    return bytes;
}

std::string to_bytea_literal(const std::vector<uint8_t>& bytes) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(2 + bytes.size() * 2);
    out += "\\x";
    for (uint8_t b : bytes) {
        out += hex[b >> 4];
        out += hex[b & 0x0F];
    }
    return out;
}

} // namespace rowq
