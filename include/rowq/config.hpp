#pragma once

#include <string>
#include <cstdlib>
#include <cstring>

namespace rowq {

// Helper function to get boolean from environment
inline bool get_env_bool(const char* name, bool default_value) {
    const char* value = std::getenv(name);
    if (!value) return default_value;
    return std::strcmp(value, "true") == 0 || std::strcmp(value, "1") == 0;
}

// Helper function to get int from environment
inline int get_env_int(const char* name, int default_value) {
    const char* value = std::getenv(name);
    return value ? std::atoi(value) : default_value;
}

// Helper function to get string from environment
inline std::string get_env_string(const char* name, const std::string& default_value) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : default_value;
}

struct DatabaseConfig {
    // Connection settings
    std::string user = "postgres";
    std::string host = "localhost";
    std::string database = "postgres";
    std::string password = "postgres";
    std::string port = "5432";

    bool use_ssl = false;

    // Pool configuration
    int pool_size = 4;
    int idle_timeout = 30000;             // idle_in_transaction_session_timeout, ms
    int connection_timeout = 2000;        // 2 seconds
    int statement_timeout = 30000;        // 30 seconds
    int lock_timeout = 10000;             // 10 seconds
    int pool_acquisition_timeout = 10000; // wait for a free pooled connection

    static DatabaseConfig from_env() {
        DatabaseConfig config;
        config.user = get_env_string("PG_USER", "postgres");
        config.host = get_env_string("PG_HOST", "localhost");
        config.database = get_env_string("PG_DB", "postgres");
        config.password = get_env_string("PG_PASSWORD", "postgres");
        config.port = get_env_string("PG_PORT", "5432");

        config.use_ssl = get_env_bool("PG_USE_SSL", false);

        config.pool_size = get_env_int("DB_POOL_SIZE", 4);
        config.idle_timeout = get_env_int("DB_IDLE_TIMEOUT", 30000);
        config.connection_timeout = get_env_int("DB_CONNECTION_TIMEOUT", 2000);
        config.statement_timeout = get_env_int("DB_STATEMENT_TIMEOUT", 30000);
        config.lock_timeout = get_env_int("DB_LOCK_TIMEOUT", 10000);
        config.pool_acquisition_timeout = get_env_int("DB_POOL_ACQUISITION_TIMEOUT", 10000);

        return config;
    }

    std::string connection_string() const {
        std::string conn_str = "host=" + host + " port=" + port + " dbname=" + database +
                               " user=" + user + " password=" + password;

        conn_str += use_ssl ? " sslmode=require" : " sslmode=disable";

        // connect_timeout is in seconds and must be at least 1 to mean anything
        int connect_seconds = connection_timeout / 1000;
        conn_str += " connect_timeout=" + std::to_string(connect_seconds > 0 ? connect_seconds : 1);

        // statement_timeout, lock_timeout and idle_in_transaction_session_timeout
        // are applied per connection via SET (see DatabaseConnection)
        return conn_str;
    }
};

struct QueueConfig {
    std::string table_name = "rowq_items";
    int poll_interval_ms = 1000;   // Dispatcher idle sleep when nothing is claimable

    static QueueConfig from_env() {
        QueueConfig config;
        config.table_name = get_env_string("ROWQ_TABLE", "rowq_items");
        config.poll_interval_ms = get_env_int("ROWQ_POLL_INTERVAL_MS", 1000);
        return config;
    }
};

struct Config {
    DatabaseConfig database;
    QueueConfig queue;
    std::string log_level = "info";

    static Config load() {
        Config config;
        config.database = DatabaseConfig::from_env();
        config.queue = QueueConfig::from_env();
        config.log_level = get_env_string("LOG_LEVEL", "info");
        return config;
    }
};

} // namespace rowq
