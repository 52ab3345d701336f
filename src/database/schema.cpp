#include "rowq/schema.hpp"
#include "rowq/pg_item_store.hpp"
#include <spdlog/spdlog.h>

namespace rowq {

namespace {

// Index names cannot be schema-qualified; derive them from the bare table name
std::string index_prefix(const std::string& table_name) {
    size_t dot = table_name.rfind('.');
    return "ix_" + (dot == std::string::npos ? table_name : table_name.substr(dot + 1));
}

} // namespace

std::string schema_sql(const std::string& table_name) {
    std::string table = quote_table_name(table_name);
    std::string prefix = index_prefix(table_name);

    std::string sql;
    size_t dot = table_name.find('.');
    if (dot != std::string::npos) {
        sql += "CREATE SCHEMA IF NOT EXISTS " + quote_table_name(table_name.substr(0, dot)) + ";\n";
    }

    sql += "CREATE TABLE IF NOT EXISTS " + table + R"( (
    id            BIGSERIAL PRIMARY KEY,
    status        SMALLINT     NOT NULL DEFAULT 0,
    created_at    TIMESTAMPTZ  NOT NULL DEFAULT NOW(),
    completed_at  TIMESTAMPTZ  NULL,
    routing_key   VARCHAR(255) NOT NULL,
    metadata      BYTEA        NULL,
    content       BYTEA        NULL,
    error         TEXT         NULL
);
)";
    sql += "CREATE INDEX IF NOT EXISTS \"" + prefix + "_status_routing_key\" ON " + table + " (status, routing_key);\n";
    sql += "CREATE INDEX IF NOT EXISTS \"" + prefix + "_created_at\" ON " + table + " (created_at);\n";
    return sql;
}

void initialize_schema(DatabasePool& pool, const std::string& table_name) {
    std::string sql = schema_sql(table_name);

    ScopedConnection conn(&pool);
    Transaction tx(*conn);

    spdlog::info("Initializing schema for table {}", table_name);

    auto result = QueryResult(conn->exec(sql));
    result.expect_success("Failed to create item table");

    tx.commit();
    spdlog::info("Schema ready for table {}", table_name);
}

} // namespace rowq
