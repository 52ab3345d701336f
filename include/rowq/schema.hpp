#pragma once

#include "rowq/database.hpp"
#include <string>

namespace rowq {

/**
 * Create the item table and its indexes if they do not exist.
 *
 * Runs in a single transaction and is idempotent. Must be called once before
 * any store operation; the stores themselves never create or migrate schema.
 *
 * @param pool        connection pool to run the DDL on
 * @param table_name  table, optionally schema-qualified ("jobs.items")
 */
void initialize_schema(DatabasePool& pool, const std::string& table_name = "rowq_items");

// The DDL initialize_schema() would run, for inspection and tests
std::string schema_sql(const std::string& table_name);

} // namespace rowq
