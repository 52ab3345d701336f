#include "rowq/pg_item_store.hpp"
#include "rowq/errors.hpp"
#include <spdlog/spdlog.h>
#include <cctype>

namespace rowq {

namespace {

const char* ITEM_COLUMNS = R"(
    id, status,
    (EXTRACT(EPOCH FROM created_at) * 1000000)::bigint AS created_at_us,
    (EXTRACT(EPOCH FROM completed_at) * 1000000)::bigint AS completed_at_us,
    routing_key, metadata, content, error
)";

bool is_identifier(const std::string& part) {
    if (part.empty() || part.size() > 63) return false;
    if (!(std::isalpha(static_cast<unsigned char>(part[0])) || part[0] == '_')) return false;
    for (unsigned char c : part) {
        if (!(std::isalnum(c) || c == '_')) return false;
    }
    return true;
}

std::optional<std::string> bytea_param(const std::optional<Bytes>& bytes) {
    if (!bytes) return std::nullopt;
    return to_bytea_literal(*bytes);
}

} // namespace

std::string quote_table_name(const std::string& table_name) {
    std::string quoted;
    size_t start = 0;
    int parts = 0;
    while (true) {
        size_t dot = table_name.find('.', start);
        std::string part = table_name.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!is_identifier(part) || ++parts > 2) {
            throw InvalidArgument("Invalid table name: '" + table_name + "'");
        }
        if (!quoted.empty()) quoted += '.';
        quoted += '"' + part + '"';
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return quoted;
}

PgItemStore::PgItemStore(std::shared_ptr<DatabasePool> db_pool, const std::string& table_name)
    : db_pool_(std::move(db_pool)), table_(quote_table_name(table_name)) {
    if (!db_pool_) {
        throw InvalidArgument("Database pool cannot be null");
    }
}

int64_t PgItemStore::enqueue(const std::string& routing_key,
                             const std::optional<Bytes>& content,
                             const std::optional<Bytes>& metadata) {
    validate_routing_key(routing_key);

    ScopedConnection conn(db_pool_.get());

    std::string sql =
        "INSERT INTO " + table_ + " (status, created_at, routing_key, metadata, content) "
        "VALUES (0, NOW(), $1, $2::bytea, $3::bytea) "
        "RETURNING id";

    auto result = QueryResult(conn->exec_params(sql, {
        routing_key,
        bytea_param(metadata),
        bytea_param(content)
    }));
    result.expect_success("Enqueue failed");

    if (result.num_rows() != 1) {
        throw StoreUnavailable("Enqueue returned no id");
    }

    int64_t id = std::stoll(result.get_value(0, "id"));
    spdlog::debug("Enqueued item {} for routing key '{}'", id, routing_key);
    return id;
}

std::optional<Item> PgItemStore::claim(const std::optional<std::string>& routing_key) {
    ScopedConnection conn(db_pool_.get());
    Transaction tx(*conn);

    std::string where_clause = "WHERE status = 0";
    QueryParams params;
    if (routing_key && !routing_key->empty()) {
        where_clause += " AND routing_key = $1";
        params.push_back(*routing_key);
    }

    // CRITICAL: SKIP LOCKED lets concurrent claimants pass over rows another
    // in-flight claim holds; FOR UPDATE keeps them off ours until commit.
    std::string select_sql =
        std::string("SELECT ") + ITEM_COLUMNS + " FROM " + table_ + " " + where_clause +
        " ORDER BY id ASC LIMIT 1 FOR UPDATE SKIP LOCKED";

    auto selected = QueryResult(conn->exec_params(select_sql, params));
    selected.expect_success("Claim select failed");

    if (selected.num_rows() == 0) {
        tx.commit();
        return std::nullopt;
    }

    Item item = item_from_row(selected, 0);

    auto updated = QueryResult(conn->exec_params(
        "UPDATE " + table_ + " SET status = 1 WHERE id = $1",
        {std::to_string(item.id)}
    ));
    updated.expect_success("Claim update failed");

    tx.commit();

    item.status = ItemStatus::InProgress;
    spdlog::debug("Claimed item {} (routing key '{}')", item.id, item.routing_key);
    return item;
}

void PgItemStore::set_status(const std::vector<int64_t>& ids,
                             ItemStatus status,
                             const std::optional<std::string>& error) {
    // Reject values smuggled in through static_cast before touching the store
    status_from_int(static_cast<int>(status));

    if (ids.empty()) {
        return;
    }

    std::string id_array = "{";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) id_array += ',';
        id_array += std::to_string(ids[i]);
    }
    id_array += '}';

    // Single statement, so all ids change together or not at all
    std::string sql =
        "UPDATE " + table_ + " SET status = $1::smallint, "
        "completed_at = " + (is_terminal(status) ? "NOW()" : "NULL") + ", "
        "error = $2 "
        "WHERE id = ANY($3::bigint[])";

    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(sql, {
        std::to_string(static_cast<int>(status)),
        error,
        id_array
    }));
    result.expect_success("Status update failed");

    spdlog::debug("Set status {} on {}/{} items", status_name(status), result.affected_rows(), ids.size());
}

std::vector<Item> PgItemStore::query(const ItemFilter& filter) {
    std::vector<std::string> conditions;
    QueryParams params;

    if (filter.routing_key && !filter.routing_key->empty()) {
        params.push_back(*filter.routing_key);
        conditions.push_back("routing_key = $" + std::to_string(params.size()));
    }
    if (filter.status) {
        params.push_back(std::to_string(static_cast<int>(status_from_int(static_cast<int>(*filter.status)))));
        conditions.push_back("status = $" + std::to_string(params.size()) + "::smallint");
    }
    if (filter.created_before) {
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
            filter.created_before->time_since_epoch()).count();
        params.push_back(std::to_string(micros));
        conditions.push_back("created_at < to_timestamp($" + std::to_string(params.size()) +
                             "::double precision / 1000000)");
    }

    std::string sql = std::string("SELECT ") + ITEM_COLUMNS + " FROM " + table_;
    for (size_t i = 0; i < conditions.size(); ++i) {
        sql += (i == 0 ? " WHERE " : " AND ") + conditions[i];
    }
    sql += " ORDER BY id ASC";

    ScopedConnection conn(db_pool_.get());
    auto result = QueryResult(conn->exec_params(sql, params));
    result.expect_success("Query failed");

    std::vector<Item> items;
    items.reserve(result.num_rows());
    for (int i = 0; i < result.num_rows(); ++i) {
        items.push_back(item_from_row(result, i));
    }
    return items;
}

Item PgItemStore::item_from_row(const QueryResult& result, int row) {
    Item item;
    item.id = std::stoll(result.get_value(row, "id"));
    item.status = status_from_int(std::stoi(result.get_value(row, "status")));
    item.created_at = timestamp_from_micros(std::stoll(result.get_value(row, "created_at_us")));

    auto completed = result.get_optional(row, "completed_at_us");
    if (completed) {
        item.completed_at = timestamp_from_micros(std::stoll(*completed));
    }

    item.routing_key = result.get_value(row, "routing_key");
    item.metadata = result.get_bytes(row, "metadata");
    item.content = result.get_bytes(row, "content");
    item.error = result.get_optional(row, "error");
    return item;
}

} // namespace rowq
