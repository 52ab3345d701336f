#pragma once

#include "rowq/database.hpp"
#include "rowq/item_store.hpp"
#include <memory>
#include <string>

namespace rowq {

// Splits "schema.table" into validated identifiers and returns the quoted form.
// Throws InvalidArgument for anything outside [A-Za-z_][A-Za-z0-9_]*.
std::string quote_table_name(const std::string& table_name);

// PostgreSQL backend. Claims use FOR UPDATE SKIP LOCKED so racing consumers
// land on distinct rows instead of queueing behind each other.
class PgItemStore : public ItemStore {
public:
    explicit PgItemStore(std::shared_ptr<DatabasePool> db_pool,
                         const std::string& table_name = "rowq_items");

    int64_t enqueue(const std::string& routing_key,
                    const std::optional<Bytes>& content,
                    const std::optional<Bytes>& metadata) override;

    std::optional<Item> claim(const std::optional<std::string>& routing_key) override;

    void set_status(const std::vector<int64_t>& ids,
                    ItemStatus status,
                    const std::optional<std::string>& error) override;

    std::vector<Item> query(const ItemFilter& filter) override;

    using ItemStore::set_status;
    using ItemStore::query;

private:
    std::shared_ptr<DatabasePool> db_pool_;
    std::string table_;

    static Item item_from_row(const QueryResult& result, int row);
};

} // namespace rowq
