#pragma once

#include "rowq/item_store.hpp"
#include <map>
#include <mutex>

namespace rowq {

// In-process backend with the same observable semantics as PgItemStore.
// Every operation runs under one mutex, which makes claim trivially exclusive.
class MemoryItemStore : public ItemStore {
public:
    MemoryItemStore() = default;

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

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<int64_t, Item> items_;
    int64_t next_id_ = 1;
};

} // namespace rowq
