#pragma once

#include "rowq/item_types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rowq {

/**
 * Capability interface over the durable item table.
 *
 * Implementations must guarantee that no two concurrent claim() calls return
 * the same item, and that set_status() applies to all listed ids atomically.
 */
class ItemStore {
public:
    virtual ~ItemStore() = default;

    // Appends a New item and returns its id. Empty routing_key -> InvalidArgument.
    virtual int64_t enqueue(const std::string& routing_key,
                            const std::optional<Bytes>& content,
                            const std::optional<Bytes>& metadata) = 0;

    // Moves the oldest New item (optionally for one routing key) to InProgress.
    // std::nullopt means nothing is claimable; that is not an error.
    virtual std::optional<Item> claim(const std::optional<std::string>& routing_key) = 0;

    // Sets status, completed_at and error for every existing id in one atomic step.
    // Unknown ids are ignored; an empty list does nothing.
    virtual void set_status(const std::vector<int64_t>& ids,
                            ItemStatus status,
                            const std::optional<std::string>& error) = 0;

    // Read-only listing ordered by ascending id.
    virtual std::vector<Item> query(const ItemFilter& filter) = 0;

    void set_status(int64_t id, ItemStatus status, const std::optional<std::string>& error = std::nullopt) {
        set_status(std::vector<int64_t>{id}, status, error);
    }

    std::vector<Item> query(const std::optional<std::string>& routing_key,
                            const std::optional<ItemStatus>& status) {
        ItemFilter filter;
        filter.routing_key = routing_key;
        filter.status = status;
        return query(filter);
    }
};

} // namespace rowq
