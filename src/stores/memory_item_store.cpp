#include "rowq/memory_item_store.hpp"
#include <spdlog/spdlog.h>

namespace rowq {

int64_t MemoryItemStore::enqueue(const std::string& routing_key,
                                 const std::optional<Bytes>& content,
                                 const std::optional<Bytes>& metadata) {
    validate_routing_key(routing_key);

    std::lock_guard<std::mutex> lock(mutex_);

    Item item;
    item.id = next_id_++;
    item.status = ItemStatus::New;
    item.created_at = std::chrono::system_clock::now();
    item.routing_key = routing_key;
    item.content = content;
    item.metadata = metadata;

    int64_t id = item.id;
    items_.emplace(id, std::move(item));
    return id;
}

std::optional<Item> MemoryItemStore::claim(const std::optional<std::string>& routing_key) {
    bool filter_key = routing_key && !routing_key->empty();

    std::lock_guard<std::mutex> lock(mutex_);

    // std::map iterates in ascending id order, matching ORDER BY id
    for (auto& [id, item] : items_) {
        if (item.status != ItemStatus::New) continue;
        if (filter_key && item.routing_key != *routing_key) continue;

        item.status = ItemStatus::InProgress;
        return item;
    }
    return std::nullopt;
}

void MemoryItemStore::set_status(const std::vector<int64_t>& ids,
                                 ItemStatus status,
                                 const std::optional<std::string>& error) {
    status_from_int(static_cast<int>(status));

    if (ids.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<Timestamp> completed_at;
    if (is_terminal(status)) {
        completed_at = std::chrono::system_clock::now();
    }

    size_t updated = 0;
    for (int64_t id : ids) {
        auto it = items_.find(id);
        if (it == items_.end()) continue;

        it->second.status = status;
        it->second.completed_at = completed_at;
        it->second.error = error;
        ++updated;
    }

    spdlog::debug("Set status {} on {}/{} items", status_name(status), updated, ids.size());
}

std::vector<Item> MemoryItemStore::query(const ItemFilter& filter) {
    bool filter_key = filter.routing_key && !filter.routing_key->empty();
    std::optional<ItemStatus> status;
    if (filter.status) {
        status = status_from_int(static_cast<int>(*filter.status));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Item> result;
    for (const auto& [id, item] : items_) {
        if (filter_key && item.routing_key != *filter.routing_key) continue;
        if (status && item.status != *status) continue;
        if (filter.created_before && !(item.created_at < *filter.created_before)) continue;
        result.push_back(item);
    }
    return result;
}

size_t MemoryItemStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

} // namespace rowq
