#pragma once

#include "rowq/item_store.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace rowq {

// Sends JSON payloads through an explicitly supplied store
class Producer {
public:
    explicit Producer(std::shared_ptr<ItemStore> store);

    int64_t send(const std::string& routing_key, const nlohmann::json& content);
    int64_t send(const std::string& routing_key, const nlohmann::json& content, const nlohmann::json& metadata);

private:
    std::shared_ptr<ItemStore> store_;
};

} // namespace rowq
