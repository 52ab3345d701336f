#include "rowq/producer.hpp"
#include "rowq/codec.hpp"
#include "rowq/errors.hpp"

namespace rowq {

Producer::Producer(std::shared_ptr<ItemStore> store) : store_(std::move(store)) {
    if (!store_) {
        throw InvalidArgument("Item store cannot be null");
    }
}

int64_t Producer::send(const std::string& routing_key, const nlohmann::json& content) {
    return send(routing_key, content, nullptr);
}

int64_t Producer::send(const std::string& routing_key, const nlohmann::json& content, const nlohmann::json& metadata) {
    return store_->enqueue(routing_key, codec::encode_optional(content), codec::encode_optional(metadata));
}

} // namespace rowq
