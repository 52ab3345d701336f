#include "rowq/codec.hpp"
#include "rowq/errors.hpp"

namespace rowq {
namespace codec {

Bytes encode_json(const nlohmann::json& value) {
    std::string text = value.dump();
    return Bytes(text.begin(), text.end());
}

nlohmann::json decode_json(const Bytes& bytes) {
    try {
        return nlohmann::json::parse(bytes.begin(), bytes.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidArgument(std::string("Payload is not valid JSON: ") + e.what());
    }
}

std::optional<Bytes> encode_optional(const nlohmann::json& value) {
    if (value.is_null()) return std::nullopt;
    return encode_json(value);
}

nlohmann::json decode_optional(const std::optional<Bytes>& bytes) {
    if (!bytes) return nullptr;
    return decode_json(*bytes);
}

} // namespace codec
} // namespace rowq
