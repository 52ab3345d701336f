#pragma once

#include "rowq/item_types.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace rowq {
namespace codec {

// UTF-8 JSON text of the value
Bytes encode_json(const nlohmann::json& value);

// Throws InvalidArgument when the bytes are not valid JSON
nlohmann::json decode_json(const Bytes& bytes);

// null JSON values map to an absent payload, mirroring a null content/metadata column
std::optional<Bytes> encode_optional(const nlohmann::json& value);
nlohmann::json decode_optional(const std::optional<Bytes>& bytes);

} // namespace codec
} // namespace rowq
