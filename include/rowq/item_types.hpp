#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rowq {

using Bytes = std::vector<uint8_t>;
using Timestamp = std::chrono::system_clock::time_point;

// Persisted as SMALLINT; the numeric values are shared with every store
// reading the same table and must not change.
enum class ItemStatus : int {
    New = 0,
    InProgress = 1,
    Completed = 2,
    Failed = 3
};

struct Item {
    int64_t id = 0;
    ItemStatus status = ItemStatus::New;
    Timestamp created_at;
    std::optional<Timestamp> completed_at;
    std::string routing_key;
    std::optional<Bytes> metadata;
    std::optional<Bytes> content;
    std::optional<std::string> error;

    // Monitoring view: payloads as hex, timestamps as ISO-8601 UTC
    nlohmann::json to_json() const;
};

struct ItemFilter {
    std::optional<std::string> routing_key;
    std::optional<ItemStatus> status;
    std::optional<Timestamp> created_before;  // strictly older than
};

// Width of the routing_key column
constexpr size_t MAX_ROUTING_KEY_LENGTH = 255;

// Throws InvalidArgument for an empty key, one longer than MAX_ROUTING_KEY_LENGTH
// bytes, or one containing a NUL byte (libpq would truncate it)
void validate_routing_key(const std::string& routing_key);

const char* status_name(ItemStatus status);

// Throws InvalidArgument for codes outside 0..3
ItemStatus status_from_int(int code);

// Accepts a status name (case-insensitive, "in_progress"/"inprogress") or its numeric code
ItemStatus parse_status(const std::string& text);

inline bool is_terminal(ItemStatus status) {
    return status == ItemStatus::Completed || status == ItemStatus::Failed;
}

std::string format_timestamp(Timestamp ts);

// Microseconds since the Unix epoch, as returned by the store queries
Timestamp timestamp_from_micros(int64_t micros);

std::string to_hex(const Bytes& bytes);

} // namespace rowq
