#include "rowq/item_types.hpp"
#include "rowq/errors.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace rowq {

void validate_routing_key(const std::string& routing_key) {
    if (routing_key.empty()) {
        throw InvalidArgument("Routing key cannot be empty");
    }
    if (routing_key.size() > MAX_ROUTING_KEY_LENGTH) {
        throw InvalidArgument("Routing key exceeds " + std::to_string(MAX_ROUTING_KEY_LENGTH) +
                              " bytes (got " + std::to_string(routing_key.size()) + ")");
    }
    if (routing_key.find('\0') != std::string::npos) {
        throw InvalidArgument("Routing key cannot contain a NUL byte");
    }
}

const char* status_name(ItemStatus status) {
    switch (status) {
        case ItemStatus::New: return "new";
        case ItemStatus::InProgress: return "in_progress";
        case ItemStatus::Completed: return "completed";
        case ItemStatus::Failed: return "failed";
    }
    return "unknown";
}

ItemStatus status_from_int(int code) {
    switch (code) {
        case 0: return ItemStatus::New;
        case 1: return ItemStatus::InProgress;
        case 2: return ItemStatus::Completed;
        case 3: return ItemStatus::Failed;
        default:
            throw InvalidArgument("Unrecognized item status code: " + std::to_string(code));
    }
}

ItemStatus parse_status(const std::string& text) {
    if (text.empty()) {
        throw InvalidArgument("Item status cannot be empty");
    }

    if (std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        if (text.size() > 3) {
            throw InvalidArgument("Unrecognized item status code: " + text);
        }
        return status_from_int(std::stoi(text));
    }

    std::string lowered;
    lowered.reserve(text.size());
    for (unsigned char c : text) {
        if (c == '_' || c == '-') continue;
        lowered += static_cast<char>(std::tolower(c));
    }

    if (lowered == "new") return ItemStatus::New;
    if (lowered == "inprogress") return ItemStatus::InProgress;
    if (lowered == "completed") return ItemStatus::Completed;
    if (lowered == "failed") return ItemStatus::Failed;

    throw InvalidArgument("Unrecognized item status: " + text);
}

std::string format_timestamp(Timestamp ts) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        --seconds;
    }

    std::tm tm{};
    gmtime_r(&seconds, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return ss.str();
}

Timestamp timestamp_from_micros(int64_t micros) {
    return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::microseconds(micros)));
}

std::string to_hex(const Bytes& bytes) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out += hex[b >> 4];
        out += hex[b & 0x0F];
    }
    return out;
}

nlohmann::json Item::to_json() const {
    nlohmann::json j = {
        {"id", id},
        {"status", status_name(status)},
        {"createdAt", format_timestamp(created_at)},
        {"routingKey", routing_key}
    };
    j["completedAt"] = completed_at ? nlohmann::json(format_timestamp(*completed_at)) : nlohmann::json(nullptr);
    j["metadata"] = metadata ? nlohmann::json(to_hex(*metadata)) : nlohmann::json(nullptr);
    j["content"] = content ? nlohmann::json(to_hex(*content)) : nlohmann::json(nullptr);
    j["error"] = error ? nlohmann::json(*error) : nlohmann::json(nullptr);
    return j;
}

} // namespace rowq
