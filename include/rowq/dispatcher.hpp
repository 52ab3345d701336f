#pragma once

#include "rowq/item_store.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace rowq {

enum class DispatchOutcome {
    Idle,       // nothing was claimable
    Completed,
    Failed
};

/**
 * Routes claimed items to handlers by routing key and finalizes them.
 *
 * A handler that returns normally completes the item; one that throws a
 * std::exception fails it with the exception text. Items whose routing key
 * has no handler are failed as well, so they stay visible for manual retry.
 */
class Dispatcher {
public:
    using Handler = std::function<void(const Item&)>;

    explicit Dispatcher(std::shared_ptr<ItemStore> store, int poll_interval_ms = 1000);

    void on(const std::string& routing_key, Handler handler);

    // Claim at most one item and process it on the calling thread
    DispatchOutcome run_once(const std::optional<std::string>& routing_key = std::nullopt);

    // Loop run_once() until stop(); sleeps poll_interval_ms whenever idle or the store is down.
    // Returns immediately if stop() was already called.
    void run(const std::optional<std::string>& routing_key = std::nullopt);
    // Final: a stopped dispatcher never runs again
    void stop();

    bool is_running() const { return running_.load(); }
    uint64_t processed_count() const { return processed_.load(); }
    uint64_t failed_count() const { return failed_.load(); }

private:
    std::shared_ptr<ItemStore> store_;
    int poll_interval_ms_;
    std::unordered_map<std::string, Handler> handlers_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> failed_{0};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    void idle_wait();
};

} // namespace rowq
