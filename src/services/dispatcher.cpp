#include "rowq/dispatcher.hpp"
#include "rowq/errors.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace rowq {

Dispatcher::Dispatcher(std::shared_ptr<ItemStore> store, int poll_interval_ms)
    : store_(std::move(store)), poll_interval_ms_(poll_interval_ms) {
    if (!store_) {
        throw InvalidArgument("Item store cannot be null");
    }
}

void Dispatcher::on(const std::string& routing_key, Handler handler) {
    if (routing_key.empty()) {
        throw InvalidArgument("Routing key cannot be empty");
    }
    if (!handler) {
        throw InvalidArgument("Handler for '" + routing_key + "' cannot be empty");
    }
    handlers_[routing_key] = std::move(handler);
}

DispatchOutcome Dispatcher::run_once(const std::optional<std::string>& routing_key) {
    auto item = store_->claim(routing_key);
    if (!item) {
        return DispatchOutcome::Idle;
    }

    auto it = handlers_.find(item->routing_key);
    if (it == handlers_.end()) {
        spdlog::warn("No handler for item {} (routing key '{}')", item->id, item->routing_key);
        store_->set_status(item->id, ItemStatus::Failed,
                           "no handler registered for routing key '" + item->routing_key + "'");
        ++failed_;
        return DispatchOutcome::Failed;
    }

    try {
        it->second(*item);
    } catch (const std::exception& e) {
        spdlog::error("Handler for item {} (routing key '{}') failed: {}", item->id, item->routing_key, e.what());
        store_->set_status(item->id, ItemStatus::Failed, std::string(e.what()));
        ++failed_;
        return DispatchOutcome::Failed;
    }

    store_->set_status(item->id, ItemStatus::Completed);
    ++processed_;
    spdlog::debug("Item {} completed", item->id);
    return DispatchOutcome::Completed;
}

void Dispatcher::run(const std::optional<std::string>& routing_key) {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (stop_requested_) {
            spdlog::info("Dispatcher stop requested before start, not running");
            return;
        }
        running_ = true;
    }
    spdlog::info("Dispatcher started ({} handlers, poll interval {}ms)", handlers_.size(), poll_interval_ms_);

    while (!stop_requested_) {
        try {
            if (run_once(routing_key) == DispatchOutcome::Idle) {
                idle_wait();
            }
        } catch (const StoreUnavailable& e) {
            spdlog::error("Store unavailable, backing off: {}", e.what());
            idle_wait();
        }
    }

    running_ = false;
    spdlog::info("Dispatcher stopped (completed: {}, failed: {})", processed_.load(), failed_.load());
}

void Dispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = true;
    }
    wait_cv_.notify_all();
}

void Dispatcher::idle_wait() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::milliseconds(poll_interval_ms_), [this] { return stop_requested_.load(); });
}

} // namespace rowq
