/**
 * Item store behaviour tests.
 *
 * Every case runs against MemoryItemStore, and again against PgItemStore when
 * PG_HOST is set (each case gets its own freshly created table).
 */

#include "rowq/config.hpp"
#include "rowq/errors.hpp"
#include "rowq/memory_item_store.hpp"
#include "rowq/pg_item_store.hpp"
#include "rowq/schema.hpp"
#include "test_harness.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <thread>

using namespace rowq;

using StoreFactory = std::function<std::shared_ptr<ItemStore>()>;

#define TEST(name) void name(ItemStore& store, TestResult& result)

namespace {

Bytes bytes_of(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

std::vector<int64_t> ids_of(const std::vector<Item>& items) {
    std::vector<int64_t> ids;
    for (const auto& item : items) ids.push_back(item.id);
    return ids;
}

} // namespace

// ============================================================================
// ENQUEUE / CLAIM
// ============================================================================

TEST(test_enqueue_rejects_empty_routing_key) {
    ASSERT_THROWS(store.enqueue("", bytes_of("x"), std::nullopt), InvalidArgument,
                  "Empty routing key should be rejected");
    ASSERT(store.query(ItemFilter{}).empty(), "Rejected enqueue must not insert a row");
}

TEST(test_enqueue_routing_key_bounds) {
    std::string longest(MAX_ROUTING_KEY_LENGTH, 'k');
    int64_t id = store.enqueue(longest, std::nullopt, std::nullopt);
    auto claimed = store.claim(longest);
    ASSERT(claimed.has_value(), "Key at the column width should be accepted");
    ASSERT_EQ(claimed->id, id, "Claimed the stored item");
    ASSERT_EQ(claimed->routing_key, longest, "Key stored intact");

    ASSERT_THROWS(store.enqueue(std::string(MAX_ROUTING_KEY_LENGTH + 1, 'k'), std::nullopt, std::nullopt),
                  InvalidArgument, "Over-long routing key should be rejected");
    ASSERT_THROWS(store.enqueue(std::string("orders\0eu", 9), std::nullopt, std::nullopt),
                  InvalidArgument, "Routing key with a NUL byte should be rejected");
    ASSERT_EQ(store.query(ItemFilter{}).size(), 1u, "Rejected enqueues must not insert rows");
}

TEST(test_claim_empty_store) {
    ASSERT(!store.claim(std::nullopt).has_value(), "Empty store should yield no item");
    ASSERT(!store.claim(std::string("a.b")).has_value(), "Empty store should yield no item for a key");
}

TEST(test_claim_unmatched_routing_key) {
    store.enqueue("orders", bytes_of("1"), std::nullopt);
    ASSERT(!store.claim(std::string("invoices")).has_value(), "No item should match another routing key");

    auto items = store.query(ItemFilter{});
    ASSERT_EQ(items.size(), 1u, "Item should still be there");
    ASSERT(items[0].status == ItemStatus::New, "Unmatched claim must not change status");
}

TEST(test_enqueue_claim_round_trip) {
    Bytes content = {0x00, 0x01, 0x7f, 0x80, 0xff, '\\', 'x'};
    Bytes metadata = bytes_of(R"({"user":"u1"})");

    int64_t id = store.enqueue("mail.send", content, metadata);
    auto item = store.claim(std::string("mail.send"));

    ASSERT(item.has_value(), "Item should be claimable");
    ASSERT_EQ(item->id, id, "Claimed id should be the enqueued id");
    ASSERT(item->status == ItemStatus::InProgress, "Claimed item should be InProgress");
    ASSERT_EQ(item->routing_key, std::string("mail.send"), "Routing key mismatch");
    ASSERT(item->content.has_value() && *item->content == content, "Content mismatch");
    ASSERT(item->metadata.has_value() && *item->metadata == metadata, "Metadata mismatch");
    ASSERT(!item->completed_at.has_value(), "Claimed item has no completed_at");
    ASSERT(!item->error.has_value(), "Claimed item has no error");
}

TEST(test_enqueue_without_payloads) {
    int64_t id = store.enqueue("ping", std::nullopt, std::nullopt);
    auto item = store.claim(std::nullopt);

    ASSERT(item.has_value(), "Item should be claimable");
    ASSERT_EQ(item->id, id, "Claimed id should be the enqueued id");
    ASSERT(!item->content.has_value(), "Absent content should stay absent");
    ASSERT(!item->metadata.has_value(), "Absent metadata should stay absent");
}

TEST(test_ids_increase) {
    int64_t first = store.enqueue("k", std::nullopt, std::nullopt);
    int64_t second = store.enqueue("k", std::nullopt, std::nullopt);
    int64_t third = store.enqueue("other", std::nullopt, std::nullopt);
    ASSERT_GT(second, first, "Ids should increase");
    ASSERT_GT(third, second, "Ids should increase across routing keys");
}

TEST(test_claim_order_within_routing_key) {
    int64_t a1 = store.enqueue("a", bytes_of("1"), std::nullopt);
    store.enqueue("b", bytes_of("2"), std::nullopt);
    int64_t a2 = store.enqueue("a", bytes_of("3"), std::nullopt);

    auto first = store.claim(std::string("a"));
    auto second = store.claim(std::string("a"));
    auto third = store.claim(std::string("a"));

    ASSERT(first && second, "Both 'a' items should be claimable");
    ASSERT_EQ(first->id, a1, "Oldest 'a' item first");
    ASSERT_EQ(second->id, a2, "Next 'a' item second");
    ASSERT(!third.has_value(), "No third 'a' item");
}

TEST(test_claim_any_routing_key_takes_oldest) {
    int64_t b = store.enqueue("b", std::nullopt, std::nullopt);
    store.enqueue("a", std::nullopt, std::nullopt);

    auto item = store.claim(std::nullopt);
    ASSERT(item.has_value(), "An item should be claimable");
    ASSERT_EQ(item->id, b, "Unfiltered claim takes the lowest id");

    auto empty_key = store.claim(std::string(""));
    ASSERT(empty_key.has_value(), "Empty routing key behaves like no filter");
    ASSERT_EQ(empty_key->routing_key, std::string("a"), "Remaining item should be claimed");
}

TEST(test_claim_does_not_redeliver) {
    store.enqueue("a.b", bytes_of("x"), std::nullopt);
    ASSERT(store.claim(std::string("a.b")).has_value(), "First claim should succeed");
    ASSERT(!store.claim(std::string("a.b")).has_value(), "Second claim should find nothing");
    ASSERT(!store.claim(std::nullopt).has_value(), "InProgress items are never claimable");
}

// ============================================================================
// FINALIZE
// ============================================================================

TEST(test_set_status_empty_ids_is_noop) {
    int64_t id = store.enqueue("k", bytes_of("x"), std::nullopt);
    auto before = store.query(ItemFilter{});

    store.set_status(std::vector<int64_t>{}, ItemStatus::Completed, std::string("ignored"));

    auto after = store.query(ItemFilter{});
    ASSERT_EQ(after.size(), before.size(), "Row count unchanged");
    ASSERT_EQ(after[0].id, id, "Same item");
    ASSERT(after[0].status == ItemStatus::New, "Status unchanged");
    ASSERT(!after[0].error.has_value(), "Error unchanged");
    ASSERT(!after[0].completed_at.has_value(), "completed_at unchanged");
}

TEST(test_complete_then_query) {
    int64_t a = store.enqueue("k", std::nullopt, std::nullopt);
    int64_t b = store.enqueue("k", std::nullopt, std::nullopt);
    int64_t c = store.enqueue("k", std::nullopt, std::nullopt);
    store.claim(std::nullopt);
    store.claim(std::nullopt);

    store.set_status({a, b}, ItemStatus::Completed, std::nullopt);

    auto completed = store.query(std::nullopt, ItemStatus::Completed);
    ASSERT((ids_of(completed) == std::vector<int64_t>{a, b}), "Exactly the finalized ids are Completed");
    for (const auto& item : completed) {
        ASSERT(item.completed_at.has_value(), "Completed items carry completed_at");
        ASSERT(!item.error.has_value(), "Completed items carry no error");
    }

    auto fresh = store.query(std::nullopt, ItemStatus::New);
    ASSERT((ids_of(fresh) == std::vector<int64_t>{c}), "Untouched item stays New");
}

TEST(test_reset_to_new_clears_and_reenables_claim) {
    int64_t id = store.enqueue("jobs", bytes_of("payload"), std::nullopt);
    store.claim(std::string("jobs"));
    store.set_status(id, ItemStatus::Failed, std::string("transient"));

    store.set_status(id, ItemStatus::New);

    auto items = store.query(std::nullopt, ItemStatus::New);
    ASSERT_EQ(items.size(), 1u, "Item should be New again");
    ASSERT(!items[0].completed_at.has_value(), "Reset clears completed_at");
    ASSERT(!items[0].error.has_value(), "Reset clears error");

    auto again = store.claim(std::string("jobs"));
    ASSERT(again.has_value(), "Reset item is claimable");
    ASSERT_EQ(again->id, id, "Same item is redelivered");
}

TEST(test_mixed_existing_and_missing_ids) {
    int64_t a = store.enqueue("k", std::nullopt, std::nullopt);
    int64_t b = store.enqueue("k", std::nullopt, std::nullopt);

    store.set_status({a, b + 1000, -5, b}, ItemStatus::Completed, std::nullopt);

    auto all = store.query(ItemFilter{});
    ASSERT_EQ(all.size(), 2u, "No rows invented for missing ids");
    for (const auto& item : all) {
        ASSERT(item.status == ItemStatus::Completed, "Existing ids updated");
    }
}

TEST(test_failed_scenario) {
    int64_t id = store.enqueue("a.b", bytes_of("x"), std::nullopt);
    ASSERT_EQ(id, 1, "First item in a fresh store has id 1");

    auto claimed = store.claim(std::string("a.b"));
    ASSERT(claimed && claimed->id == 1, "Claim returns item 1");
    ASSERT(claimed->status == ItemStatus::InProgress, "Claimed item is InProgress");
    ASSERT(!store.claim(std::string("a.b")).has_value(), "Nothing else to claim");

    store.set_status(std::vector<int64_t>{1}, ItemStatus::Failed, std::string("boom"));

    auto failed = store.query(std::nullopt, ItemStatus::Failed);
    ASSERT_EQ(failed.size(), 1u, "One failed item");
    ASSERT_EQ(failed[0].id, 1, "Failed item is item 1");
    ASSERT(failed[0].error && *failed[0].error == "boom", "Error text recorded");
    ASSERT(failed[0].completed_at.has_value(), "Failed item carries completed_at");
}

TEST(test_error_is_overwritten_by_every_update) {
    int64_t id = store.enqueue("k", std::nullopt, std::nullopt);
    store.set_status(id, ItemStatus::Failed, std::string("first"));
    store.set_status(id, ItemStatus::Completed);

    auto items = store.query(ItemFilter{});
    ASSERT(items[0].status == ItemStatus::Completed, "Status updated");
    ASSERT(!items[0].error.has_value(), "Error not re-passed is cleared");

    store.set_status(id, ItemStatus::InProgress, std::string("kept"));
    items = store.query(ItemFilter{});
    ASSERT(items[0].error && *items[0].error == "kept", "Error stored regardless of target status");
    ASSERT(!items[0].completed_at.has_value(), "Non-terminal status clears completed_at");
}

TEST(test_set_status_rejects_unknown_status) {
    int64_t id = store.enqueue("k", std::nullopt, std::nullopt);
    ASSERT_THROWS(store.set_status(id, static_cast<ItemStatus>(7)), InvalidArgument,
                  "Unknown status code should be rejected");
    ASSERT_THROWS(store.set_status(std::vector<int64_t>{}, static_cast<ItemStatus>(-1), std::nullopt),
                  InvalidArgument, "Status is validated even for empty id lists");

    auto items = store.query(ItemFilter{});
    ASSERT(items[0].status == ItemStatus::New, "Rejected update leaves the item alone");
}

// ============================================================================
// QUERY
// ============================================================================

TEST(test_query_filters) {
    int64_t a1 = store.enqueue("a", std::nullopt, std::nullopt);
    int64_t b1 = store.enqueue("b", std::nullopt, std::nullopt);
    int64_t a2 = store.enqueue("a", std::nullopt, std::nullopt);
    store.set_status(a2, ItemStatus::Failed, std::string("bad"));

    ASSERT((ids_of(store.query(ItemFilter{})) == std::vector<int64_t>{a1, b1, a2}), "Unfiltered, ascending id");
    ASSERT((ids_of(store.query(std::string("a"), std::nullopt)) == std::vector<int64_t>{a1, a2}), "By routing key");
    ASSERT((ids_of(store.query(std::nullopt, ItemStatus::New)) == std::vector<int64_t>{a1, b1}), "By status");
    ASSERT((ids_of(store.query(std::string("a"), ItemStatus::Failed)) == std::vector<int64_t>{a2}), "By both");
    ASSERT(store.query(std::string("c"), std::nullopt).empty(), "No match gives an empty result");
    ASSERT(store.query(std::nullopt, ItemStatus::Completed).empty(), "No match gives an empty result");
}

TEST(test_query_created_before) {
    int64_t id = store.enqueue("k", std::nullopt, std::nullopt);

    ItemFilter past;
    past.created_before = std::chrono::system_clock::now() - std::chrono::hours(1);
    ASSERT(store.query(past).empty(), "Nothing is older than an hour");

    ItemFilter future;
    future.created_before = std::chrono::system_clock::now() + std::chrono::hours(1);
    auto items = store.query(future);
    ASSERT_EQ(items.size(), 1u, "Item is older than an hour from now");
    ASSERT_EQ(items[0].id, id, "Same item");
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST(test_concurrent_claims_each_item_once) {
    constexpr int N = 8;
    std::set<int64_t> enqueued;
    for (int i = 0; i < N; ++i) {
        enqueued.insert(store.enqueue(i % 2 == 0 ? "even" : "odd", std::nullopt, std::nullopt));
    }

    std::mutex mutex;
    std::vector<int64_t> claimed;
    std::atomic<int> empty_claims{0};
    std::atomic<int> errors{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&] {
            while (!go.load()) std::this_thread::yield();
            try {
                auto item = store.claim(std::nullopt);
                if (item) {
                    std::lock_guard<std::mutex> lock(mutex);
                    claimed.push_back(item->id);
                } else {
                    ++empty_claims;
                }
            } catch (const std::exception& e) {
                spdlog::error("Concurrent claim failed: {}", e.what());
                ++errors;
            }
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    ASSERT_EQ(errors.load(), 0, "No claim should fail");
    ASSERT_EQ(empty_claims.load(), 0, "With N items and N claimants every claimant gets one");
    std::set<int64_t> unique(claimed.begin(), claimed.end());
    ASSERT_EQ(claimed.size(), unique.size(), "No item delivered twice");
    ASSERT(unique == enqueued, "Every item delivered");
}

TEST(test_concurrent_drain_mixed_keys) {
    constexpr int ITEMS = 60;
    constexpr int WORKERS = 6;
    const std::vector<std::string> keys = {"alpha", "beta", "gamma"};

    for (int i = 0; i < ITEMS; ++i) {
        store.enqueue(keys[i % keys.size()], bytes_of(std::to_string(i)), std::nullopt);
    }

    std::mutex mutex;
    std::vector<int64_t> claimed;
    std::atomic<int> errors{0};

    std::vector<std::thread> threads;
    for (int w = 0; w < WORKERS; ++w) {
        threads.emplace_back([&, w] {
            // Half the workers filter by key, half take anything
            std::optional<std::string> key;
            if (w % 2 == 0) key = keys[w % keys.size()];
            try {
                while (true) {
                    auto item = store.claim(key);
                    if (!item) {
                        if (!key) break;
                        key.reset();
                        continue;
                    }
                    {
                        std::lock_guard<std::mutex> lock(mutex);
                        claimed.push_back(item->id);
                    }
                    store.set_status(item->id, ItemStatus::Completed);
                }
            } catch (const std::exception& e) {
                spdlog::error("Drain worker failed: {}", e.what());
                ++errors;
            }
        });
    }
    for (auto& t : threads) t.join();

    ASSERT_EQ(errors.load(), 0, "No worker should fail");
    std::set<int64_t> unique(claimed.begin(), claimed.end());
    ASSERT_EQ(claimed.size(), static_cast<size_t>(ITEMS), "Every item claimed exactly once");
    ASSERT_EQ(unique.size(), static_cast<size_t>(ITEMS), "No duplicates");
    ASSERT_EQ(store.query(std::nullopt, ItemStatus::Completed).size(), static_cast<size_t>(ITEMS),
              "All items completed");
}

// ============================================================================
// MAIN
// ============================================================================

void run_suite(TestRunner& runner, const std::string& backend, const StoreFactory& make_store) {
    std::cout << std::endl << "=== " << backend << " ===" << std::endl;

    auto run = [&](const std::string& name, void (*fn)(ItemStore&, TestResult&)) {
        runner.run(backend + "/" + name, [&](TestResult& result) {
            auto store = make_store();
            fn(*store, result);
        });
    };

    run("test_enqueue_rejects_empty_routing_key", test_enqueue_rejects_empty_routing_key);
    run("test_enqueue_routing_key_bounds", test_enqueue_routing_key_bounds);
    run("test_claim_empty_store", test_claim_empty_store);
    run("test_claim_unmatched_routing_key", test_claim_unmatched_routing_key);
    run("test_enqueue_claim_round_trip", test_enqueue_claim_round_trip);
    run("test_enqueue_without_payloads", test_enqueue_without_payloads);
    run("test_ids_increase", test_ids_increase);
    run("test_claim_order_within_routing_key", test_claim_order_within_routing_key);
    run("test_claim_any_routing_key_takes_oldest", test_claim_any_routing_key_takes_oldest);
    run("test_claim_does_not_redeliver", test_claim_does_not_redeliver);
    run("test_set_status_empty_ids_is_noop", test_set_status_empty_ids_is_noop);
    run("test_complete_then_query", test_complete_then_query);
    run("test_reset_to_new_clears_and_reenables_claim", test_reset_to_new_clears_and_reenables_claim);
    run("test_mixed_existing_and_missing_ids", test_mixed_existing_and_missing_ids);
    run("test_failed_scenario", test_failed_scenario);
    run("test_error_is_overwritten_by_every_update", test_error_is_overwritten_by_every_update);
    run("test_set_status_rejects_unknown_status", test_set_status_rejects_unknown_status);
    run("test_query_filters", test_query_filters);
    run("test_query_created_before", test_query_created_before);
    run("test_concurrent_claims_each_item_once", test_concurrent_claims_each_item_once);
    run("test_concurrent_drain_mixed_keys", test_concurrent_drain_mixed_keys);
}

int main() {
    spdlog::set_level(spdlog::level::warn);

    TestRunner runner;

    run_suite(runner, "memory", [] { return std::make_shared<MemoryItemStore>(); });

    if (!std::getenv("PG_HOST")) {
        std::cout << std::endl << "Skipping PostgreSQL suite - set PG_HOST to enable" << std::endl;
        return runner.summary();
    }

    try {
        auto db = DatabaseConfig::from_env();
        auto pool = std::make_shared<DatabasePool>(db.connection_string(), 10,
                                                   db.pool_acquisition_timeout,
                                                   db.statement_timeout,
                                                   db.lock_timeout,
                                                   db.idle_timeout);

        std::mt19937 gen(std::random_device{}());
        std::string prefix = "rowq_test_" + std::to_string(gen() % 1000000);
        std::vector<std::string> tables;

        run_suite(runner, "postgres", [&] {
            std::string table = prefix + "_" + std::to_string(tables.size());
            tables.push_back(table);
            initialize_schema(*pool, table);
            return std::make_shared<PgItemStore>(pool, table);
        });

        ScopedConnection conn(pool.get());
        for (const auto& table : tables) {
            auto dropped = QueryResult(conn->exec("DROP TABLE IF EXISTS " + quote_table_name(table)));
            if (!dropped.is_success()) {
                spdlog::warn("Failed to drop {}: {}", table, dropped.error_message());
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "PostgreSQL suite aborted: " << e.what() << std::endl;
        return 1;
    }

    return runner.summary();
}
