/**
 * test_pool.cpp - Tests for the bounded lazy pool
 */

#include <gtest/gtest.h>
#include <dbpool/functions.hpp>
#include <dbpool/pool.hpp>
#include <dbpool/registry.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

struct Element {
    int id;
};

// Simple gate: threads wait until open() is called
class Gate {
public:
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

} // namespace

class PoolTest : public ::testing::Test {
protected:
    std::atomic<int> created_{0};

    dbpool::Pool<Element>::factory_t factory() {
        return [this] { return std::make_unique<Element>(Element{++created_}); };
    }
};

TEST_F(PoolTest, FactoryNotCalledUntilFirstCheckout) {
    dbpool::Pool<Element> pool(3, factory());
    EXPECT_EQ(created_.load(), 0);
    EXPECT_EQ(pool.size(), 0u);

    int id = pool.get([](Element& e) { return e.id; });
    EXPECT_EQ(id, 1);
    EXPECT_EQ(created_.load(), 1);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.idle_count(), 1u);
}

TEST_F(PoolTest, IdleElementIsReused) {
    dbpool::Pool<Element> pool(3, factory());
    pool.get([](Element&) {});
    pool.get([](Element&) {});
    pool.get([](Element&) {});
    EXPECT_EQ(created_.load(), 1);
}

TEST_F(PoolTest, ZeroCapacityRejected) {
    EXPECT_THROW(dbpool::Pool<Element>(0, factory()), std::invalid_argument);
}

TEST_F(PoolTest, ElementReturnedWhenBlockThrows) {
    dbpool::Pool<Element> pool(2, factory());
    EXPECT_THROW(pool.get([](Element&) { throw std::runtime_error("fail"); }), std::runtime_error);
    EXPECT_EQ(pool.idle_count(), 1u);

    pool.get([](Element& e) { EXPECT_EQ(e.id, 1); });
    EXPECT_EQ(created_.load(), 1);
}

TEST_F(PoolTest, ExcessCheckoutBlocksUntilRelease) {
    dbpool::Pool<Element> pool(2, factory());
    Gate gate;
    std::atomic<int> inside{0};
    std::atomic<int> finished{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&] {
            pool.get([&](Element&) {
                ++inside;
                gate.wait();
            });
            ++finished;
        });
    }

    // Two get in, the third waits for a slot
    for (int i = 0; i < 200 && inside.load() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(inside.load(), 2);
    EXPECT_EQ(pool.size(), 2u);

    gate.open();
    for (auto& t : threads) t.join();

    EXPECT_EQ(inside.load(), 3);
    EXPECT_EQ(finished.load(), 3);
    EXPECT_EQ(created_.load(), 2);
}

TEST_F(PoolTest, ConcurrentCheckoutsGetDistinctElements) {
    dbpool::Pool<Element> pool(4, factory());
    std::mutex ids_mutex;
    std::set<Element*> in_use;
    std::atomic<bool> overlap{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                pool.get([&](Element& e) {
                    {
                        std::lock_guard<std::mutex> lock(ids_mutex);
                        if (!in_use.insert(&e).second) overlap = true;
                    }
                    std::this_thread::sleep_for(std::chrono::microseconds(100));
                    std::lock_guard<std::mutex> lock(ids_mutex);
                    in_use.erase(&e);
                });
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_FALSE(overlap.load());
    EXPECT_LE(created_.load(), 4);
}

TEST_F(PoolTest, FactoryFailureReportedToCallerAndSlotFreed) {
    std::atomic<int> attempts{0};
    dbpool::Pool<Element> pool(2, [&]() -> std::unique_ptr<Element> {
        if (++attempts == 1) {
            throw std::runtime_error("cannot open");
        }
        return std::make_unique<Element>(Element{attempts.load()});
    });

    EXPECT_THROW(pool.get([](Element&) {}), std::runtime_error);
    EXPECT_EQ(pool.size(), 0u);

    int id = pool.get([](Element& e) { return e.id; });
    EXPECT_EQ(id, 2);
}

TEST_F(PoolTest, NullFactoryResultIsAnError) {
    dbpool::Pool<Element> pool(2, [] { return std::unique_ptr<Element>(); });
    EXPECT_THROW(pool.get([](Element&) {}), std::logic_error);
    EXPECT_EQ(pool.size(), 0u);
}

TEST_F(PoolTest, ForEachVisitsLiveElements) {
    dbpool::Pool<Element> pool(3, factory());
    Gate gate;
    std::atomic<bool> checked_out{false};

    pool.get([](Element&) {});
    std::thread holder([&] {
        pool.get([&](Element&) {
            checked_out = true;
            gate.wait();
        });
    });
    while (!checked_out) {
        std::this_thread::yield();
    }

    // The holder reuses the idle element, then another is created
    pool.get([](Element&) {});
    ASSERT_EQ(pool.size(), 2u);

    std::set<int> visited;
    pool.for_each([&](Element& e) { visited.insert(e.id); });
    EXPECT_EQ(visited, (std::set<int>{1, 2}));

    gate.open();
    holder.join();
}

TEST_F(PoolTest, ForEachWaitsForElementUnderConstruction) {
    Gate factory_gate;
    std::atomic<bool> constructing{false};
    dbpool::Pool<Element> pool(3, [&] {
        constructing = true;
        factory_gate.wait();
        return std::make_unique<Element>(Element{++created_});
    });

    std::thread creator([&] {
        pool.get([](Element&) {});
    });
    while (!constructing) {
        std::this_thread::yield();
    }

    std::atomic<bool> visit_done{false};
    std::set<int> visited;
    std::thread visitor([&] {
        pool.for_each([&](Element& e) { visited.insert(e.id); });
        visit_done = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(visit_done.load());

    factory_gate.open();
    creator.join();
    visitor.join();

    EXPECT_EQ(visited, (std::set<int>{1}));
}

TEST_F(PoolTest, ForEachVisitorDoesNotBlockCheckouts) {
    dbpool::Pool<Element> pool(3, factory());
    pool.get([](Element&) {});

    bool nested_done = false;
    pool.for_each([&](Element&) {
        // Another thread checks out while the visitor is still running
        auto nested = std::async(std::launch::async, [&] {
            pool.get([](Element&) {});
            return pool.size();
        });
        ASSERT_EQ(nested.wait_for(std::chrono::seconds(5)), std::future_status::ready);
        EXPECT_EQ(nested.get(), 1u);
        nested_done = true;
    });
    EXPECT_TRUE(nested_done);
}

TEST(PoolLifetimeTest, ClearDuringVisitKeepsElementAlive) {
    struct Tracked {
        explicit Tracked(std::atomic<int>* counter) : destroyed(counter) {}
        ~Tracked() { ++*destroyed; }
        std::atomic<int>* destroyed;
    };

    std::atomic<int> destroyed{0};
    dbpool::Pool<Tracked> pool(2, [&] { return std::make_unique<Tracked>(&destroyed); });
    pool.get([](Tracked&) {});

    pool.for_each([&](Tracked&) {
        EXPECT_EQ(pool.clear(), 1u);
        EXPECT_EQ(pool.size(), 0u);
        EXPECT_EQ(destroyed.load(), 0);
    });
    EXPECT_EQ(destroyed.load(), 1);
}

TEST_F(PoolTest, ClearEvictsIdleElementsOnly) {
    dbpool::Pool<Element> pool(3, factory());
    Gate gate;
    std::atomic<bool> checked_out{false};

    std::thread holder([&] {
        pool.get([&](Element&) {
            checked_out = true;
            gate.wait();
        });
    });
    while (!checked_out) {
        std::this_thread::yield();
    }
    pool.get([](Element&) {});
    ASSERT_EQ(pool.size(), 2u);

    EXPECT_EQ(pool.clear(), 1u);
    EXPECT_EQ(pool.size(), 1u);

    gate.open();
    holder.join();
    EXPECT_EQ(pool.idle_count(), 1u);

    EXPECT_EQ(pool.clear(), 1u);
    EXPECT_EQ(pool.size(), 0u);

    // Lazily rebuilt
    int id = pool.get([](Element& e) { return e.id; });
    EXPECT_EQ(id, 3);
}

// ============================================================================
// Registry
// ============================================================================

namespace {

dbpool::Function constant(const std::string& name, int argc, int64_t value) {
    return dbpool::Function(name, argc, [value](sqlite3_context* ctx, int, sqlite3_value**) {
        dbpool::result_int64(ctx, value);
    });
}

} // namespace

TEST(RegistryTest, InsertReplacesSameIdentity) {
    dbpool::Registry<dbpool::Function> registry;
    EXPECT_FALSE(registry.insert(constant("answer", 0, 1)));
    EXPECT_TRUE(registry.insert(constant("ANSWER", 0, 2)));
    EXPECT_EQ(registry.size(), 1u);

    auto defs = registry.snapshot();
    ASSERT_EQ(defs.size(), 1u);
    EXPECT_EQ(defs[0].name(), "ANSWER");
}

TEST(RegistryTest, ArgumentCountIsPartOfIdentity) {
    dbpool::Registry<dbpool::Function> registry;
    registry.insert(constant("f", 0, 1));
    registry.insert(constant("f", 1, 1));
    EXPECT_EQ(registry.size(), 2u);

    EXPECT_TRUE(registry.erase(constant("F", 1, 0)));
    EXPECT_FALSE(registry.erase(constant("f", 1, 0)));
    EXPECT_TRUE(registry.contains(constant("f", 0, 0)));
    EXPECT_FALSE(registry.contains(constant("f", 1, 0)));
}

TEST(RegistryTest, CollationsMatchByName) {
    auto compare = [](const std::string& a, const std::string& b) { return a.compare(b); };
    dbpool::Registry<dbpool::Collation> registry;
    registry.insert(dbpool::Collation("nocase2", compare));
    EXPECT_TRUE(registry.insert(dbpool::Collation("NoCase2", compare)));
    EXPECT_TRUE(registry.erase(dbpool::Collation("NOCASE2", compare)));
    EXPECT_EQ(registry.size(), 0u);
}
