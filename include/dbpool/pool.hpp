/**
 * dbpool/pool.hpp - Bounded pool of lazily constructed elements
 *
 * Part of dbpool - concurrent access to a single SQLite database.
 *
 * Pool<T> holds at most maximum_count elements. Elements are created on
 * demand by a factory the first time a checkout finds no idle element and
 * capacity remains. When every slot is checked out, get() blocks until one is
 * returned.
 *
 *   dbpool::Pool<Connection> pool(4, [] { return std::make_unique<Connection>(); });
 *   auto rows = pool.get([](Connection& c) { return c.fetch(); });
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <vector>

namespace dbpool {

template<typename T>
class Pool {
public:
    using factory_t = std::function<std::unique_ptr<T>()>;

    Pool(size_t maximum_count, factory_t make_element)
        : maximum_count_(maximum_count)
        , make_element_(std::move(make_element)) {
        if (maximum_count_ == 0) {
            throw std::invalid_argument("Pool capacity must be at least 1");
        }
    }

    // Non-copyable
    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;

    /**
     * Check out an element, run block(T&), and return the element to the
     * pool on every exit path.
     *
     * Blocks while all slots are checked out. If an element has to be
     * created and the factory throws, the exception propagates to this
     * caller and the slot is freed for others.
     */
    template<typename Fn>
    auto get(Fn&& block) -> decltype(block(std::declval<T&>())) {
        Item* item = acquire();
        Checkout checkout(*this, item);
        return block(*item->element);
    }

    /**
     * Visit every live element, idle or checked out.
     *
     * Waits for in-flight element constructions first, so that an element
     * built concurrently is either visited or was built after the caller's
     * preceding state change. The visitor runs without the pool lock:
     * checkouts and returns proceed meanwhile, and clear() cannot destroy
     * an element that is being visited.
     */
    template<typename Fn>
    void for_each(Fn&& visitor) {
        std::vector<std::shared_ptr<Item>> live;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return constructing_ == 0; });
            live = items_;
        }
        for (auto& item : live) {
            visitor(*item->element);
        }
    }

    /**
     * Destroy every idle element. Checked-out elements are kept.
     * @return Number of evicted elements
     */
    size_t clear() {
        std::vector<std::shared_ptr<Item>> evicted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<std::shared_ptr<Item>> kept;
            for (auto& item : items_) {
                if (item->available) {
                    evicted.push_back(std::move(item));
                } else {
                    kept.push_back(std::move(item));
                }
            }
            items_ = std::move(kept);
        }
        cv_.notify_all();
        // Destroyed outside the lock, or by the last for_each() visiting them
        return evicted.size();
    }

    size_t maximum_count() const { return maximum_count_; }

    // Live elements, idle or checked out
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t idle_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& item : items_) {
            if (item->available) ++count;
        }
        return count;
    }

private:
    struct Item {
        std::unique_ptr<T> element;
        bool available = false;
    };

    // Returns the item on scope exit
    class Checkout {
    public:
        Checkout(Pool& pool, Item* item) : pool_(pool), item_(item) {}
        ~Checkout() { pool_.release(item_); }

        Checkout(const Checkout&) = delete;
        Checkout& operator=(const Checkout&) = delete;

    private:
        Pool& pool_;
        Item* item_;
    };

    size_t maximum_count_;
    factory_t make_element_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<std::shared_ptr<Item>> items_;
    size_t constructing_ = 0;  // Slots reserved by running factories

    Item* find_available() {
        for (auto& item : items_) {
            if (item->available) return item.get();
        }
        return nullptr;
    }

    Item* acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] {
            return find_available() != nullptr
                || items_.size() + constructing_ < maximum_count_;
        });

        if (Item* item = find_available()) {
            item->available = false;
            return item;
        }

        // Build a new element without holding the lock
        ++constructing_;
        lock.unlock();

        std::unique_ptr<T> element;
        try {
            element = make_element_();
            if (!element) {
                throw std::logic_error("Pool factory returned no element");
            }
        } catch (...) {
            lock.lock();
            --constructing_;
            lock.unlock();
            cv_.notify_all();
            throw;
        }

        lock.lock();
        --constructing_;
        auto item = std::make_shared<Item>();
        item->element = std::move(element);
        Item* raw = item.get();
        items_.push_back(std::move(item));
        lock.unlock();
        // for_each() may be waiting for constructions to finish
        cv_.notify_all();
        return raw;
    }

    void release(Item* item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            item->available = true;
        }
        cv_.notify_all();
    }
};

} // namespace dbpool
