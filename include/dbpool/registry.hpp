/**
 * dbpool/registry.hpp - Replace-by-identity set of definitions
 *
 * Part of dbpool - concurrent access to a single SQLite database.
 *
 * Holds at most one definition per identity (Def::key()). Inserting a
 * definition whose identity is already present replaces the old one.
 * All members are safe to call from any thread.
 */

#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace dbpool {

template<typename Def>
class Registry {
public:
    // Returns true when an existing definition was replaced
    bool insert(const Def& def) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto key = def.key();
        bool replaced = entries_.erase(key) > 0;
        entries_.emplace(std::move(key), def);
        return replaced;
    }

    // Returns true when a definition was removed
    bool erase(const Def& def) {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(def.key()) > 0;
    }

    bool contains(const Def& def) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.count(def.key()) > 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    // Current contents, by value
    std::vector<Def> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Def> defs;
        defs.reserve(entries_.size());
        for (const auto& entry : entries_) {
            defs.push_back(entry.second);
        }
        return defs;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Def> entries_;
};

} // namespace dbpool
