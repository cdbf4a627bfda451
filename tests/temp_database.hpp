/**
 * temp_database.hpp - Unique database file for a test, removed afterwards
 */

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

class TempDatabasePath {
public:
    TempDatabasePath() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = (std::filesystem::temp_directory_path() /
                 ("dbpool_test_" + std::to_string(stamp) + "_" +
                  std::to_string(counter.fetch_add(1)) + ".sqlite")).string();
    }

    ~TempDatabasePath() {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
            std::filesystem::remove(path_ + suffix, ec);
        }
    }

    TempDatabasePath(const TempDatabasePath&) = delete;
    TempDatabasePath& operator=(const TempDatabasePath&) = delete;

    const std::string& str() const { return path_; }

private:
    std::string path_;
};
