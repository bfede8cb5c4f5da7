#pragma once

#include "infrastructure/database/Database.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace vlanvision::test {

/**
 * @brief Migrated database file in the temp directory, removed on destruction.
 */
class TestDatabase {
public:
    explicit TestDatabase(const std::string& name = "vlanvision_test.db")
        : dbPath_(std::filesystem::temp_directory_path() / name) {
        removeFiles();
        db_ = std::make_shared<infra::Database>(dbPath_.string());
        db_->runMigrations();
    }

    ~TestDatabase() {
        db_.reset();
        removeFiles();
    }

    TestDatabase(const TestDatabase&) = delete;
    TestDatabase& operator=(const TestDatabase&) = delete;

    std::shared_ptr<infra::Database> get() { return db_; }
    [[nodiscard]] const std::filesystem::path& path() const { return dbPath_; }

    /// Closes and reopens the file, as a restart would.
    std::shared_ptr<infra::Database> reopen() {
        db_.reset();
        db_ = std::make_shared<infra::Database>(dbPath_.string());
        db_->runMigrations();
        return db_;
    }

private:
    void removeFiles() {
        std::error_code ec;
        std::filesystem::remove(dbPath_, ec);
        std::filesystem::remove(dbPath_.string() + "-wal", ec);
        std::filesystem::remove(dbPath_.string() + "-shm", ec);
    }

    std::filesystem::path dbPath_;
    std::shared_ptr<infra::Database> db_;
};

/// Timestamps are stored at second resolution.
inline std::chrono::system_clock::time_point storedNow() {
    return std::chrono::time_point_cast<std::chrono::seconds>(std::chrono::system_clock::now());
}

} // namespace vlanvision::test
