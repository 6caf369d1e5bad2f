#pragma once
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <vector>

struct sqlite3;

// Bounded set of SQLite connections to one database file. A connection is
// only ever used by the thread holding its lease.
class ConnectionPool {
public:
    class Lease {
    public:
        Lease(ConnectionPool& pool, sqlite3* db);
        Lease(Lease&& other) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;
        ~Lease();

        sqlite3* get() const { return db_; }

    private:
        ConnectionPool* pool_;
        sqlite3* db_;
    };

    ConnectionPool(std::filesystem::path db_path, std::size_t max_connections);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Blocks while every connection is leased out.
    Lease acquire();

    const std::filesystem::path& path() const { return db_path_; }

private:
    std::filesystem::path db_path_;
    std::size_t max_connections_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<sqlite3*> idle_;
    std::size_t open_count_{0};

    sqlite3* open();
    void release(sqlite3* db);
};
