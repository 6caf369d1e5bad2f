#include "ConnectionPool.hpp"
#include "common.hpp"
#include <sqlite3.h>
#include <string>

static constexpr int kBusyTimeoutMs = 30000;

ConnectionPool::Lease::Lease(ConnectionPool& pool, sqlite3* db) : pool_(&pool), db_(db) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept : pool_(other.pool_), db_(other.db_) {
    other.pool_ = nullptr;
    other.db_ = nullptr;
}

ConnectionPool::Lease::~Lease() {
    if (pool_ && db_) pool_->release(db_);
}

ConnectionPool::ConnectionPool(std::filesystem::path db_path, std::size_t max_connections)
    : db_path_(std::move(db_path)), max_connections_(max_connections) {
    if (max_connections_ == 0) {
        throw StoreError("connection pool needs at least one connection");
    }
}

ConnectionPool::~ConnectionPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto* db : idle_) sqlite3_close(db);
    idle_.clear();
}

sqlite3* ConnectionPool::open() {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(db_path_.string().c_str(), &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) sqlite3_close(db);
        throw StoreError("sqlite3_open failed for " + db_path_.string() + ": " + msg);
    }
    sqlite3_busy_timeout(db, kBusyTimeoutMs);

    const char* pragmas =
        "PRAGMA journal_mode=WAL;"
        "PRAGMA synchronous=NORMAL;"
        "PRAGMA foreign_keys=ON;";
    char* err = nullptr;
    if (sqlite3_exec(db, pragmas, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "sqlite error";
        sqlite3_free(err);
        sqlite3_close(db);
        throw StoreError(msg);
    }
    return db;
}

ConnectionPool::Lease ConnectionPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return !idle_.empty() || open_count_ < max_connections_; });
    if (!idle_.empty()) {
        sqlite3* db = idle_.back();
        idle_.pop_back();
        return Lease(*this, db);
    }
    ++open_count_;
    lock.unlock();

    try {
        return Lease(*this, open());
    }
    catch (...) {
        {
            std::lock_guard<std::mutex> relock(mutex_);
            --open_count_;
        }
        cv_.notify_one();
        throw;
    }
}

void ConnectionPool::release(sqlite3* db) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(db);
    }
    cv_.notify_one();
}
