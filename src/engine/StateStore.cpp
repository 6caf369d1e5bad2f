#include "StateStore.hpp"
#include "Log.hpp"
#include "PartitionAssigner.hpp"
#include <sqlite3.h>
#include <string>

namespace {

void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "sqlite error";
        sqlite3_free(err);
        throw StoreError(msg);
    }
}

// Prepared statement, finalized on every exit path.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &st_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, const std::string& v) {
        return check(sqlite3_bind_text(st_, idx, v.c_str(), -1, SQLITE_TRANSIENT));
    }
    Statement& bind(int idx, const char* v) {
        return check(sqlite3_bind_text(st_, idx, v, -1, SQLITE_TRANSIENT));
    }
    Statement& bind(int idx, int v) {
        return check(sqlite3_bind_int(st_, idx, v));
    }
    Statement& bind(int idx, const std::optional<std::string>& v) {
        if (v.has_value()) return bind(idx, *v);
        return check(sqlite3_bind_null(st_, idx));
    }

    // true while rows are available, false once done
    bool step() {
        int rc = sqlite3_step(st_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError(std::string("sqlite step failed: ") + sqlite3_errmsg(db_));
    }

    // Runs a write statement, returns the number of changed rows.
    int run() {
        while (step()) {}
        return sqlite3_changes(db_);
    }

    std::string text(int col) const {
        const unsigned char* v = sqlite3_column_text(st_, col);
        return v ? reinterpret_cast<const char*>(v) : std::string();
    }
    std::optional<std::string> optText(int col) const {
        if (sqlite3_column_type(st_, col) == SQLITE_NULL) return std::nullopt;
        return text(col);
    }
    int integer(int col) const { return sqlite3_column_int(st_, col); }

    Status status(int col) const {
        auto s = parseStatus(text(col));
        if (!s) throw StoreError("unexpected status value '" + text(col) + "'");
        return *s;
    }

private:
    sqlite3* db_;
    sqlite3_stmt* st_{};

    Statement& check(int rc) {
        if (rc != SQLITE_OK) throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
        return *this;
    }
};

// BEGIN IMMEDIATE takes the write lock up front, so the busy timeout applies
// instead of a mid-transaction SQLITE_BUSY.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE;"); }
    ~Transaction() {
        if (done_) return;
        if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            logError(std::string("rollback failed: ") + sqlite3_errmsg(db_));
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec(db_, "COMMIT;");
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_{false};
};

std::string describe(const std::string& workitem_id, const std::string& job_id) {
    return workitem_id + " (job " + job_id + ")";
}

WorkItemRow readWorkItem(const Statement& st) {
    WorkItemRow r{};
    r.workitem_id = st.text(0);
    r.job_id = st.text(1);
    r.name = st.text(2);
    r.status = st.status(3);
    r.files_total = st.integer(4);
    r.files_processed = st.integer(5);
    r.error_message = st.optText(6);
    r.started_at = st.optText(7);
    r.completed_at = st.optText(8);
    return r;
}

const char* kWorkItemColumns =
    "workitem_id,job_id,workitem_name,status,files_total,files_processed,"
    "error_message,started_at,completed_at";

} // namespace

StateStore::StateStore(const std::filesystem::path& db_path, std::size_t max_connections)
    : pool_(db_path, max_connections) {
    ensureSchema();
}

void StateStore::ensureSchema() {
    auto lease = pool_.acquire();
    exec(lease.get(),
        "CREATE TABLE IF NOT EXISTS workitems ("
        "  workitem_id TEXT NOT NULL,"
        "  workitem_name TEXT NOT NULL,"
        "  job_id TEXT NOT NULL,"
        "  status TEXT NOT NULL DEFAULT 'pending',"
        "  files_total INTEGER NOT NULL DEFAULT 0,"
        "  files_processed INTEGER NOT NULL DEFAULT 0,"
        "  error_message TEXT,"
        "  started_at TEXT,"
        "  completed_at TEXT,"
        "  PRIMARY KEY (workitem_id, job_id)"
        ");"
    );
    exec(lease.get(),
        "CREATE TABLE IF NOT EXISTS files ("
        "  workitem_id TEXT NOT NULL,"
        "  job_id TEXT NOT NULL,"
        "  filename TEXT NOT NULL,"
        "  source_uri TEXT NOT NULL,"
        "  status TEXT NOT NULL DEFAULT 'pending',"
        "  error_message TEXT,"
        "  uploaded_at TEXT,"
        "  PRIMARY KEY (workitem_id, job_id, filename),"
        "  FOREIGN KEY (workitem_id, job_id) REFERENCES workitems(workitem_id, job_id)"
        ");"
    );
    exec(lease.get(), "CREATE INDEX IF NOT EXISTS idx_workitems_status ON workitems(status);");
    exec(lease.get(), "CREATE INDEX IF NOT EXISTS idx_files_status ON files(status);");
}

void StateStore::upsertWorkItem(const std::string& workitem_id, const std::string& job_id,
                                const std::string& name) {
    auto lease = pool_.acquire();
    Statement st(lease.get(),
        "INSERT OR IGNORE INTO workitems(workitem_id,workitem_name,job_id,status) "
        "VALUES(?,?,?,'pending');");
    st.bind(1, workitem_id).bind(2, name).bind(3, job_id);
    st.run();
}

void StateStore::setWorkItemStatus(const std::string& workitem_id, const std::string& job_id, Status status,
                                   const std::optional<std::string>& error) {
    auto lease = pool_.acquire();
    const std::string now = utcTimestamp();
    int changed = 0;

    if (status == Status::InProgress) {
        Statement st(lease.get(),
            "UPDATE workitems SET status=?, started_at=?, error_message=? "
            "WHERE workitem_id=? AND job_id=?;");
        st.bind(1, toString(status)).bind(2, now).bind(3, error).bind(4, workitem_id).bind(5, job_id);
        changed = st.run();
    }
    else if (isTerminal(status)) {
        Statement st(lease.get(),
            "UPDATE workitems SET status=?, completed_at=?, error_message=? "
            "WHERE workitem_id=? AND job_id=?;");
        st.bind(1, toString(status)).bind(2, now).bind(3, error).bind(4, workitem_id).bind(5, job_id);
        changed = st.run();
    }
    else {
        Statement st(lease.get(),
            "UPDATE workitems SET status=?, error_message=? WHERE workitem_id=? AND job_id=?;");
        st.bind(1, toString(status)).bind(2, error).bind(3, workitem_id).bind(4, job_id);
        changed = st.run();
    }

    if (changed == 0) throw StoreError("unknown work item " + describe(workitem_id, job_id));
}

void StateStore::setFilesTotal(const std::string& workitem_id, const std::string& job_id, int files_total) {
    auto lease = pool_.acquire();
    Statement st(lease.get(), "UPDATE workitems SET files_total=? WHERE workitem_id=? AND job_id=?;");
    st.bind(1, files_total).bind(2, workitem_id).bind(3, job_id);
    if (st.run() == 0) throw StoreError("unknown work item " + describe(workitem_id, job_id));
}

void StateStore::upsertFile(const std::string& workitem_id, const std::string& job_id,
                            const std::string& filename, const std::string& source_uri) {
    auto lease = pool_.acquire();
    Statement st(lease.get(),
        "INSERT OR IGNORE INTO files(workitem_id,job_id,filename,source_uri,status) "
        "VALUES(?,?,?,?,'pending');");
    st.bind(1, workitem_id).bind(2, job_id).bind(3, filename).bind(4, source_uri);
    st.run();
}

bool StateStore::claimFile(const std::string& workitem_id, const std::string& job_id,
                           const std::string& filename) {
    auto lease = pool_.acquire();
    Statement st(lease.get(),
        "UPDATE files SET status='in_progress', error_message=NULL, uploaded_at=? "
        "WHERE workitem_id=? AND job_id=? AND filename=? "
        "  AND status IN ('pending','failed');");
    st.bind(1, utcTimestamp()).bind(2, workitem_id).bind(3, job_id).bind(4, filename);
    return st.run() == 1;
}

void StateStore::setFileStatus(const std::string& workitem_id, const std::string& job_id,
                               const std::string& filename, Status status,
                               const std::optional<std::string>& error) {
    auto lease = pool_.acquire();
    const std::string now = utcTimestamp();
    Transaction tx(lease.get());

    if (status == Status::Completed) {
        Statement upd(lease.get(),
            "UPDATE files SET status='completed', error_message=NULL, uploaded_at=? "
            "WHERE workitem_id=? AND job_id=? AND filename=? AND status<>'completed';");
        upd.bind(1, now).bind(2, workitem_id).bind(3, job_id).bind(4, filename);
        if (upd.run() == 1) {
            Statement bump(lease.get(),
                "UPDATE workitems SET files_processed=files_processed+1 "
                "WHERE workitem_id=? AND job_id=?;");
            bump.bind(1, workitem_id).bind(2, job_id);
            bump.run();
        }
        else {
            Statement probe(lease.get(),
                "SELECT 1 FROM files WHERE workitem_id=? AND job_id=? AND filename=?;");
            probe.bind(1, workitem_id).bind(2, job_id).bind(3, filename);
            if (!probe.step()) {
                throw StoreError("unknown file " + filename + " for " + describe(workitem_id, job_id));
            }
        }
    }
    else {
        Statement upd(lease.get(),
            "UPDATE files SET status=?, error_message=?, uploaded_at=? "
            "WHERE workitem_id=? AND job_id=? AND filename=?;");
        upd.bind(1, toString(status)).bind(2, error).bind(3, now)
           .bind(4, workitem_id).bind(5, job_id).bind(6, filename);
        if (upd.run() == 0) {
            throw StoreError("unknown file " + filename + " for " + describe(workitem_id, job_id));
        }
    }

    tx.commit();
}

std::optional<Status> StateStore::getWorkItemStatus(const std::string& workitem_id, const std::string& job_id) {
    auto lease = pool_.acquire();
    Statement st(lease.get(), "SELECT status FROM workitems WHERE workitem_id=? AND job_id=?;");
    st.bind(1, workitem_id).bind(2, job_id);
    if (!st.step()) return std::nullopt;
    return st.status(0);
}

std::optional<Status> StateStore::getFileStatus(const std::string& workitem_id, const std::string& job_id,
                                                const std::string& filename) {
    auto lease = pool_.acquire();
    Statement st(lease.get(),
        "SELECT status FROM files WHERE workitem_id=? AND job_id=? AND filename=?;");
    st.bind(1, workitem_id).bind(2, job_id).bind(3, filename);
    if (!st.step()) return std::nullopt;
    return st.status(0);
}

std::optional<WorkItemRow> StateStore::getWorkItem(const std::string& workitem_id, const std::string& job_id) {
    auto lease = pool_.acquire();
    std::string sql = std::string("SELECT ") + kWorkItemColumns +
        " FROM workitems WHERE workitem_id=? AND job_id=?;";
    Statement st(lease.get(), sql.c_str());
    st.bind(1, workitem_id).bind(2, job_id);
    if (!st.step()) return std::nullopt;
    return readWorkItem(st);
}

std::optional<FileRow> StateStore::getFile(const std::string& workitem_id, const std::string& job_id,
                                           const std::string& filename) {
    auto lease = pool_.acquire();
    Statement st(lease.get(),
        "SELECT workitem_id,job_id,filename,source_uri,status,error_message,uploaded_at "
        "FROM files WHERE workitem_id=? AND job_id=? AND filename=?;");
    st.bind(1, workitem_id).bind(2, job_id).bind(3, filename);
    if (!st.step()) return std::nullopt;

    FileRow r{};
    r.workitem_id = st.text(0);
    r.job_id = st.text(1);
    r.filename = st.text(2);
    r.source_uri = st.text(3);
    r.status = st.status(4);
    r.error_message = st.optText(5);
    r.uploaded_at = st.optText(6);
    return r;
}

std::vector<WorkItemKey> StateStore::getPendingWorkItems() {
    auto lease = pool_.acquire();
    Statement st(lease.get(),
        "SELECT workitem_id, job_id FROM workitems "
        "WHERE status IN ('pending','failed','in_progress') "
        "ORDER BY workitem_id, job_id;");
    std::vector<WorkItemKey> keys;
    while (st.step()) {
        keys.push_back(WorkItemKey{st.text(0), st.text(1)});
    }
    return keys;
}

std::vector<WorkItemRow> StateStore::listWorkItems(std::optional<Status> status) {
    auto lease = pool_.acquire();
    std::string sql = std::string("SELECT ") + kWorkItemColumns + " FROM workitems";
    if (status) sql += " WHERE status=?";
    sql += " ORDER BY workitem_id, job_id;";

    Statement st(lease.get(), sql.c_str());
    if (status) st.bind(1, toString(*status));

    std::vector<WorkItemRow> rows;
    while (st.step()) rows.push_back(readWorkItem(st));
    return rows;
}

std::vector<CompletedFileRow> StateStore::listCompletedFiles() {
    auto lease = pool_.acquire();
    Statement st(lease.get(),
        "SELECT w.workitem_id, w.workitem_name, f.filename "
        "FROM files f "
        "JOIN workitems w ON f.workitem_id = w.workitem_id AND f.job_id = w.job_id "
        "WHERE f.status = 'completed' "
        "ORDER BY w.workitem_id, f.filename;");
    std::vector<CompletedFileRow> rows;
    while (st.step()) {
        rows.push_back(CompletedFileRow{st.text(0), st.text(1), st.text(2)});
    }
    return rows;
}

int StateStore::rearmStrandedFiles(const PartitionAssigner* partition) {
    auto lease = pool_.acquire();
    if (!partition) {
        Statement st(lease.get(),
            "UPDATE files SET status='pending', error_message=NULL WHERE status='in_progress';");
        return st.run();
    }

    std::vector<WorkItemKey> owned;
    {
        Statement st(lease.get(), "SELECT DISTINCT workitem_id, job_id FROM files WHERE status='in_progress';");
        while (st.step()) {
            WorkItemKey key{st.text(0), st.text(1)};
            if (partition->belongs(key.workitem_id)) owned.push_back(std::move(key));
        }
    }

    int rearmed = 0;
    Transaction tx(lease.get());
    for (const auto& key : owned) {
        Statement st(lease.get(),
            "UPDATE files SET status='pending', error_message=NULL "
            "WHERE status='in_progress' AND workitem_id=? AND job_id=?;");
        st.bind(1, key.workitem_id).bind(2, key.job_id);
        rearmed += st.run();
    }
    tx.commit();
    return rearmed;
}

Summary StateStore::getSummary() {
    auto lease = pool_.acquire();
    Summary s{};

    Statement byStatus(lease.get(), "SELECT status, COUNT(*) FROM workitems GROUP BY status;");
    while (byStatus.step()) {
        int n = byStatus.integer(1);
        s.total += n;
        switch (byStatus.status(0)) {
        case Status::Pending:    s.pending = n; break;
        case Status::InProgress: s.in_progress = n; break;
        case Status::Completed:  s.completed = n; break;
        case Status::Failed:     s.failed = n; break;
        }
    }

    Statement files(lease.get(),
        "SELECT COUNT(*), COALESCE(SUM(status='completed'),0) FROM files;");
    if (files.step()) {
        s.total_files = files.integer(0);
        s.processed_files = files.integer(1);
    }
    return s;
}
