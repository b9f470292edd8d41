#include "SqliteEventStore.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace uplink::adapters {

namespace {

// Finalizes the prepared statement when it goes out of scope
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            stmt_ = nullptr;
        }
    }
    
    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }
    
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    
    bool valid() const { return stmt_ != nullptr; }
    sqlite3_stmt* get() const { return stmt_; }
    
    bool bindText(int index, const std::string& value) {
        return sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                                 SQLITE_TRANSIENT) == SQLITE_OK;
    }
    
    bool bindInt64(int index, int64_t value) {
        return sqlite3_bind_int64(stmt_, index, value) == SQLITE_OK;
    }
    
    int step() { return sqlite3_step(stmt_); }
    
    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }
    
    std::string columnText(int column) const {
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
        if (!text) {
            return {};
        }
        return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
    }
    
    int64_t columnInt64(int column) const {
        return sqlite3_column_int64(stmt_, column);
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

// Rolls back unless commit() succeeded
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        active_ = sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK;
    }
    
    ~Transaction() {
        if (active_) {
            sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }
    
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    
    bool active() const { return active_; }
    
    bool commit() {
        if (!active_) {
            return false;
        }
        active_ = false;
        return sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) == SQLITE_OK;
    }

private:
    sqlite3* db_;
    bool active_ = false;
};

constexpr const char* kCreateTableSql =
    "CREATE TABLE IF NOT EXISTS events ("
    " _id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " type TEXT NOT NULL,"
    " event_id TEXT NOT NULL UNIQUE,"
    " data TEXT NOT NULL,"
    " time TEXT NOT NULL,"
    " session_id TEXT NOT NULL DEFAULT '',"
    " event_size INTEGER NOT NULL)";

constexpr const char* kCreateSessionIndexSql =
    "CREATE INDEX IF NOT EXISTS events_session_id ON events(session_id)";

constexpr const char* kCreateTimeIndexSql =
    "CREATE INDEX IF NOT EXISTS events_time ON events(time, _id)";

} // namespace

SqliteEventStore::SqliteEventStore(const std::string& databasePath)
    : path_(databasePath) {
    if (path_.empty()) {
        throw std::invalid_argument("SqliteEventStore: database path cannot be empty");
    }
    
    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("SqliteEventStore: cannot open " + path_ + ": " + message);
    }
    
    sqlite3_busy_timeout(db_, 5000);
    
    // WAL is unavailable for in-memory databases; that is fine
    execute("PRAGMA journal_mode=WAL");
    
    createSchema();
    
    if (!refreshTotals()) {
        throw std::runtime_error("SqliteEventStore: cannot read totals from " + path_);
    }
    
    std::cout << "[EventStore] Opened " << path_ << " with " << count_ << " events ("
              << totalSize_ << " bytes)" << std::endl;
}

SqliteEventStore::~SqliteEventStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteEventStore::createSchema() {
    if (!execute(kCreateTableSql) ||
        !execute(kCreateSessionIndexSql) ||
        !execute(kCreateTimeIndexSql)) {
        throw std::runtime_error("SqliteEventStore: schema creation failed for " + path_);
    }
}

int SqliteEventStore::insert(const Event& event) {
    Statement stmt(db_,
        "INSERT INTO events (type, event_id, data, time, session_id, event_size) "
        "VALUES (?, ?, ?, ?, ?, ?)");
    if (!stmt.valid()) {
        logError("prepare insert");
        return -1;
    }
    
    const auto size = static_cast<int64_t>(event.serializedSize());
    
    if (!stmt.bindText(1, event.type) ||
        !stmt.bindText(2, event.id) ||
        !stmt.bindText(3, event.data) ||
        !stmt.bindText(4, event.timestamp) ||
        !stmt.bindText(5, event.sessionId) ||
        !stmt.bindInt64(6, size)) {
        logError("bind insert " + event.id);
        return -1;
    }
    
    if (stmt.step() != SQLITE_DONE) {
        logError("insert event " + event.id);
        return -1;
    }
    
    ++count_;
    totalSize_ += size;
    return count_;
}

std::optional<std::string> SqliteEventStore::oldestSessionId() const {
    // The session owning the oldest event is the session with the earliest minimum timestamp
    Statement stmt(db_, "SELECT session_id FROM events ORDER BY time ASC, _id ASC LIMIT 1");
    if (!stmt.valid()) {
        logError("prepare oldest session");
        return std::nullopt;
    }
    
    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
        return stmt.columnText(0);
    }
    if (rc != SQLITE_DONE) {
        logError("read oldest session");
    }
    return std::nullopt;
}

bool SqliteEventStore::deleteSession(const std::string& sessionId) {
    Transaction transaction(db_);
    if (!transaction.active()) {
        logError("begin delete session");
        return false;
    }
    
    Statement totals(db_,
        "SELECT COUNT(*), COALESCE(SUM(event_size), 0) FROM events WHERE session_id = ?");
    Statement remove(db_, "DELETE FROM events WHERE session_id = ?");
    if (!totals.valid() || !remove.valid()) {
        logError("prepare delete session");
        return false;
    }
    
    if (!totals.bindText(1, sessionId) || totals.step() != SQLITE_ROW) {
        logError("size session " + sessionId);
        return false;
    }
    const auto removedCount = static_cast<int>(totals.columnInt64(0));
    const auto removedSize = totals.columnInt64(1);
    totals.reset();
    
    if (!remove.bindText(1, sessionId) || remove.step() != SQLITE_DONE) {
        logError("delete session " + sessionId);
        return false;
    }
    
    if (!transaction.commit()) {
        logError("commit delete session");
        refreshTotals();
        return false;
    }
    
    count_ -= removedCount;
    totalSize_ -= removedSize;
    
    std::cout << "[EventStore] Deleted session '" << sessionId << "' (" << removedCount
              << " events, " << removedSize << " bytes)" << std::endl;
    return true;
}

ports::Batch SqliteEventStore::selectBatch(int approxCount) const {
    ports::Batch batch;
    if (approxCount <= 0) {
        return batch;
    }
    
    Statement stmt(db_, "SELECT event_id, data FROM events ORDER BY time ASC, _id ASC LIMIT ?");
    if (!stmt.valid()) {
        logError("prepare select batch");
        return batch;
    }
    
    if (!stmt.bindInt64(1, approxCount)) {
        logError("bind select batch");
        return batch;
    }
    batch.reserve(static_cast<std::size_t>(std::min(approxCount, count_)));
    
    int rc;
    while ((rc = stmt.step()) == SQLITE_ROW) {
        batch.push_back({stmt.columnText(0), stmt.columnText(1)});
    }
    
    if (rc != SQLITE_DONE) {
        logError("select batch");
        return {};
    }
    return batch;
}

bool SqliteEventStore::deleteEvents(const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return true;
    }
    
    Transaction transaction(db_);
    if (!transaction.active()) {
        logError("begin delete events");
        return false;
    }
    
    Statement size(db_, "SELECT event_size FROM events WHERE event_id = ?");
    Statement remove(db_, "DELETE FROM events WHERE event_id = ?");
    if (!size.valid() || !remove.valid()) {
        logError("prepare delete events");
        return false;
    }
    
    int removedCount = 0;
    int64_t removedSize = 0;
    
    for (const auto& id : ids) {
        if (!size.bindText(1, id)) {
            logError("bind size event " + id);
            return false;
        }
        int rc = size.step();
        if (rc == SQLITE_ROW) {
            removedSize += size.columnInt64(0);
            ++removedCount;
        } else if (rc != SQLITE_DONE) {
            logError("size event " + id);
            return false;
        }
        size.reset();
        
        if (!remove.bindText(1, id) || remove.step() != SQLITE_DONE) {
            logError("delete event " + id);
            return false;
        }
        remove.reset();
    }
    
    if (!transaction.commit()) {
        logError("commit delete events");
        refreshTotals();
        return false;
    }
    
    count_ -= removedCount;
    totalSize_ -= removedSize;
    return true;
}

bool SqliteEventStore::deleteAll() {
    if (!execute("DELETE FROM events")) {
        refreshTotals();
        return false;
    }
    
    count_ = 0;
    totalSize_ = 0;
    return true;
}

bool SqliteEventStore::refreshTotals() {
    Statement stmt(db_, "SELECT COUNT(*), COALESCE(SUM(event_size), 0) FROM events");
    if (!stmt.valid() || stmt.step() != SQLITE_ROW) {
        logError("read totals");
        return false;
    }
    
    count_ = static_cast<int>(stmt.columnInt64(0));
    totalSize_ = stmt.columnInt64(1);
    return true;
}

bool SqliteEventStore::execute(const char* sql) {
    char* errorMessage = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errorMessage);
    if (rc != SQLITE_OK) {
        std::cerr << "[EventStore] SQL error (" << rc << "): "
                  << (errorMessage ? errorMessage : "unknown") << std::endl;
        sqlite3_free(errorMessage);
        return false;
    }
    return true;
}

void SqliteEventStore::logError(const std::string& context) const {
    std::cerr << "[EventStore] Failed to " << context << ": " << sqlite3_errmsg(db_) << std::endl;
}

} // namespace uplink::adapters
