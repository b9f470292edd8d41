/**
 * @file SqliteEventStore.hpp
 * @brief SQLite-backed durable event store
 *
 * Persists pending events in a single `events` table keyed by event id, with
 * secondary indexes on session id (for session eviction) and on timestamp
 * (for oldest-session lookup and batch ordering). Count and total size are
 * cached in memory and adjusted on every insert and delete so the hot path
 * never needs an aggregate scan.
 *
 * Storage errors never escape: they are logged with the `[EventStore]` tag and
 * reported through the return value of the failing operation.
 */

#pragma once

#include "../ports/IEventStore.hpp"
#include <cstdint>
#include <string>

struct sqlite3;

namespace uplink::adapters {

class SqliteEventStore : public ports::IEventStore {
public:
    /**
     * @brief Open (or create) the event database
     * @param databasePath File path, or ":memory:" for a private in-memory store
     * @throws std::runtime_error if the database cannot be opened or migrated
     */
    explicit SqliteEventStore(const std::string& databasePath);
    ~SqliteEventStore() override;
    
    SqliteEventStore(const SqliteEventStore&) = delete;
    SqliteEventStore& operator=(const SqliteEventStore&) = delete;
    SqliteEventStore(SqliteEventStore&&) = delete;
    SqliteEventStore& operator=(SqliteEventStore&&) = delete;
    
    int insert(const Event& event) override;
    
    int64_t totalSizeBytes() const override { return totalSize_; }
    int count() const override { return count_; }
    
    std::optional<std::string> oldestSessionId() const override;
    bool deleteSession(const std::string& sessionId) override;
    
    ports::Batch selectBatch(int approxCount) const override;
    
    bool deleteEvents(const std::vector<std::string>& ids) override;
    bool deleteAll() override;
    
    const std::string& path() const { return path_; }

private:
    void createSchema();
    
    /// Recompute cached count and size from the table
    bool refreshTotals();
    
    bool execute(const char* sql);
    void logError(const std::string& context) const;
    
    std::string path_;
    sqlite3* db_ = nullptr;
    
    int count_ = 0;
    int64_t totalSize_ = 0;
};

} // namespace uplink::adapters
