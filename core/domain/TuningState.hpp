/**
 * @file TuningState.hpp
 * @brief Server-adjustable upload tuning and pacing state
 *
 * Holds the four collector-controlled bounds (storage cap, batch size cap,
 * minimum batch interval, maximum wait) together with the pacing clock
 * (last send time, scheduled send time) and the current backoff. The whole
 * block is persisted as a small JSON document so that the scheduling and
 * backoff arithmetic survives a process restart.
 *
 * All times are epoch milliseconds, all intervals are milliseconds and all
 * sizes are bytes.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace uplink::domain {

struct TuningState {
    static constexpr int64_t kDefaultMaxTotalDbSize = 5 * 1024 * 1024;        ///< 5 MiB
    static constexpr int64_t kDefaultMaxBatchSize = 500 * 1024;              ///< 500 KiB
    static constexpr int64_t kDefaultMinBatchInterval = 60 * 1000;           ///< 60 s
    static constexpr int64_t kDefaultMaxWait = 7LL * 24 * 60 * 60 * 1000;    ///< 7 days
    
    int64_t maxTotalDbSize = kDefaultMaxTotalDbSize;
    int64_t maxBatchSize = kDefaultMaxBatchSize;
    int64_t minBatchInterval = kDefaultMinBatchInterval;
    int64_t maxWait = kDefaultMaxWait;
    
    int64_t lastSendTime = 0;       ///< When the last upload cycle started
    int64_t scheduledSendTime = 0;  ///< Deadline of the last armed wakeup
    int64_t backoffMs = 0;          ///< 0 after a success, grows on failure
};

/**
 * @brief Owns the persisted TuningState document
 *
 * Every mutation goes through update(), which flushes the document to disk
 * before returning. An empty path keeps the state in memory only.
 *
 * @note Not thread-safe; owned by the single service worker
 */
class TuningStateRepository {
public:
    /**
     * @param path JSON document location (empty for in-memory only)
     * @param defaults Values used when no document exists yet
     */
    explicit TuningStateRepository(std::string path, TuningState defaults = {});
    
    /**
     * @brief Load the persisted document
     * @return false if the document was missing or unreadable and defaults were kept
     */
    bool load();
    
    /**
     * @brief Atomically write the current state (temp file + rename)
     * @return false if the write failed; the in-memory state is unchanged
     */
    bool flush();
    
    /**
     * @brief Apply a mutation and flush it
     * @return Result of the flush
     */
    bool update(const std::function<void(TuningState&)>& mutation);
    
    const TuningState& state() const { return state_; }
    const TuningState& defaults() const { return defaults_; }
    const std::string& path() const { return path_; }

private:
    std::string path_;
    TuningState defaults_;
    TuningState state_;
};

} // namespace uplink::domain
