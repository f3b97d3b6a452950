#pragma once
#include "../memory.hpp"
#include "sqlite_db.hpp"
#include <cstdint>
#include <vector>

namespace klaus {

// Durable record of pending graph-indexing work, stored in the same SQLite
// database as the memories table so an insert and its queue entry commit
// together. Entries flip synced 0 -> 1 exactly once. Failed passes bump an
// attempts counter that pushes the entry behind fresher work.
class SyncQueue {
public:
    explicit SyncQueue(SqliteDb& db);

    // Insert a pending job. Joins the caller's open transaction, if any.
    int64_t enqueue(int64_t memory_id, const SyncPayload& payload);

    // Unsynced entries, fewest attempts first, then queue order.
    // Unreadable payloads come back with readable = false. limit 0 = all.
    std::vector<SyncQueueEntry> pending(uint32_t limit);

    // Mark an entry synced. Idempotent; returns true only on the 0 -> 1 flip.
    bool mark_synced(int64_t queue_id);

    // Count one more failed sync pass for an unsynced entry.
    void record_failure(int64_t queue_id);

    // Drop an unsynced entry that can never be synced (its memory is gone).
    bool discard(int64_t queue_id);

    uint64_t pending_count();

    // All entries (synced or not) for one memory, oldest first.
    std::vector<SyncQueueEntry> entries_for(int64_t memory_id);

    // Delete synced entries whose synced_at is older than max_age_seconds.
    // Returns the number removed.
    uint64_t compact_synced(uint32_t max_age_seconds);

    // Delete every entry (part of a full clear).
    void clear();

private:
    std::vector<SyncQueueEntry> read_entries(Statement& stmt);

    SqliteDb& db_;
};

} // namespace klaus
