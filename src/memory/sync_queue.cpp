#include "sync_queue.hpp"
#include "../util.hpp"
#include <iostream>

namespace klaus {

SyncQueue::SyncQueue(SqliteDb& db) : db_(db) {
    db_.exec(
        "CREATE TABLE IF NOT EXISTS sync_queue ("
        "  id         INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  memory_id  INTEGER NOT NULL,"
        "  payload    TEXT    NOT NULL,"
        "  synced     INTEGER NOT NULL DEFAULT 0,"
        "  created_at INTEGER NOT NULL,"
        "  synced_at  INTEGER,"
        "  attempts   INTEGER NOT NULL DEFAULT 0"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_sync_queue_pending"
        " ON sync_queue(synced, attempts, id);");
}

int64_t SyncQueue::enqueue(int64_t memory_id, const SyncPayload& payload) {
    auto lock = db_.lock();
    Statement stmt(db_,
        "INSERT INTO sync_queue (memory_id, payload, synced, created_at)"
        " VALUES (?, ?, 0, ?);");
    stmt.bind(1, memory_id)
        .bind(2, payload_to_json(payload).dump(-1, ' ', false,
                                               nlohmann::json::error_handler_t::replace))
        .bind(3, static_cast<int64_t>(epoch_seconds()));
    stmt.run();
    return db_.last_insert_rowid();
}

static const char* kEntryColumns =
    "id, memory_id, payload, synced, created_at, synced_at, attempts";

// Columns follow kEntryColumns.
std::vector<SyncQueueEntry> SyncQueue::read_entries(Statement& stmt) {
    std::vector<SyncQueueEntry> entries;
    while (stmt.step()) {
        SyncQueueEntry entry;
        entry.queue_id = stmt.column_int64(0);
        entry.memory_id = stmt.column_int64(1);
        try {
            entry.payload = payload_from_json(nlohmann::json::parse(stmt.column_text(2)));
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[sync] Queue item " << entry.queue_id
                      << " has an unreadable payload: " << e.what() << "\n";
            entry.readable = false;
            entry.payload = SyncPayload{};
        }
        entry.payload.memory_id = entry.memory_id;
        entry.synced = stmt.column_int64(3) != 0;
        entry.created_at = static_cast<uint64_t>(stmt.column_int64(4));
        if (!stmt.column_is_null(5))
            entry.synced_at = static_cast<uint64_t>(stmt.column_int64(5));
        entry.attempts = static_cast<uint32_t>(stmt.column_int64(6));
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::vector<SyncQueueEntry> SyncQueue::pending(uint32_t limit) {
    auto lock = db_.lock();
    // Fewest failures first, so entries that keep failing cannot hold the
    // batch window against newer work
    std::string sql = std::string("SELECT ") + kEntryColumns +
        " FROM sync_queue WHERE synced = 0 ORDER BY attempts, id";
    if (limit > 0) sql += " LIMIT ?";
    sql += ";";

    Statement stmt(db_, sql);
    if (limit > 0) stmt.bind(1, static_cast<int64_t>(limit));
    return read_entries(stmt);
}

bool SyncQueue::mark_synced(int64_t queue_id) {
    auto lock = db_.lock();
    Statement stmt(db_,
        "UPDATE sync_queue SET synced = 1, synced_at = ?"
        " WHERE id = ? AND synced = 0;");
    stmt.bind(1, static_cast<int64_t>(epoch_seconds())).bind(2, queue_id);
    stmt.run();
    return db_.changes() > 0;
}

void SyncQueue::record_failure(int64_t queue_id) {
    auto lock = db_.lock();
    Statement stmt(db_,
        "UPDATE sync_queue SET attempts = attempts + 1 WHERE id = ? AND synced = 0;");
    stmt.bind(1, queue_id);
    stmt.run();
}

bool SyncQueue::discard(int64_t queue_id) {
    auto lock = db_.lock();
    Statement stmt(db_, "DELETE FROM sync_queue WHERE id = ? AND synced = 0;");
    stmt.bind(1, queue_id);
    stmt.run();
    return db_.changes() > 0;
}

uint64_t SyncQueue::pending_count() {
    auto lock = db_.lock();
    Statement stmt(db_, "SELECT COUNT(*) FROM sync_queue WHERE synced = 0;");
    if (stmt.step()) return static_cast<uint64_t>(stmt.column_int64(0));
    return 0;
}

std::vector<SyncQueueEntry> SyncQueue::entries_for(int64_t memory_id) {
    auto lock = db_.lock();
    Statement stmt(db_, std::string("SELECT ") + kEntryColumns +
        " FROM sync_queue WHERE memory_id = ? ORDER BY id;");
    stmt.bind(1, memory_id);
    return read_entries(stmt);
}

uint64_t SyncQueue::compact_synced(uint32_t max_age_seconds) {
    auto lock = db_.lock();
    auto cutoff = static_cast<int64_t>(epoch_seconds()) - static_cast<int64_t>(max_age_seconds);
    Statement stmt(db_, "DELETE FROM sync_queue WHERE synced = 1 AND synced_at <= ?;");
    stmt.bind(1, cutoff);
    stmt.run();
    return static_cast<uint64_t>(db_.changes());
}

void SyncQueue::clear() {
    db_.exec("DELETE FROM sync_queue;");
}

} // namespace klaus
