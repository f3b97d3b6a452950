#pragma once
#include "../memory.hpp"
#include "sqlite_db.hpp"
#include "sync_queue.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace klaus {

// Durable SQLite store of memory records: the source of truth. Owns the
// database handle and the sync queue living beside it.
class FastStore {
public:
    // Opens or creates the database at path. Throws StorageError.
    explicit FastStore(const std::string& path);

    // Insert a record and, unless enqueue_sync is false, its sync job in one
    // transaction. Returns the new id. Throws StorageError; on failure
    // neither row exists.
    int64_t store(const std::string& content, const std::string& category,
                  Importance importance, const nlohmann::json& metadata,
                  bool enqueue_sync = true);

    // Keyword recall: rank by how many query tokens each record contains.
    // Returned records have their access bookkeeping applied.
    std::vector<MemoryRecord> recall(const std::string& query, uint32_t limit);

    std::optional<MemoryRecord> get(int64_t id);

    // Records for the given ids, in the order given. Unknown ids are skipped.
    std::vector<MemoryRecord> get_many(const std::vector<int64_t>& ids);

    // All records in id order.
    std::vector<MemoryRecord> list_all();

    uint64_t count();

    // Attach an embedding to an existing record. No-op for unknown ids.
    void set_embedding(int64_t id, const Embedding& embedding);

    // All records that carry an embedding.
    std::vector<MemoryRecord> embedded_records();

    // Increment access_count and set last_accessed for each id.
    void touch(const std::vector<int64_t>& ids);

    FastStoreStats stats();

    // Delete all records and all queue entries.
    void clear();

    SyncQueue& sync_queue() { return queue_; }
    const std::string& path() const { return db_.path(); }

private:
    void init_schema();
    std::vector<MemoryRecord> read_records(Statement& stmt);

    SqliteDb db_;
    SyncQueue queue_;
};

} // namespace klaus
