#pragma once
#include "graph_store.hpp"
#include "sqlite_db.hpp"
#include <memory>
#include <string>

namespace klaus {

// GraphStore over an embedded SQLite database kept in its own directory
// (<dir>/graph.db). Nodes and each edge kind live in separate tables whose
// primary keys make every merge idempotent.
class SqliteGraphStore : public GraphStore {
public:
    // Throws GraphError if the directory or database cannot be opened.
    explicit SqliteGraphStore(const std::string& dir);

    void upsert_memory(const SyncPayload& payload) override;
    void merge_topic(const std::string& name) override;
    void merge_entity(const Entity& entity) override;
    void link_topic(int64_t memory_id, const std::string& topic) override;
    void link_entity(int64_t memory_id, const std::string& entity) override;
    void link_related(int64_t from_id, int64_t to_id, double strength) override;
    void link_follows(int64_t from_id, int64_t to_id) override;
    void clear() override;

    bool has_memory(int64_t id) override;
    std::optional<int64_t> previous_memory(int64_t id) override;
    std::vector<int64_t> memories_sharing_topics(int64_t id, uint32_t limit) override;
    std::vector<int64_t> memories_with_topics(const std::vector<std::string>& topics,
                                              uint32_t limit) override;
    std::vector<int64_t> memories_mentioning(const std::vector<std::string>& entities,
                                             uint32_t limit) override;
    std::optional<int64_t> latest_memory_containing(const std::string& text) override;
    std::vector<int64_t> neighbors(int64_t id) override;
    std::vector<std::string> topics_of(int64_t id) override;
    GraphStats stats() override;

    const std::string& path() const { return db_->path(); }

private:
    void init_schema();
    std::vector<int64_t> query_ids(const std::string& sql,
                                   const std::vector<std::string>& names,
                                   uint32_t limit);

    std::unique_ptr<SqliteDb> db_;
};

} // namespace klaus
