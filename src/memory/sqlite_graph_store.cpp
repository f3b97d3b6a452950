#include "sqlite_graph_store.hpp"
#include <filesystem>

namespace klaus {

// Run a storage operation, reporting SQLite failures as GraphError.
template <typename F>
static auto guarded(const char* what, F&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const StorageError& e) {
        throw GraphError(std::string(what) + ": " + e.what());
    }
}

SqliteGraphStore::SqliteGraphStore(const std::string& dir) {
    auto db_path = (std::filesystem::path(dir) / "graph.db").string();
    guarded("graph open", [&] {
        db_ = std::make_unique<SqliteDb>(db_path);
        init_schema();
    });
}

void SqliteGraphStore::init_schema() {
    db_->exec(
        "CREATE TABLE IF NOT EXISTS memory_nodes ("
        "  id         INTEGER PRIMARY KEY,"
        "  content    TEXT    NOT NULL,"
        "  category   TEXT    NOT NULL,"
        "  importance TEXT    NOT NULL,"
        "  created_at INTEGER NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS topic_nodes ("
        "  name     TEXT PRIMARY KEY,"
        "  category TEXT NOT NULL DEFAULT 'auto'"
        ");"
        "CREATE TABLE IF NOT EXISTS entity_nodes ("
        "  name TEXT PRIMARY KEY,"
        "  type TEXT NOT NULL"
        ");"
        "CREATE TABLE IF NOT EXISTS has_topic ("
        "  memory_id INTEGER NOT NULL,"
        "  topic     TEXT    NOT NULL,"
        "  PRIMARY KEY (memory_id, topic)"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_has_topic_topic ON has_topic(topic);"
        "CREATE TABLE IF NOT EXISTS mentions ("
        "  memory_id INTEGER NOT NULL,"
        "  entity    TEXT    NOT NULL,"
        "  PRIMARY KEY (memory_id, entity)"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_mentions_entity ON mentions(entity);"
        "CREATE TABLE IF NOT EXISTS related_to ("
        "  from_id  INTEGER NOT NULL,"
        "  to_id    INTEGER NOT NULL,"
        "  strength REAL    NOT NULL,"
        "  PRIMARY KEY (from_id, to_id)"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_related_to_to ON related_to(to_id);"
        "CREATE TABLE IF NOT EXISTS follows ("
        "  from_id INTEGER NOT NULL,"
        "  to_id   INTEGER NOT NULL,"
        "  PRIMARY KEY (from_id, to_id)"
        ");");
}

// ── Writes ───────────────────────────────────────────────────────

void SqliteGraphStore::upsert_memory(const SyncPayload& payload) {
    guarded("upsert memory", [&] {
        auto lock = db_->lock();
        Statement stmt(*db_,
            "INSERT INTO memory_nodes (id, content, category, importance, created_at)"
            " VALUES (?, ?, ?, ?, ?)"
            " ON CONFLICT(id) DO UPDATE SET content = excluded.content,"
            " category = excluded.category, importance = excluded.importance,"
            " created_at = excluded.created_at;");
        stmt.bind(1, payload.memory_id)
            .bind(2, payload.content)
            .bind(3, payload.category)
            .bind(4, importance_to_string(payload.importance))
            .bind(5, static_cast<int64_t>(payload.created_at));
        stmt.run();
    });
}

void SqliteGraphStore::merge_topic(const std::string& name) {
    guarded("merge topic", [&] {
        auto lock = db_->lock();
        Statement stmt(*db_, "INSERT OR IGNORE INTO topic_nodes (name) VALUES (?);");
        stmt.bind(1, name);
        stmt.run();
    });
}

void SqliteGraphStore::merge_entity(const Entity& entity) {
    guarded("merge entity", [&] {
        auto lock = db_->lock();
        Statement stmt(*db_, "INSERT OR IGNORE INTO entity_nodes (name, type) VALUES (?, ?);");
        stmt.bind(1, entity.name).bind(2, entity_type_to_string(entity.type));
        stmt.run();
    });
}

void SqliteGraphStore::link_topic(int64_t memory_id, const std::string& topic) {
    guarded("link topic", [&] {
        auto lock = db_->lock();
        Statement stmt(*db_, "INSERT OR IGNORE INTO has_topic (memory_id, topic) VALUES (?, ?);");
        stmt.bind(1, memory_id).bind(2, topic);
        stmt.run();
    });
}

void SqliteGraphStore::link_entity(int64_t memory_id, const std::string& entity) {
    guarded("link entity", [&] {
        auto lock = db_->lock();
        Statement stmt(*db_, "INSERT OR IGNORE INTO mentions (memory_id, entity) VALUES (?, ?);");
        stmt.bind(1, memory_id).bind(2, entity);
        stmt.run();
    });
}

void SqliteGraphStore::link_related(int64_t from_id, int64_t to_id, double strength) {
    guarded("link related", [&] {
        auto lock = db_->lock();
        Statement stmt(*db_,
            "INSERT OR IGNORE INTO related_to (from_id, to_id, strength) VALUES (?, ?, ?);");
        stmt.bind(1, from_id).bind(2, to_id).bind(3, strength);
        stmt.run();
    });
}

void SqliteGraphStore::link_follows(int64_t from_id, int64_t to_id) {
    guarded("link follows", [&] {
        auto lock = db_->lock();
        Statement stmt(*db_, "INSERT OR IGNORE INTO follows (from_id, to_id) VALUES (?, ?);");
        stmt.bind(1, from_id).bind(2, to_id);
        stmt.run();
    });
}

void SqliteGraphStore::clear() {
    guarded("clear graph", [&] {
        Transaction tx(*db_);
        db_->exec(
            "DELETE FROM follows;"
            "DELETE FROM related_to;"
            "DELETE FROM mentions;"
            "DELETE FROM has_topic;"
            "DELETE FROM entity_nodes;"
            "DELETE FROM topic_nodes;"
            "DELETE FROM memory_nodes;");
        tx.commit();
    });
}

// ── Queries ──────────────────────────────────────────────────────

bool SqliteGraphStore::has_memory(int64_t id) {
    return guarded("has memory", [&] {
        auto lock = db_->lock();
        Statement stmt(*db_, "SELECT 1 FROM memory_nodes WHERE id = ?;");
        stmt.bind(1, id);
        return stmt.step();
    });
}

std::optional<int64_t> SqliteGraphStore::previous_memory(int64_t id) {
    return guarded("previous memory", [&]() -> std::optional<int64_t> {
        auto lock = db_->lock();
        Statement stmt(*db_, "SELECT MAX(id) FROM memory_nodes WHERE id < ?;");
        stmt.bind(1, id);
        if (stmt.step() && !stmt.column_is_null(0)) return stmt.column_int64(0);
        return std::nullopt;
    });
}

std::vector<int64_t> SqliteGraphStore::memories_sharing_topics(int64_t id, uint32_t limit) {
    return guarded("shared topics", [&] {
        auto lock = db_->lock();
        Statement stmt(*db_,
            "SELECT DISTINCT other.memory_id FROM has_topic self"
            " JOIN has_topic other ON other.topic = self.topic"
            " WHERE self.memory_id = ? AND other.memory_id <> ?"
            " ORDER BY other.memory_id DESC LIMIT ?;");
        stmt.bind(1, id).bind(2, id).bind(3, static_cast<int64_t>(limit));
        std::vector<int64_t> ids;
        while (stmt.step()) ids.push_back(stmt.column_int64(0));
        return ids;
    });
}

// sql must contain one "%s" placeholder for the IN list and end with LIMIT ?.
std::vector<int64_t> SqliteGraphStore::query_ids(const std::string& sql,
                                                 const std::vector<std::string>& names,
                                                 uint32_t limit) {
    if (names.empty() || limit == 0) return {};

    std::string in_list;
    for (size_t i = 0; i < names.size(); i++) {
        if (i > 0) in_list += ',';
        in_list += '?';
    }
    std::string full = sql;
    full.replace(full.find("%s"), 2, in_list);

    auto lock = db_->lock();
    Statement stmt(*db_, full);
    int idx = 1;
    for (const auto& name : names) stmt.bind(idx++, name);
    stmt.bind(idx, static_cast<int64_t>(limit));

    std::vector<int64_t> ids;
    while (stmt.step()) ids.push_back(stmt.column_int64(0));
    return ids;
}

std::vector<int64_t> SqliteGraphStore::memories_with_topics(
        const std::vector<std::string>& topics, uint32_t limit) {
    return guarded("topic lookup", [&] {
        return query_ids(
            "SELECT m.id FROM memory_nodes m WHERE EXISTS ("
            "  SELECT 1 FROM has_topic h WHERE h.memory_id = m.id AND h.topic IN (%s))"
            " ORDER BY m.created_at DESC, m.id DESC LIMIT ?;",
            topics, limit);
    });
}

std::vector<int64_t> SqliteGraphStore::memories_mentioning(
        const std::vector<std::string>& entities, uint32_t limit) {
    return guarded("entity lookup", [&] {
        return query_ids(
            "SELECT m.id FROM memory_nodes m WHERE EXISTS ("
            "  SELECT 1 FROM mentions x WHERE x.memory_id = m.id AND x.entity IN (%s))"
            " ORDER BY m.created_at DESC, m.id DESC LIMIT ?;",
            entities, limit);
    });
}

std::optional<int64_t> SqliteGraphStore::latest_memory_containing(const std::string& text) {
    return guarded("seed lookup", [&]() -> std::optional<int64_t> {
        auto lock = db_->lock();
        Statement stmt(*db_,
            "SELECT id FROM memory_nodes WHERE instr(fold_case(content), fold_case(?)) > 0"
            " ORDER BY created_at DESC, id DESC LIMIT 1;");
        stmt.bind(1, text);
        if (stmt.step()) return stmt.column_int64(0);
        return std::nullopt;
    });
}

std::vector<int64_t> SqliteGraphStore::neighbors(int64_t id) {
    return guarded("neighbors", [&] {
        auto lock = db_->lock();
        Statement stmt(*db_,
            "SELECT to_id FROM related_to WHERE from_id = ?"
            " UNION SELECT from_id FROM related_to WHERE to_id = ?"
            " UNION SELECT to_id FROM follows WHERE from_id = ?;");
        stmt.bind(1, id).bind(2, id).bind(3, id);
        std::vector<int64_t> ids;
        while (stmt.step()) ids.push_back(stmt.column_int64(0));
        return ids;
    });
}

std::vector<std::string> SqliteGraphStore::topics_of(int64_t id) {
    return guarded("topics of", [&] {
        auto lock = db_->lock();
        Statement stmt(*db_, "SELECT topic FROM has_topic WHERE memory_id = ? ORDER BY topic;");
        stmt.bind(1, id);
        std::vector<std::string> topics;
        while (stmt.step()) topics.push_back(stmt.column_text(0));
        return topics;
    });
}

GraphStats SqliteGraphStore::stats() {
    return guarded("graph stats", [&] {
        auto lock = db_->lock();
        Statement stmt(*db_,
            "SELECT"
            " (SELECT COUNT(*) FROM memory_nodes) + (SELECT COUNT(*) FROM topic_nodes)"
            "   + (SELECT COUNT(*) FROM entity_nodes),"
            " (SELECT COUNT(*) FROM has_topic) + (SELECT COUNT(*) FROM mentions)"
            "   + (SELECT COUNT(*) FROM related_to) + (SELECT COUNT(*) FROM follows);");
        GraphStats out;
        if (stmt.step()) {
            out.node_count = static_cast<uint64_t>(stmt.column_int64(0));
            out.edge_count = static_cast<uint64_t>(stmt.column_int64(1));
        }
        return out;
    });
}

} // namespace klaus
