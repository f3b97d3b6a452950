#include "fast_store.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace klaus {

static const char* kRecordColumns =
    "id, content, category, importance, metadata, embedding,"
    " created_at, access_count, last_accessed";

FastStore::FastStore(const std::string& path) : db_(path), queue_(db_) {
    init_schema();
}

void FastStore::init_schema() {
    db_.exec(
        "CREATE TABLE IF NOT EXISTS memories ("
        "  id            INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  content       TEXT    NOT NULL,"
        "  category      TEXT    NOT NULL DEFAULT 'general',"
        "  importance    TEXT    NOT NULL DEFAULT 'medium',"
        "  metadata      TEXT    NOT NULL DEFAULT '{}',"
        "  created_at    INTEGER NOT NULL,"
        "  access_count  INTEGER NOT NULL DEFAULT 0,"
        "  last_accessed INTEGER NOT NULL DEFAULT 0"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_memories_category ON memories(category);"
        "CREATE INDEX IF NOT EXISTS idx_memories_created ON memories(created_at);");

    // Add embedding column (ignored if it already exists)
    db_.try_exec("ALTER TABLE memories ADD COLUMN embedding BLOB;");
}

// Columns follow kRecordColumns.
std::vector<MemoryRecord> FastStore::read_records(Statement& stmt) {
    std::vector<MemoryRecord> records;
    while (stmt.step()) {
        MemoryRecord rec;
        rec.id = stmt.column_int64(0);
        rec.content = stmt.column_text(1);
        rec.category = stmt.column_text(2);
        rec.importance = importance_from_string(stmt.column_text(3));

        auto meta = stmt.column_text(4);
        rec.metadata = nlohmann::json::parse(meta, nullptr, false);
        if (rec.metadata.is_discarded() || !rec.metadata.is_object()) {
            std::cerr << "[memory] Ignoring malformed metadata on record " << rec.id << "\n";
            rec.metadata = nlohmann::json::object();
        }

        if (!stmt.column_is_null(5)) {
            auto emb = stmt.column_embedding(5);
            if (!emb.empty()) rec.embedding = std::move(emb);
        }
        rec.created_at = static_cast<uint64_t>(stmt.column_int64(6));
        rec.access_count = static_cast<uint32_t>(stmt.column_int64(7));
        rec.last_accessed = static_cast<uint64_t>(stmt.column_int64(8));
        records.push_back(std::move(rec));
    }
    return records;
}

int64_t FastStore::store(const std::string& content, const std::string& category,
                         Importance importance, const nlohmann::json& metadata,
                         bool enqueue_sync) {
    auto now = epoch_seconds();
    std::string cat = category.empty() ? "general" : category;
    // Content is free text; invalid UTF-8 in JSON columns becomes U+FFFD
    std::string meta = metadata.is_object()
        ? metadata.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
        : "{}";

    Transaction tx(db_);

    Statement insert(db_,
        "INSERT INTO memories (content, category, importance, metadata, created_at)"
        " VALUES (?, ?, ?, ?, ?);");
    insert.bind(1, content)
          .bind(2, cat)
          .bind(3, importance_to_string(importance))
          .bind(4, meta)
          .bind(5, static_cast<int64_t>(now));
    insert.run();
    int64_t id = db_.last_insert_rowid();

    if (enqueue_sync) {
        SyncPayload payload;
        payload.memory_id = id;
        payload.content = content;
        payload.category = cat;
        payload.importance = importance;
        payload.created_at = now;
        queue_.enqueue(id, payload);
    }

    tx.commit();
    return id;
}

std::vector<MemoryRecord> FastStore::recall(const std::string& query, uint32_t limit) {
    if (limit == 0) return {};

    // Distinct lower-cased tokens
    auto split = split_whitespace(to_lower(query));
    std::set<std::string> unique(split.begin(), split.end());
    std::vector<std::string> tokens(unique.begin(), unique.end());

    auto lock = db_.lock();
    std::vector<MemoryRecord> candidates;

    if (tokens.empty()) {
        Statement stmt(db_, std::string("SELECT ") + kRecordColumns +
            " FROM memories ORDER BY created_at DESC, id DESC LIMIT ?;");
        stmt.bind(1, static_cast<int64_t>(limit));
        candidates = read_records(stmt);
    } else {
        // Prefilter to rows containing at least one token
        std::string sql = std::string("SELECT ") + kRecordColumns + " FROM memories WHERE ";
        for (size_t i = 0; i < tokens.size(); i++) {
            if (i > 0) sql += " OR ";
            sql += "instr(fold_case(content), ?) > 0";
        }
        sql += ";";
        Statement stmt(db_, sql);
        for (size_t i = 0; i < tokens.size(); i++) {
            stmt.bind(static_cast<int>(i + 1), tokens[i]);
        }
        candidates = read_records(stmt);

        for (auto& rec : candidates) {
            auto lowered = to_lower(rec.content);
            int hits = 0;
            for (const auto& tok : tokens) {
                if (lowered.find(tok) != std::string::npos) hits++;
            }
            rec.score = static_cast<double>(hits);
        }
        candidates.erase(
            std::remove_if(candidates.begin(), candidates.end(),
                           [](const MemoryRecord& r) { return r.score <= 0.0; }),
            candidates.end());
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const MemoryRecord& a, const MemoryRecord& b) {
                  if (a.score != b.score) return a.score > b.score;
                  if (a.created_at != b.created_at) return a.created_at > b.created_at;
                  return a.id > b.id;
              });
    if (candidates.size() > limit) candidates.resize(limit);

    std::vector<int64_t> ids;
    ids.reserve(candidates.size());
    for (const auto& rec : candidates) ids.push_back(rec.id);
    touch(ids);

    auto now = epoch_seconds();
    for (auto& rec : candidates) {
        rec.access_count++;
        rec.last_accessed = now;
    }
    return candidates;
}

std::optional<MemoryRecord> FastStore::get(int64_t id) {
    auto lock = db_.lock();
    Statement stmt(db_, std::string("SELECT ") + kRecordColumns +
        " FROM memories WHERE id = ?;");
    stmt.bind(1, id);
    auto records = read_records(stmt);
    if (records.empty()) return std::nullopt;
    return std::move(records.front());
}

std::vector<MemoryRecord> FastStore::get_many(const std::vector<int64_t>& ids) {
    std::vector<MemoryRecord> out;
    if (ids.empty()) return out;

    auto lock = db_.lock();
    std::string sql = std::string("SELECT ") + kRecordColumns + " FROM memories WHERE id IN (";
    for (size_t i = 0; i < ids.size(); i++) {
        if (i > 0) sql += ',';
        sql += '?';
    }
    sql += ");";

    Statement stmt(db_, sql);
    for (size_t i = 0; i < ids.size(); i++) {
        stmt.bind(static_cast<int>(i + 1), ids[i]);
    }
    auto records = read_records(stmt);

    // Restore caller order
    for (int64_t id : ids) {
        auto it = std::find_if(records.begin(), records.end(),
                               [id](const MemoryRecord& r) { return r.id == id; });
        if (it != records.end()) out.push_back(*it);
    }
    return out;
}

std::vector<MemoryRecord> FastStore::list_all() {
    auto lock = db_.lock();
    Statement stmt(db_, std::string("SELECT ") + kRecordColumns +
        " FROM memories ORDER BY id;");
    return read_records(stmt);
}

uint64_t FastStore::count() {
    auto lock = db_.lock();
    Statement stmt(db_, "SELECT COUNT(*) FROM memories;");
    if (stmt.step()) return static_cast<uint64_t>(stmt.column_int64(0));
    return 0;
}

void FastStore::set_embedding(int64_t id, const Embedding& embedding) {
    auto lock = db_.lock();
    Statement stmt(db_, "UPDATE memories SET embedding = ? WHERE id = ?;");
    stmt.bind_embedding(1, embedding).bind(2, id);
    stmt.run();
}

std::vector<MemoryRecord> FastStore::embedded_records() {
    auto lock = db_.lock();
    Statement stmt(db_, std::string("SELECT ") + kRecordColumns +
        " FROM memories WHERE embedding IS NOT NULL ORDER BY id;");
    return read_records(stmt);
}

void FastStore::touch(const std::vector<int64_t>& ids) {
    if (ids.empty()) return;
    auto now = static_cast<int64_t>(epoch_seconds());

    // Single UPDATE with IN (...) clause
    std::string sql = "UPDATE memories SET access_count = access_count + 1,"
                      " last_accessed = ? WHERE id IN (";
    for (size_t i = 0; i < ids.size(); i++) {
        if (i > 0) sql += ',';
        sql += '?';
    }
    sql += ");";

    auto lock = db_.lock();
    Statement stmt(db_, sql);
    stmt.bind(1, now);
    for (size_t i = 0; i < ids.size(); i++) {
        stmt.bind(static_cast<int>(i + 2), ids[i]);
    }
    stmt.run();
}

FastStoreStats FastStore::stats() {
    FastStoreStats out;
    auto lock = db_.lock();
    Statement stmt(db_, "SELECT category, COUNT(*) FROM memories GROUP BY category;");
    while (stmt.step()) {
        auto n = static_cast<uint64_t>(stmt.column_int64(1));
        out.by_category[stmt.column_text(0)] = n;
        out.total += n;
    }
    return out;
}

void FastStore::clear() {
    Transaction tx(db_);
    db_.exec("DELETE FROM memories;");
    queue_.clear();
    tx.commit();
}

} // namespace klaus
