#pragma once
#include "embedder.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace klaus {

enum class Importance { Low, Medium, High };

enum class QueryType { Quick, Semantic, Context, Related };

// Canonical unit of remembered information (one row of the Fast Store).
struct MemoryRecord {
    int64_t id = 0;
    std::string content;
    std::string category = "general";
    Importance importance = Importance::Medium;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<Embedding> embedding;
    uint64_t created_at = 0;
    uint32_t access_count = 0;
    uint64_t last_accessed = 0;
    double score = 0.0;
};

// Snapshot of the fields needed to index a memory, captured at enqueue time.
struct SyncPayload {
    int64_t memory_id = 0;
    std::string content;
    std::string category;
    Importance importance = Importance::Medium;
    uint64_t created_at = 0;
};

struct SyncQueueEntry {
    int64_t queue_id = 0;
    int64_t memory_id = 0;
    SyncPayload payload;
    bool synced = false;
    bool readable = true;   // false: payload column could not be parsed
    uint32_t attempts = 0;  // failed sync passes so far
    uint64_t created_at = 0;
    uint64_t synced_at = 0;
};

struct RecallQuery {
    QueryType type = QueryType::Quick;
    std::string text;
    uint32_t limit = 5;
    uint32_t context_depth = 2;
};

struct RecallHit {
    int64_t id = 0;
    std::string content;
    std::string category;
    uint64_t created_at = 0;
    std::optional<double> score;
};

struct FastStoreStats {
    uint64_t total = 0;
    std::map<std::string, uint64_t> by_category;
};

struct GraphStats {
    uint64_t node_count = 0;
    uint64_t edge_count = 0;
};

struct MemoryStats {
    FastStoreStats fast_store;
    GraphStats graph_store;
    bool graph_available = false;
    uint64_t pending_sync_count = 0;
    std::optional<std::string> embedding_model;
};

// Fatal storage-medium failure (disk full, corrupt database). Propagated.
class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Graph write or query failure. Never surfaced from store()/recall().
class GraphError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// String conversions
std::string importance_to_string(Importance imp);
std::optional<Importance> parse_importance(const std::string& s);
// Lenient form for stored rows: unknown levels read as Medium
Importance importance_from_string(const std::string& s);
std::string query_type_to_string(QueryType type);
std::optional<QueryType> query_type_from_string(const std::string& s);

// JSON conversion for the sync-queue payload column
nlohmann::json payload_to_json(const SyncPayload& payload);
SyncPayload payload_from_json(const nlohmann::json& j);

RecallHit hit_from_record(const MemoryRecord& record, bool with_score);

} // namespace klaus
