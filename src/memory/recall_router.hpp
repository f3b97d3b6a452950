#pragma once
#include "../memory.hpp"
#include "embedding_gate.hpp"
#include "fast_store.hpp"
#include "graph_store.hpp"
#include <cstddef>
#include <vector>

namespace klaus {

struct RouterOptions {
    double semantic_threshold = 0.65;
    size_t max_topics = 3;
    size_t max_entities = 3;
    uint32_t max_context_depth = 5;
    size_t seed_max_chars = 50;
};

// Stateless dispatch of a RecallQuery to keyword, embedding, traversal or
// entity retrieval. Graph-backed paths fall back to keyword search when the
// graph is absent, fails or finds nothing; only StorageError escapes.
// Every returned record has its access bookkeeping applied.
class RecallRouter {
public:
    RecallRouter(FastStore& store, GraphStore* graph, EmbeddingGate& embeddings,
                 RouterOptions options = {});

    std::vector<RecallHit> recall(const RecallQuery& query);

    std::vector<RecallHit> quick(const std::string& text, uint32_t limit);
    std::vector<RecallHit> semantic(const std::string& text, uint32_t limit);
    std::vector<RecallHit> context(const std::string& text, uint32_t limit, uint32_t depth);
    std::vector<RecallHit> related(const std::string& text, uint32_t limit);

private:
    // Load records by id (in order), apply access bookkeeping, convert.
    std::vector<RecallHit> deliver(std::vector<MemoryRecord> records, bool with_score);

    FastStore& store_;
    GraphStore* graph_;
    EmbeddingGate& embeddings_;
    RouterOptions options_;
};

} // namespace klaus
