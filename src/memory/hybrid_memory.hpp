#pragma once
#include "../config.hpp"
#include "../memory.hpp"
#include "embedding_gate.hpp"
#include "fast_store.hpp"
#include "graph_indexer.hpp"
#include "graph_store.hpp"
#include "recall_router.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace klaus {

// Facade over the Fast Store, sync queue, graph, indexer and recall router.
// Construct once and pass by reference. Writes never depend on the graph;
// reads degrade to keyword search when the graph cannot help.
class HybridMemory {
public:
    // Opens the Fast Store at config.db_path() and, when enabled, the graph
    // at config.graph_dir(). A graph that fails to open is logged and
    // treated as disabled. Throws StorageError if the Fast Store fails.
    HybridMemory(const MemoryConfig& config, EmbeddingGate::Factory embedder_factory,
                 bool start_worker = true);

    // Same, with an explicit graph store (null = graph disabled).
    HybridMemory(const MemoryConfig& config, std::unique_ptr<GraphStore> graph,
                 EmbeddingGate::Factory embedder_factory, bool start_worker = true);

    ~HybridMemory();

    HybridMemory(const HybridMemory&) = delete;
    HybridMemory& operator=(const HybridMemory&) = delete;

    // Durable insert plus sync-queue entry (none when the graph is disabled
    // by configuration). Returns the new id.
    int64_t store(const std::string& content,
                  const std::string& category = "general",
                  Importance importance = Importance::Medium,
                  const nlohmann::json& metadata = nlohmann::json::object());

    std::vector<RecallHit> recall(const RecallQuery& query);

    MemoryStats get_stats();

    // Wipe records, queue and graph.
    void clear();

    // Re-enqueue records that have no graph node and no pending entry.
    // Returns the number enqueued.
    size_t reindex();

    // Block until the queue is empty or the timeout passes.
    bool wait_for_sync(std::chrono::milliseconds timeout);

    bool graph_available() const { return graph_ != nullptr; }

    FastStore& fast_store() { return store_; }
    GraphIndexer& indexer() { return indexer_; }
    GraphStore* graph() { return graph_.get(); }

private:
    MemoryConfig config_;
    FastStore store_;
    std::unique_ptr<GraphStore> graph_;
    EmbeddingGate embeddings_;
    GraphIndexer indexer_;
    RecallRouter router_;
};

// Open the configured graph store, or null if disabled or unavailable.
std::unique_ptr<GraphStore> open_graph_store(const MemoryConfig& config);

IndexerOptions indexer_options(const MemoryConfig& config);
RouterOptions router_options(const MemoryConfig& config);

} // namespace klaus
