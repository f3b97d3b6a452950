#include "hybrid_memory.hpp"
#include "sqlite_graph_store.hpp"
#include <iostream>
#include <thread>

namespace klaus {

std::unique_ptr<GraphStore> open_graph_store(const MemoryConfig& config) {
    if (!config.graph_enabled) {
        std::cerr << "[graph] Disabled by configuration\n";
        return nullptr;
    }
    try {
        return std::make_unique<SqliteGraphStore>(config.graph_dir());
    } catch (const GraphError& e) {
        std::cerr << "[graph] Unavailable, using fast store only: " << e.what() << "\n";
    }
    return nullptr;
}

IndexerOptions indexer_options(const MemoryConfig& config) {
    IndexerOptions opts;
    opts.batch_size = config.sync_batch_size;
    opts.busy_interval_ms = config.sync_busy_interval_ms;
    opts.idle_interval_ms = config.sync_idle_interval_ms;
    opts.error_backoff_ms = config.sync_error_backoff_ms;
    opts.compact_synced_after = config.compact_synced_after;
    opts.max_topics = config.max_topics;
    opts.max_entities = config.max_entities;
    opts.related_fanout = config.related_fanout;
    opts.related_strength = config.related_strength;
    return opts;
}

RouterOptions router_options(const MemoryConfig& config) {
    RouterOptions opts;
    opts.semantic_threshold = config.semantic_threshold;
    opts.max_topics = config.max_topics;
    opts.max_entities = config.max_entities;
    return opts;
}

HybridMemory::HybridMemory(const MemoryConfig& config, EmbeddingGate::Factory embedder_factory,
                           bool start_worker)
    : HybridMemory(config, open_graph_store(config), std::move(embedder_factory),
                   start_worker) {}

HybridMemory::HybridMemory(const MemoryConfig& config, std::unique_ptr<GraphStore> graph,
                           EmbeddingGate::Factory embedder_factory, bool start_worker)
    : config_(config),
      store_(config.db_path()),
      graph_(std::move(graph)),
      embeddings_(std::move(embedder_factory)),
      indexer_(store_, graph_.get(), embeddings_, indexer_options(config)),
      router_(store_, graph_.get(), embeddings_, router_options(config)) {
    // Replay anything left unsynced by a previous run before taking traffic
    indexer_.recover_pending();
    if (start_worker) indexer_.start();
}

HybridMemory::~HybridMemory() {
    indexer_.stop();
}

int64_t HybridMemory::store(const std::string& content, const std::string& category,
                            Importance importance, const nlohmann::json& metadata) {
    // A graph switched off in the config gets no backlog; reindex() covers
    // these records if it is switched back on. An unreachable graph does.
    int64_t id = store_.store(content, category, importance, metadata,
                              config_.graph_enabled);
    indexer_.notify();
    return id;
}

std::vector<RecallHit> HybridMemory::recall(const RecallQuery& query) {
    return router_.recall(query);
}

MemoryStats HybridMemory::get_stats() {
    MemoryStats stats;
    stats.fast_store = store_.stats();
    stats.pending_sync_count = store_.sync_queue().pending_count();
    stats.graph_available = graph_ != nullptr;
    if (graph_) {
        try {
            stats.graph_store = graph_->stats();
        } catch (const GraphError& e) {
            std::cerr << "[graph] Stats failed: " << e.what() << "\n";
        }
    }
    stats.embedding_model = embeddings_.model_name();
    return stats;
}

void HybridMemory::clear() {
    bool was_running = indexer_.running();
    indexer_.stop();

    store_.clear();
    if (graph_) {
        try {
            graph_->clear();
        } catch (const GraphError& e) {
            std::cerr << "[graph] Clear failed: " << e.what() << "\n";
        }
    }
    std::cerr << "[memory] Cleared " << store_.path() << "\n";

    if (was_running) indexer_.start();
}

size_t HybridMemory::reindex() {
    if (!graph_) return 0;

    size_t enqueued = 0;
    // Id order, so temporal links are rebuilt oldest first
    for (const auto& rec : store_.list_all()) {
        bool indexed = false;
        try {
            indexed = graph_->has_memory(rec.id);
        } catch (const GraphError& e) {
            std::cerr << "[graph] Reindex lookup failed: " << e.what() << "\n";
            break;
        }
        if (indexed) continue;

        bool pending = false;
        for (const auto& entry : store_.sync_queue().entries_for(rec.id)) {
            if (!entry.synced) pending = true;
        }
        if (pending) continue;

        SyncPayload payload;
        payload.memory_id = rec.id;
        payload.content = rec.content;
        payload.category = rec.category;
        payload.importance = rec.importance;
        payload.created_at = rec.created_at;
        store_.sync_queue().enqueue(rec.id, payload);
        enqueued++;
    }

    if (enqueued > 0) {
        std::cerr << "[sync] Reindex queued " << enqueued << " memories\n";
        indexer_.notify();
    }
    return enqueued;
}

bool HybridMemory::wait_for_sync(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (store_.sync_queue().pending_count() == 0) return true;
        if (!graph_ || std::chrono::steady_clock::now() >= deadline) return false;

        if (indexer_.running()) {
            indexer_.notify();
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        } else {
            auto result = indexer_.drain_once();
            if (result.synced + result.discarded == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        }
    }
}

} // namespace klaus
