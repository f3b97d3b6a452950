#pragma once
#include "../memory.hpp"
#include "embedding_gate.hpp"
#include "fast_store.hpp"
#include "graph_store.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

namespace klaus {

struct IndexerOptions {
    uint32_t batch_size = 10;
    uint32_t busy_interval_ms = 200;
    uint32_t idle_interval_ms = 1000;
    uint32_t error_backoff_ms = 2000;
    uint32_t compact_synced_after = 0; // seconds, 0 = keep synced rows
    size_t max_topics = 3;
    size_t max_entities = 3;
    uint32_t related_fanout = 5;
    double related_strength = 0.8;
};

struct DrainResult {
    size_t processed = 0;
    size_t synced = 0;
    size_t failed = 0;
    size_t discarded = 0; // unreadable entries whose memory no longer exists
};

// Drains the sync queue into the graph. Runs on a background thread between
// start() and stop(); drain_once() and recover_pending() may also be called
// directly. Entries are marked synced only after a fully successful sync.
class GraphIndexer {
public:
    // graph may be null (graph disabled): nothing is drained.
    GraphIndexer(FastStore& store, GraphStore* graph, EmbeddingGate& embeddings,
                 IndexerOptions options = {});
    ~GraphIndexer();

    GraphIndexer(const GraphIndexer&) = delete;
    GraphIndexer& operator=(const GraphIndexer&) = delete;

    // Index one memory. Returns false if any step failed; writes that
    // succeeded before the failure are kept.
    bool sync_to_graph(const SyncPayload& payload);

    // Process one batch of pending entries. An unreadable payload is rebuilt
    // from its record, or discarded when the record is gone. Throws
    // StorageError if the queue itself cannot be read.
    DrainResult drain_once();

    // Drain until the queue is empty or a pass makes no progress.
    // Returns the number of entries synced.
    size_t recover_pending();

    void start();
    void stop();

    // Wake the worker early (new work was enqueued).
    void notify();

    bool running() const { return running_.load(); }

private:
    void worker_loop();

    FastStore& store_;
    GraphStore* graph_;
    EmbeddingGate& embeddings_;
    IndexerOptions options_;

    std::mutex drain_mutex_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool wake_pending_ = false;
};

} // namespace klaus
