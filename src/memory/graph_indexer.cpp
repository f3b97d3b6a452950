#include "graph_indexer.hpp"
#include "extraction.hpp"
#include <chrono>
#include <exception>
#include <iostream>

namespace klaus {

GraphIndexer::GraphIndexer(FastStore& store, GraphStore* graph, EmbeddingGate& embeddings,
                           IndexerOptions options)
    : store_(store), graph_(graph), embeddings_(embeddings), options_(options) {}

GraphIndexer::~GraphIndexer() {
    stop();
}

bool GraphIndexer::sync_to_graph(const SyncPayload& payload) {
    if (!graph_) return false;
    const int64_t id = payload.memory_id;

    // Memory node first; nothing else is attempted without it.
    try {
        graph_->upsert_memory(payload);
    } catch (const std::exception& e) {
        std::cerr << "[sync] Memory node " << id << " failed: " << e.what() << "\n";
        return false;
    }

    bool ok = true;
    auto step = [&](const char* what, auto&& fn) {
        try {
            fn();
        } catch (const std::exception& e) {
            std::cerr << "[sync] " << what << " for memory " << id
                      << " failed: " << e.what() << "\n";
            ok = false;
        }
    };

    auto topics = extract_topics(payload.content, options_.max_topics);
    for (const auto& topic : topics) {
        step("Topic link", [&] {
            graph_->merge_topic(topic);
            graph_->link_topic(id, topic);
        });
    }

    for (const auto& entity : extract_entities(payload.content, options_.max_entities)) {
        step("Entity link", [&] {
            graph_->merge_entity(entity);
            graph_->link_entity(id, entity.name);
        });
    }

    step("Embedding", [&] {
        auto vec = embeddings_.embed(payload.content);
        if (vec) store_.set_embedding(id, *vec);
    });

    step("Temporal link", [&] {
        auto prev = graph_->previous_memory(id);
        if (prev) graph_->link_follows(id, *prev);
    });

    if (!topics.empty()) {
        step("Related links", [&] {
            for (int64_t other : graph_->memories_sharing_topics(id, options_.related_fanout)) {
                graph_->link_related(id, other, options_.related_strength);
            }
        });
    }

    return ok;
}

DrainResult GraphIndexer::drain_once() {
    DrainResult result;
    if (!graph_) return result;

    std::lock_guard<std::mutex> lock(drain_mutex_);
    auto& queue = store_.sync_queue();
    for (const auto& entry : queue.pending(options_.batch_size)) {
        result.processed++;

        SyncPayload payload = entry.payload;
        if (!entry.readable) {
            auto rec = store_.get(entry.memory_id);
            if (!rec) {
                std::cerr << "[sync] Dropping queue item " << entry.queue_id
                          << ": memory " << entry.memory_id << " no longer exists\n";
                if (queue.discard(entry.queue_id)) result.discarded++;
                continue;
            }
            payload.content = rec->content;
            payload.category = rec->category;
            payload.importance = rec->importance;
            payload.created_at = rec->created_at;
        }

        if (sync_to_graph(payload)) {
            queue.mark_synced(entry.queue_id);
            result.synced++;
        } else {
            queue.record_failure(entry.queue_id);
            result.failed++;
        }
    }
    return result;
}

size_t GraphIndexer::recover_pending() {
    if (!graph_) return 0;

    auto pending = store_.sync_queue().pending_count();
    if (pending > 0) {
        std::cerr << "[sync] Recovering " << pending << " pending memories\n";
    }

    size_t total = 0;
    for (;;) {
        auto result = drain_once();
        total += result.synced;
        if (result.processed == 0 || result.synced + result.discarded == 0) break;
    }
    if (pending > 0) {
        std::cerr << "[sync] Recovered " << total << " of " << pending << "\n";
    }
    return total;
}

void GraphIndexer::start() {
    if (!graph_ || running_.exchange(true)) return;
    thread_ = std::thread([this]() { worker_loop(); });
}

void GraphIndexer::stop() {
    if (!running_.exchange(false)) return;
    notify();
    if (thread_.joinable()) thread_.join();
}

void GraphIndexer::notify() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        wake_pending_ = true;
    }
    wake_cv_.notify_one();
}

void GraphIndexer::worker_loop() {
    while (running_.load()) {
        uint32_t wait_ms = options_.idle_interval_ms;
        try {
            auto result = drain_once();
            if (result.failed > 0) {
                wait_ms = options_.error_backoff_ms;
            } else if (result.processed > 0) {
                wait_ms = options_.busy_interval_ms;
            } else if (options_.compact_synced_after > 0) {
                store_.sync_queue().compact_synced(options_.compact_synced_after);
            }
        } catch (const std::exception& e) {
            std::cerr << "[sync] Worker error: " << e.what() << "\n";
            wait_ms = options_.error_backoff_ms;
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, std::chrono::milliseconds(wait_ms),
                          [this]() { return wake_pending_ || !running_.load(); });
        wake_pending_ = false;
    }
}

} // namespace klaus
