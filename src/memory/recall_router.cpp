#include "recall_router.hpp"
#include "extraction.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace klaus {

RecallRouter::RecallRouter(FastStore& store, GraphStore* graph, EmbeddingGate& embeddings,
                           RouterOptions options)
    : store_(store), graph_(graph), embeddings_(embeddings), options_(options) {}

std::vector<RecallHit> RecallRouter::recall(const RecallQuery& query) {
    if (query.limit == 0) return {};
    switch (query.type) {
        case QueryType::Quick:    return quick(query.text, query.limit);
        case QueryType::Semantic: return semantic(query.text, query.limit);
        case QueryType::Context:  return context(query.text, query.limit, query.context_depth);
        case QueryType::Related:  return related(query.text, query.limit);
    }
    return quick(query.text, query.limit);
}

std::vector<RecallHit> RecallRouter::deliver(std::vector<MemoryRecord> records,
                                             bool with_score) {
    std::vector<int64_t> ids;
    ids.reserve(records.size());
    for (const auto& rec : records) ids.push_back(rec.id);
    store_.touch(ids);

    std::vector<RecallHit> hits;
    hits.reserve(records.size());
    for (const auto& rec : records) hits.push_back(hit_from_record(rec, with_score));
    return hits;
}

std::vector<RecallHit> RecallRouter::quick(const std::string& text, uint32_t limit) {
    std::vector<RecallHit> hits;
    for (const auto& rec : store_.recall(text, limit)) {
        hits.push_back(hit_from_record(rec, true));
    }
    return hits;
}

std::vector<RecallHit> RecallRouter::semantic(const std::string& text, uint32_t limit) {
    // Embedding similarity over every stored vector
    auto query_vec = embeddings_.embed(text);
    if (query_vec) {
        std::vector<MemoryRecord> scored;
        for (auto& rec : store_.embedded_records()) {
            if (!rec.embedding) continue;
            double sim = dot_product(*query_vec, *rec.embedding);
            if (sim >= options_.semantic_threshold) {
                rec.score = sim;
                scored.push_back(std::move(rec));
            }
        }
        if (!scored.empty()) {
            std::sort(scored.begin(), scored.end(),
                      [](const MemoryRecord& a, const MemoryRecord& b) {
                          if (a.score != b.score) return a.score > b.score;
                          return a.id > b.id;
                      });
            if (scored.size() > limit) scored.resize(limit);
            return deliver(std::move(scored), true);
        }
    }

    // Topic match in the graph
    if (graph_) {
        auto topics = extract_topics(text, options_.max_topics);
        if (!topics.empty()) {
            try {
                auto records = store_.get_many(graph_->memories_with_topics(topics, limit));
                if (!records.empty()) return deliver(std::move(records), false);
            } catch (const GraphError& e) {
                std::cerr << "[graph] Topic recall failed: " << e.what() << "\n";
            }
        }
    }

    return quick(text, limit);
}

std::vector<RecallHit> RecallRouter::context(const std::string& text, uint32_t limit,
                                             uint32_t depth) {
    auto needle = truncate_utf8(trim(text), options_.seed_max_chars);
    if (!graph_ || needle.empty()) return quick(text, limit);

    try {
        auto seed = graph_->latest_memory_containing(needle);
        if (!seed) return quick(text, limit);

        // Breadth-first expansion, one hop per level
        uint32_t hops = std::min(depth, options_.max_context_depth);
        std::set<int64_t> visited{*seed};
        std::vector<int64_t> frontier{*seed};
        std::vector<int64_t> reached;
        for (uint32_t level = 0; level < hops && !frontier.empty(); level++) {
            std::vector<int64_t> next;
            for (int64_t id : frontier) {
                for (int64_t n : graph_->neighbors(id)) {
                    if (visited.insert(n).second) {
                        next.push_back(n);
                        reached.push_back(n);
                    }
                }
            }
            frontier = std::move(next);
        }

        auto seed_record = store_.get(*seed);
        if (!seed_record) return quick(text, limit);

        auto neighbours = store_.get_many(reached);
        std::sort(neighbours.begin(), neighbours.end(),
                  [](const MemoryRecord& a, const MemoryRecord& b) {
                      if (a.created_at != b.created_at) return a.created_at > b.created_at;
                      return a.id > b.id;
                  });

        std::vector<MemoryRecord> records;
        records.push_back(std::move(*seed_record));
        for (auto& rec : neighbours) {
            if (records.size() >= limit) break;
            records.push_back(std::move(rec));
        }
        return deliver(std::move(records), false);
    } catch (const GraphError& e) {
        std::cerr << "[graph] Context recall failed: " << e.what() << "\n";
    }
    return quick(text, limit);
}

std::vector<RecallHit> RecallRouter::related(const std::string& text, uint32_t limit) {
    auto entities = extract_entities(text, options_.max_entities);
    if (graph_ && !entities.empty()) {
        std::vector<std::string> names;
        for (const auto& e : entities) names.push_back(e.name);
        try {
            auto records = store_.get_many(graph_->memories_mentioning(names, limit));
            if (!records.empty()) return deliver(std::move(records), false);
        } catch (const GraphError& e) {
            std::cerr << "[graph] Related recall failed: " << e.what() << "\n";
        }
    }
    return semantic(text, limit);
}

} // namespace klaus
