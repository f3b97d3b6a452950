#pragma once
#include "../memory.hpp"
#include "extraction.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace klaus {

// Typed access to the relationship graph: Memory, Topic and Entity nodes
// with HAS_TOPIC, MENTIONS, RELATED_TO and FOLLOWS edges. Every write is an
// idempotent merge. Implementations report failures as GraphError.
class GraphStore {
public:
    virtual ~GraphStore() = default;

    // ── Writes ───────────────────────────────────────────────────
    virtual void upsert_memory(const SyncPayload& payload) = 0;
    virtual void merge_topic(const std::string& name) = 0;
    virtual void merge_entity(const Entity& entity) = 0;
    virtual void link_topic(int64_t memory_id, const std::string& topic) = 0;
    virtual void link_entity(int64_t memory_id, const std::string& entity) = 0;
    virtual void link_related(int64_t from_id, int64_t to_id, double strength) = 0;
    virtual void link_follows(int64_t from_id, int64_t to_id) = 0;
    virtual void clear() = 0;

    // ── Queries ──────────────────────────────────────────────────
    virtual bool has_memory(int64_t id) = 0;

    // Highest-id Memory node strictly below id.
    virtual std::optional<int64_t> previous_memory(int64_t id) = 0;

    // Other memories sharing at least one topic with id, newest id first.
    virtual std::vector<int64_t> memories_sharing_topics(int64_t id, uint32_t limit) = 0;

    // Memories tagged with any of the topics, most recent first.
    virtual std::vector<int64_t> memories_with_topics(const std::vector<std::string>& topics,
                                                      uint32_t limit) = 0;

    // Memories mentioning any of the entity names, most recent first.
    virtual std::vector<int64_t> memories_mentioning(const std::vector<std::string>& entities,
                                                     uint32_t limit) = 0;

    // Most recent memory whose content contains text (case-insensitive, folded
    // like to_lower()).
    virtual std::optional<int64_t> latest_memory_containing(const std::string& text) = 0;

    // One traversal hop: RELATED_TO in either direction, FOLLOWS towards
    // the predecessor.
    virtual std::vector<int64_t> neighbors(int64_t id) = 0;

    // Topic labels linked to a memory, sorted (shown by the CLI's recall).
    virtual std::vector<std::string> topics_of(int64_t id) = 0;

    virtual GraphStats stats() = 0;
};

} // namespace klaus
