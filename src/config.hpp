#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace klaus {

struct EmbeddingConfig {
    std::string provider;   // "" = auto-detect, "none", "openai", "ollama"
    std::string api_key;    // falls back to OPENAI_API_KEY for openai
    std::string base_url;   // empty = provider default
    std::string model;      // empty = provider default
};

struct MemoryConfig {
    std::string path;              // empty = ~/.klaus/memory/agent_memory.db
    std::string graph_path;        // empty = "<path stem>_graph" beside the db
    bool graph_enabled = true;

    uint32_t recall_limit = 5;
    uint32_t context_depth = 2;

    uint32_t sync_batch_size = 10;
    uint32_t sync_busy_interval_ms = 200;
    uint32_t sync_idle_interval_ms = 1000;
    uint32_t sync_error_backoff_ms = 2000;
    uint32_t compact_synced_after = 0;  // seconds; 0 = keep the full audit trail

    double semantic_threshold = 0.65;
    uint32_t max_topics = 3;
    uint32_t max_entities = 3;
    uint32_t related_fanout = 5;
    double related_strength = 0.8;

    EmbeddingConfig embeddings;

    // Resolved database path (applies the default and ~ expansion)
    std::string db_path() const;

    // Resolved graph directory
    std::string graph_dir() const;
};

struct Config {
    MemoryConfig memory;

    // Load from ~/.klaus/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config JSON document (no file or env access)
    static Config from_json(const nlohmann::json& j);
};

} // namespace klaus
