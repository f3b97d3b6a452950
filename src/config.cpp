#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace klaus {

std::string MemoryConfig::db_path() const {
    if (path.empty()) return expand_home("~/.klaus/memory/agent_memory.db");
    return expand_home(path);
}

std::string MemoryConfig::graph_dir() const {
    if (!graph_path.empty()) return expand_home(graph_path);
    std::filesystem::path db(db_path());
    return (db.parent_path() / (db.stem().string() + "_graph")).string();
}

nlohmann::json Config::defaults_json() {
    return {
        {"memory", {
            {"path", ""},
            {"graph_path", ""},
            {"graph_enabled", true},
            {"recall_limit", 5},
            {"context_depth", 2},
            {"sync_batch_size", 10},
            {"sync_busy_interval_ms", 200},
            {"sync_idle_interval_ms", 1000},
            {"sync_error_backoff_ms", 2000},
            {"compact_synced_after", 0},
            {"semantic_threshold", 0.65},
            {"max_topics", 3},
            {"max_entities", 3},
            {"related_fanout", 5},
            {"related_strength", 0.8},
            {"embeddings", {
                {"provider", ""},
                {"api_key", ""},
                {"base_url", ""},
                {"model", ""}
            }}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned())
        out = obj[key].get<uint32_t>();
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number())
        out = obj[key].get<double>();
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object() || !j.contains("memory") || !j["memory"].is_object()) {
        return cfg;
    }

    const auto& m = j["memory"];
    read_string(m, "path", cfg.memory.path);
    read_string(m, "graph_path", cfg.memory.graph_path);
    if (m.contains("graph_enabled") && m["graph_enabled"].is_boolean())
        cfg.memory.graph_enabled = m["graph_enabled"].get<bool>();

    read_uint(m, "recall_limit", cfg.memory.recall_limit);
    read_uint(m, "context_depth", cfg.memory.context_depth);
    read_uint(m, "sync_batch_size", cfg.memory.sync_batch_size);
    read_uint(m, "sync_busy_interval_ms", cfg.memory.sync_busy_interval_ms);
    read_uint(m, "sync_idle_interval_ms", cfg.memory.sync_idle_interval_ms);
    read_uint(m, "sync_error_backoff_ms", cfg.memory.sync_error_backoff_ms);
    read_uint(m, "compact_synced_after", cfg.memory.compact_synced_after);
    read_double(m, "semantic_threshold", cfg.memory.semantic_threshold);
    read_uint(m, "max_topics", cfg.memory.max_topics);
    read_uint(m, "max_entities", cfg.memory.max_entities);
    read_uint(m, "related_fanout", cfg.memory.related_fanout);
    read_double(m, "related_strength", cfg.memory.related_strength);

    if (cfg.memory.sync_batch_size == 0) cfg.memory.sync_batch_size = 1;

    if (m.contains("embeddings") && m["embeddings"].is_object()) {
        const auto& e = m["embeddings"];
        read_string(e, "provider", cfg.memory.embeddings.provider);
        read_string(e, "api_key", cfg.memory.embeddings.api_key);
        read_string(e, "base_url", cfg.memory.embeddings.base_url);
        read_string(e, "model", cfg.memory.embeddings.model);
    }
    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.klaus/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("KLAUS_MEMORY_DB"))
        cfg.memory.path = v;
    if (const char* v = std::getenv("KLAUS_GRAPH_PATH"))
        cfg.memory.graph_path = v;
    if (const char* v = std::getenv("KLAUS_GRAPH_ENABLED")) {
        std::string s = to_lower(v);
        cfg.memory.graph_enabled = !(s == "0" || s == "false" || s == "no" || s == "off");
    }
    if (const char* v = std::getenv("KLAUS_EMBEDDING_PROVIDER"))
        cfg.memory.embeddings.provider = v;
    if (const char* v = std::getenv("OPENAI_API_KEY")) {
        if (cfg.memory.embeddings.api_key.empty())
            cfg.memory.embeddings.api_key = v;
    }
    if (const char* v = std::getenv("OLLAMA_BASE_URL")) {
        if (cfg.memory.embeddings.provider == "ollama")
            cfg.memory.embeddings.base_url = v;
    }

    return cfg;
}

} // namespace klaus
