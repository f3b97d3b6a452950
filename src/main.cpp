#include "config.hpp"
#include "embedder.hpp"
#include "http.hpp"
#include "memory.hpp"
#include "memory/extraction.hpp"
#include "memory/hybrid_memory.hpp"
#include "util.hpp"
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static void print_usage() {
    std::cout << "Usage: klaus-memory <command> [args] [options]\n"
              << "\n"
              << "Commands:\n"
              << "  store TEXT           Remember TEXT\n"
              << "  recall QUERY         Retrieve memories for QUERY\n"
              << "  stats                Show store statistics\n"
              << "  clear                Delete all memories and the graph\n"
              << "  reindex              Queue memories missing from the graph\n"
              << "  extract TEXT         Preview topics and entities for TEXT\n"
              << "\n"
              << "Options:\n"
              << "  --category NAME      Category for store (default: general)\n"
              << "  --importance LEVEL   low, medium or high (default: medium)\n"
              << "  --meta JSON          Metadata object for store\n"
              << "  --type TYPE          quick, semantic, context or related (default: quick)\n"
              << "  --limit N            Maximum results for recall\n"
              << "  --depth N            Traversal depth for context recall (max 5)\n"
              << "  --db PATH            Memory database path\n"
              << "  --graph PATH         Graph directory\n"
              << "  --no-graph           Run without the graph store\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  KLAUS_MEMORY_DB          Memory database path\n"
              << "  KLAUS_GRAPH_PATH         Graph directory\n"
              << "  KLAUS_GRAPH_ENABLED      0/false to disable the graph\n"
              << "  KLAUS_EMBEDDING_PROVIDER openai, ollama or none\n"
              << "  OPENAI_API_KEY           API key for OpenAI embeddings\n"
              << "  OLLAMA_BASE_URL          Base URL for Ollama (default: http://localhost:11434)\n";
}

static bool parse_uint(const char* s, uint32_t& out) {
    try {
        size_t pos = 0;
        unsigned long v = std::stoul(s, &pos);
        if (pos != std::strlen(s)) return false;
        out = static_cast<uint32_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

static void print_topics(klaus::HybridMemory& memory, int64_t id) {
    if (!memory.graph()) return;
    std::vector<std::string> topics;
    try {
        topics = memory.graph()->topics_of(id);
    } catch (const klaus::GraphError& e) {
        std::cerr << "[graph] Topic lookup failed: " << e.what() << "\n";
        return;
    }
    if (topics.empty()) return;
    std::cout << "    topics:";
    for (size_t i = 0; i < topics.size(); i++) {
        std::cout << (i == 0 ? " " : ", ") << topics[i];
    }
    std::cout << "\n";
}

static void print_hits(klaus::HybridMemory& memory, const std::vector<klaus::RecallHit>& hits,
                       klaus::QueryType type) {
    if (hits.empty()) {
        std::cout << "No memories found (" << klaus::query_type_to_string(type) << " recall).\n";
        return;
    }
    for (const auto& hit : hits) {
        std::cout << "[" << hit.id << "] (" << hit.category << ", "
                  << klaus::timestamp_from_epoch(hit.created_at) << ")";
        if (hit.score) {
            std::cout << " score=" << std::fixed << std::setprecision(3) << *hit.score;
        }
        std::cout << "\n    " << hit.content << "\n";
        print_topics(memory, hit.id);
    }
}

static void print_stats(const klaus::MemoryStats& stats) {
    std::cout << "Memories:      " << stats.fast_store.total << "\n";
    for (const auto& [category, n] : stats.fast_store.by_category) {
        std::cout << "  " << category << ": " << n << "\n";
    }
    std::cout << "Pending sync:  " << stats.pending_sync_count << "\n";
    std::cout << "Graph:         "
              << (stats.graph_available ? "available" : "disabled") << "\n";
    if (stats.graph_available) {
        std::cout << "  nodes: " << stats.graph_store.node_count
                  << "  edges: " << stats.graph_store.edge_count << "\n";
    }
    std::cout << "Embeddings:    " << stats.embedding_model.value_or("none") << "\n";
}

static void print_extraction(const std::string& text, const klaus::MemoryConfig& cfg) {
    std::cout << "Topics:\n";
    for (const auto& topic : klaus::extract_topics(text, cfg.max_topics)) {
        std::cout << "  " << topic << "\n";
    }
    std::cout << "Entities:\n";
    for (const auto& entity : klaus::extract_entities(text, cfg.max_entities)) {
        std::cout << "  " << entity.name << " ["
                  << klaus::entity_type_to_string(entity.type) << "]\n";
    }
}

int main(int argc, char* argv[]) try {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command;
    std::string text;
    std::string category = "general";
    auto importance = klaus::Importance::Medium;
    std::string meta;
    std::string type = "quick";
    std::string db_path;
    std::string graph_path;
    bool no_graph = false;
    uint32_t limit = 0;
    uint32_t depth = 0;
    bool have_limit = false;
    bool have_depth = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--category") == 0 && i + 1 < argc) {
            category = argv[++i];
        } else if (std::strcmp(argv[i], "--importance") == 0 && i + 1 < argc) {
            auto level = klaus::parse_importance(argv[++i]);
            if (!level) {
                std::cerr << "Invalid --importance: " << argv[i] << "\n";
                return 1;
            }
            importance = *level;
        } else if (std::strcmp(argv[i], "--meta") == 0 && i + 1 < argc) {
            meta = argv[++i];
        } else if (std::strcmp(argv[i], "--type") == 0 && i + 1 < argc) {
            type = argv[++i];
        } else if (std::strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
            if (!parse_uint(argv[++i], limit)) {
                std::cerr << "Invalid --limit: " << argv[i] << "\n";
                return 1;
            }
            have_limit = true;
        } else if (std::strcmp(argv[i], "--depth") == 0 && i + 1 < argc) {
            if (!parse_uint(argv[++i], depth)) {
                std::cerr << "Invalid --depth: " << argv[i] << "\n";
                return 1;
            }
            have_depth = true;
        } else if (std::strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_path = argv[++i];
        } else if (std::strcmp(argv[i], "--graph") == 0 && i + 1 < argc) {
            graph_path = argv[++i];
        } else if (std::strcmp(argv[i], "--no-graph") == 0) {
            no_graph = true;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else if (command.empty()) {
            command = argv[i];
        } else {
            if (!text.empty()) text += ' ';
            text += argv[i];
        }
    }

    auto config = klaus::Config::load();
    auto& mem_cfg = config.memory;
    if (!db_path.empty()) mem_cfg.path = db_path;
    if (!graph_path.empty()) mem_cfg.graph_path = graph_path;
    if (no_graph) mem_cfg.graph_enabled = false;

    // Extraction preview needs no storage
    if (command == "extract") {
        if (text.empty()) {
            std::cerr << "extract requires TEXT\n";
            return 1;
        }
        print_extraction(text, mem_cfg);
        return 0;
    }

    if (command != "store" && command != "recall" && command != "stats" &&
        command != "clear" && command != "reindex") {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        return 1;
    }

    klaus::HttpRuntime http_runtime;
    klaus::PlatformHttpClient http_client;
    auto embed_cfg = mem_cfg.embeddings;
    auto factory = [&http_client, embed_cfg]() {
        return klaus::create_embedder(embed_cfg, http_client);
    };

    int rc = 0;
    {
        // One-shot process: drain in the foreground instead of a worker
        klaus::HybridMemory memory(mem_cfg, factory, false);

        if (command == "store") {
            if (text.empty()) {
                std::cerr << "store requires TEXT\n";
                rc = 1;
            } else {
                auto metadata = nlohmann::json::object();
                if (!meta.empty()) {
                    metadata = nlohmann::json::parse(meta, nullptr, false);
                    if (metadata.is_discarded() || !metadata.is_object()) {
                        std::cerr << "--meta must be a JSON object\n";
                        rc = 1;
                    }
                }
                if (rc == 0) {
                    auto id = memory.store(text, category, importance, metadata);
                    std::cout << "Stored memory " << id << "\n";
                    if (memory.graph_available() &&
                        !memory.wait_for_sync(std::chrono::seconds(10))) {
                        std::cerr << "[sync] Indexing still pending; it resumes on next start\n";
                    }
                }
            }
        } else if (command == "recall") {
            auto query_type = klaus::query_type_from_string(type);
            if (!query_type) {
                std::cerr << "Unknown recall type: " << type << "\n";
                rc = 1;
            } else {
                klaus::RecallQuery query;
                query.type = *query_type;
                query.text = text;
                query.limit = have_limit ? limit : mem_cfg.recall_limit;
                query.context_depth = have_depth ? depth : mem_cfg.context_depth;
                print_hits(memory, memory.recall(query), query.type);
            }
        } else if (command == "stats") {
            print_stats(memory.get_stats());
        } else if (command == "clear") {
            auto removed = memory.fast_store().count();
            memory.clear();
            std::cout << "Memory cleared (" << removed << " memories removed).\n";
        } else if (command == "reindex") {
            auto queued = memory.reindex();
            std::cout << "Queued " << queued << " memories for indexing.\n";
            if (queued > 0 && !memory.wait_for_sync(std::chrono::seconds(60))) {
                std::cerr << "[sync] Indexing still pending; it resumes on next start\n";
            }
        }
    }

    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
}
