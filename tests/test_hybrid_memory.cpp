#include <catch2/catch.hpp>
#include "memory/hybrid_memory.hpp"
#include "memory_fakes.hpp"
#include <algorithm>
#include <mutex>
#include <set>
#include <sqlite3.h>
#include <thread>

using namespace klaus;
using namespace std::chrono_literals;

static MemoryConfig test_config(const TempDir& dir) {
    MemoryConfig cfg;
    cfg.path = dir.file("agent_memory.db");
    cfg.sync_busy_interval_ms = 5;
    cfg.sync_idle_interval_ms = 10;
    cfg.sync_error_backoff_ms = 10;
    return cfg;
}

static EmbeddingGate::Factory fake_factory() {
    return [] {
        return std::make_unique<FakeEmbedder>(
            std::vector<std::string>{"database", "performance", "docker"});
    };
}

static std::vector<int64_t> ids_of(const std::vector<RecallHit>& hits) {
    std::vector<int64_t> ids;
    for (const auto& h : hits) ids.push_back(h.id);
    return ids;
}

static RecallQuery query(QueryType type, const std::string& text, uint32_t limit = 5) {
    RecallQuery q;
    q.type = type;
    q.text = text;
    q.limit = limit;
    return q;
}

// ── Write path ───────────────────────────────────────────────

TEST_CASE("HybridMemory: store is durable before the graph sees it", "[hybrid_memory]") {
    TempDir dir("hybrid_store");
    HybridMemory mem(test_config(dir), fake_factory(), false);
    REQUIRE(mem.graph_available());

    auto id = mem.store("We decided to use PostgreSQL for the project", "decision",
                        Importance::High);
    REQUIRE(mem.fast_store().get(id).has_value());
    REQUIRE(mem.get_stats().pending_sync_count == 1);
    REQUIRE_FALSE(mem.graph()->has_memory(id));

    REQUIRE(mem.wait_for_sync(5s));
    REQUIRE(mem.graph()->has_memory(id));
    REQUIRE(mem.get_stats().pending_sync_count == 0);
}

TEST_CASE("HybridMemory: pending entries are recovered on restart", "[hybrid_memory]") {
    TempDir dir("hybrid_recover");
    auto cfg = test_config(dir);
    int64_t id = 0;
    {
        // Graph unreachable; the process dies before it comes back
        HybridMemory mem(cfg, nullptr, fake_factory(), false);
        id = mem.store("Redis cache for session data");
        REQUIRE(mem.get_stats().pending_sync_count == 1);
    }

    HybridMemory mem(cfg, fake_factory(), false);
    REQUIRE(mem.get_stats().pending_sync_count == 0);
    REQUIRE(mem.graph()->has_memory(id));
    REQUIRE(mem.graph()->topics_of(id) == std::vector<std::string>{"Database", "Performance"});
}

TEST_CASE("HybridMemory: background worker syncs new memories", "[hybrid_memory]") {
    TempDir dir("hybrid_worker");
    HybridMemory mem(test_config(dir), fake_factory());
    REQUIRE(mem.indexer().running());

    auto id = mem.store("Docker container deployment notes");
    REQUIRE(mem.wait_for_sync(5s));
    REQUIRE(mem.graph()->has_memory(id));
}

TEST_CASE("HybridMemory: reindex fills graph gaps only", "[hybrid_memory]") {
    TempDir dir("hybrid_reindex");
    HybridMemory mem(test_config(dir), fake_factory(), false);

    auto a = mem.store("Sunny weather expected tomorrow");
    auto b = mem.store("Python list comprehension tips");
    REQUIRE(mem.wait_for_sync(5s));
    REQUIRE(mem.reindex() == 0);

    mem.graph()->clear();
    auto c = mem.store("Gardening schedule for spring");

    // c still has its own pending entry
    REQUIRE(mem.reindex() == 2);
    REQUIRE(mem.get_stats().pending_sync_count == 3);

    REQUIRE(mem.wait_for_sync(5s));
    REQUIRE(mem.graph()->has_memory(a));
    REQUIRE(mem.graph()->has_memory(b));
    REQUIRE(mem.graph()->has_memory(c));
    REQUIRE(mem.graph()->neighbors(b) == std::vector<int64_t>{a});
}

TEST_CASE("HybridMemory: resync after recovery does not duplicate the graph",
          "[hybrid_memory]") {
    TempDir dir("hybrid_idempotent");
    HybridMemory mem(test_config(dir), fake_factory(), false);
    mem.store("We decided to use PostgreSQL for the project");
    mem.store("Redis cache for session data");
    REQUIRE(mem.wait_for_sync(5s));
    auto before = mem.get_stats().graph_store;

    for (const auto& rec : mem.fast_store().list_all()) {
        SyncPayload p;
        p.memory_id = rec.id;
        p.content = rec.content;
        p.category = rec.category;
        p.importance = rec.importance;
        p.created_at = rec.created_at;
        REQUIRE(mem.indexer().sync_to_graph(p));
    }

    auto after = mem.get_stats().graph_store;
    REQUIRE(after.node_count == before.node_count);
    REQUIRE(after.edge_count == before.edge_count);
}

// ── Degraded operation ───────────────────────────────────────

TEST_CASE("HybridMemory: graph disabled still stores and recalls", "[hybrid_memory]") {
    TempDir dir("hybrid_disabled");
    auto cfg = test_config(dir);
    cfg.graph_enabled = false;
    HybridMemory mem(cfg, nullptr, false);
    REQUIRE_FALSE(mem.graph_available());

    auto id = mem.store("Docker container deployment notes");
    for (auto type : {QueryType::Quick, QueryType::Semantic, QueryType::Context,
                      QueryType::Related}) {
        REQUIRE(ids_of(mem.recall(query(type, "docker"))) == std::vector<int64_t>{id});
    }

    auto stats = mem.get_stats();
    REQUIRE_FALSE(stats.graph_available);
    REQUIRE(stats.pending_sync_count == 0);
    REQUIRE(stats.graph_store.node_count == 0);
    REQUIRE(mem.fast_store().sync_queue().entries_for(id).empty());
    REQUIRE(mem.reindex() == 0);
}

TEST_CASE("HybridMemory: re-enabled graph is backfilled by reindex", "[hybrid_memory]") {
    TempDir dir("hybrid_reenable");
    auto cfg = test_config(dir);
    int64_t id = 0;
    {
        auto off = cfg;
        off.graph_enabled = false;
        HybridMemory mem(off, nullptr, false);
        for (int i = 0; i < 20; i++) mem.store("note " + std::to_string(i));
        id = mem.store("Docker container deployment notes");
        REQUIRE(mem.get_stats().pending_sync_count == 0);
    }

    HybridMemory mem(cfg, fake_factory(), false);
    REQUIRE_FALSE(mem.graph()->has_memory(id));
    REQUIRE(mem.reindex() == 21);
    REQUIRE(mem.wait_for_sync(5s));
    REQUIRE(mem.graph()->has_memory(id));
}

TEST_CASE("HybridMemory: failing graph never breaks store or recall", "[hybrid_memory]") {
    TempDir dir("hybrid_failing");
    HybridMemory mem(test_config(dir), std::make_unique<FailingGraphStore>(), nullptr,
                     false);

    auto id = mem.store("We decided to use PostgreSQL for the project");
    for (auto type : {QueryType::Quick, QueryType::Semantic, QueryType::Context,
                      QueryType::Related}) {
        REQUIRE(ids_of(mem.recall(query(type, "PostgreSQL"))) == std::vector<int64_t>{id});
    }

    REQUIRE_FALSE(mem.wait_for_sync(100ms));
    auto stats = mem.get_stats();
    REQUIRE(stats.fast_store.total == 1);
    REQUIRE(stats.pending_sync_count == 1);
    REQUIRE_NOTHROW(mem.clear());
}

TEST_CASE("HybridMemory: unreadable queue rows do not stall indexing", "[hybrid_memory]") {
    TempDir dir("hybrid_bad_rows");
    auto cfg = test_config(dir);
    {
        // Leftovers from a damaged queue, more than one batch's worth
        HybridMemory mem(cfg, nullptr, false);
        sqlite3* raw = nullptr;
        REQUIRE(sqlite3_open(cfg.db_path().c_str(), &raw) == SQLITE_OK);
        for (int i = 0; i < 12; i++) {
            auto sql = "INSERT INTO sync_queue (memory_id, payload, created_at) VALUES (" +
                       std::to_string(9000 + i) + ", 'not json', 0);";
            REQUIRE(sqlite3_exec(raw, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
        }
        sqlite3_close(raw);
    }

    HybridMemory mem(cfg, fake_factory());
    auto id = mem.store("Docker notes");
    REQUIRE(mem.wait_for_sync(5s));
    REQUIRE(mem.graph()->has_memory(id));
    REQUIRE(mem.get_stats().pending_sync_count == 0);
}

TEST_CASE("HybridMemory: content with invalid UTF-8 is stored", "[hybrid_memory]") {
    TempDir dir("hybrid_latin1");
    HybridMemory mem(test_config(dir), nullptr, false);

    const std::string content = "caf\xe9 notes";
    auto id = mem.store(content, "general", Importance::Medium, {{"note", content}});
    REQUIRE(mem.fast_store().get(id)->content == content);
    REQUIRE(ids_of(mem.recall(query(QueryType::Quick, "notes"))) == std::vector<int64_t>{id});

    REQUIRE(mem.wait_for_sync(5s));
    REQUIRE(mem.graph()->has_memory(id));
}

// ── Concurrency ──────────────────────────────────────────────

TEST_CASE("HybridMemory: concurrent callers while the worker runs", "[hybrid_memory]") {
    TempDir dir("hybrid_concurrent");
    HybridMemory mem(test_config(dir), fake_factory());
    REQUIRE(mem.indexer().running());

    const int threads = 4;
    const int per_thread = 25;
    const QueryType types[] = {QueryType::Quick, QueryType::Semantic, QueryType::Context,
                               QueryType::Related};

    std::mutex ids_mutex;
    std::vector<int64_t> ids;
    std::atomic<int> errors{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; t++) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < per_thread; i++) {
                try {
                    auto id = mem.store("Database performance note " + std::to_string(t) +
                                        "-" + std::to_string(i));
                    {
                        std::lock_guard<std::mutex> lock(ids_mutex);
                        ids.push_back(id);
                    }
                    (void)mem.recall(query(types[(t + i) % 4], "database performance"));
                } catch (const std::exception&) {
                    errors++;
                }
            }
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(errors.load() == 0);
    REQUIRE(ids.size() == static_cast<size_t>(threads * per_thread));
    REQUIRE(std::set<int64_t>(ids.begin(), ids.end()).size() == ids.size());
    REQUIRE(mem.get_stats().fast_store.total == static_cast<uint64_t>(threads * per_thread));

    REQUIRE(mem.wait_for_sync(10s));
    REQUIRE(mem.get_stats().pending_sync_count == 0);
    auto last = *std::max_element(ids.begin(), ids.end());
    REQUIRE(mem.graph()->has_memory(last));
}

// ── End-to-end retrieval ─────────────────────────────────────

TEST_CASE("HybridMemory: decision is found by keyword and by entity", "[hybrid_memory]") {
    TempDir dir("hybrid_decision");
    HybridMemory mem(test_config(dir), fake_factory(), false);
    auto id = mem.store("We decided to use PostgreSQL for the project", "decision",
                        Importance::High);
    REQUIRE(mem.wait_for_sync(5s));

    REQUIRE(mem.graph()->topics_of(id) == std::vector<std::string>{"Database"});
    REQUIRE(mem.graph()->memories_mentioning({"PostgreSQL"}, 5) ==
            std::vector<int64_t>{id});

    auto quick = mem.recall(query(QueryType::Quick, "PostgreSQL"));
    REQUIRE(ids_of(quick) == std::vector<int64_t>{id});
    REQUIRE(quick[0].category == "decision");

    auto related = mem.recall(query(QueryType::Related, "PostgreSQL"));
    REQUIRE(ids_of(related) == std::vector<int64_t>{id});
}

TEST_CASE("HybridMemory: context recall stays on the matching memory", "[hybrid_memory]") {
    TempDir dir("hybrid_context");
    HybridMemory mem(test_config(dir), fake_factory(), false);
    auto docker = mem.store("Docker container deployment notes");
    mem.store("Sunny weather expected tomorrow");
    mem.store("Python list comprehension tips");
    REQUIRE(mem.wait_for_sync(5s));

    auto hits = mem.recall(query(QueryType::Context, "Docker"));
    REQUIRE(ids_of(hits) == std::vector<int64_t>{docker});
}

TEST_CASE("HybridMemory: semantic without embeddings matches by topic", "[hybrid_memory]") {
    TempDir dir("hybrid_topics");
    HybridMemory mem(test_config(dir), nullptr, false);
    auto pg = mem.store("We decided to use PostgreSQL for the project");
    mem.store("Sunny weather expected tomorrow");
    REQUIRE(mem.wait_for_sync(5s));

    auto hits = mem.recall(query(QueryType::Semantic, "database performance"));
    REQUIRE(ids_of(hits) == std::vector<int64_t>{pg});
    REQUIRE_FALSE(hits[0].score.has_value());
    REQUIRE(mem.fast_store().get(pg)->access_count == 1);
}

TEST_CASE("HybridMemory: extraction caps come from configuration", "[hybrid_memory]") {
    TempDir dir("hybrid_caps");
    auto cfg = test_config(dir);
    cfg.max_topics = 1;
    cfg.max_entities = 0;
    HybridMemory mem(cfg, nullptr, false);

    auto id = mem.store("Redis cache for session data");
    REQUIRE(mem.wait_for_sync(5s));
    REQUIRE(mem.graph()->topics_of(id) == std::vector<std::string>{"Database"});
    REQUIRE(mem.graph()->memories_mentioning({"Redis"}, 5).empty());
}

// ── Stats / clear ────────────────────────────────────────────

TEST_CASE("HybridMemory: get_stats reports both stores", "[hybrid_memory]") {
    TempDir dir("hybrid_stats");
    HybridMemory mem(test_config(dir), fake_factory(), false);
    mem.store("Database performance tuning", "decision");
    mem.store("Docker container deployment notes", "ops");
    REQUIRE(mem.wait_for_sync(5s));
    mem.store("not yet indexed", "ops");

    auto stats = mem.get_stats();
    REQUIRE(stats.fast_store.total == 3);
    REQUIRE(stats.fast_store.by_category["ops"] == 2);
    REQUIRE(stats.graph_available);
    REQUIRE(stats.graph_store.node_count > 2);
    REQUIRE(stats.graph_store.edge_count > 0);
    REQUIRE(stats.pending_sync_count == 1);
    REQUIRE(stats.embedding_model == std::optional<std::string>("fake-bow"));
}

TEST_CASE("HybridMemory: clear wipes records, queue and graph", "[hybrid_memory]") {
    TempDir dir("hybrid_clear");
    HybridMemory mem(test_config(dir), fake_factory());
    mem.store("Database performance tuning");
    REQUIRE(mem.wait_for_sync(5s));
    mem.store("pending at clear time");

    mem.clear();
    REQUIRE(mem.indexer().running());

    auto stats = mem.get_stats();
    REQUIRE(stats.fast_store.total == 0);
    REQUIRE(stats.pending_sync_count == 0);
    REQUIRE(stats.graph_store.node_count == 0);
    REQUIRE(stats.graph_store.edge_count == 0);
    REQUIRE(mem.recall(query(QueryType::Quick, "database")).empty());
}
