#include <catch2/catch.hpp>
#include "memory/sqlite_graph_store.hpp"
#include "memory_fakes.hpp"
#include <algorithm>
#include <fstream>

using namespace klaus;

struct GraphFixture {
    TempDir dir{"graph"};
    SqliteGraphStore graph{dir.file("graph")};

    void add(int64_t id, const std::string& content, uint64_t created_at = 0) {
        SyncPayload p;
        p.memory_id = id;
        p.content = content;
        p.category = "general";
        p.created_at = created_at ? created_at : 1700000000 + static_cast<uint64_t>(id);
        graph.upsert_memory(p);
    }
};

// ── Nodes ────────────────────────────────────────────────────

TEST_CASE("SqliteGraphStore: upsert_memory is idempotent", "[graph]") {
    GraphFixture f;
    f.add(1, "first");
    f.add(1, "first");

    REQUIRE(f.graph.has_memory(1));
    REQUIRE_FALSE(f.graph.has_memory(2));
    REQUIRE(f.graph.stats().node_count == 1);
}

TEST_CASE("SqliteGraphStore: merges are idempotent", "[graph]") {
    GraphFixture f;
    f.add(1, "m");
    f.graph.merge_topic("Database");
    f.graph.merge_topic("Database");
    f.graph.merge_entity({"PostgreSQL", EntityType::Technology});
    f.graph.merge_entity({"PostgreSQL", EntityType::Technology});
    f.graph.link_topic(1, "Database");
    f.graph.link_topic(1, "Database");
    f.graph.link_entity(1, "PostgreSQL");
    f.graph.link_entity(1, "PostgreSQL");

    auto stats = f.graph.stats();
    REQUIRE(stats.node_count == 3);
    REQUIRE(stats.edge_count == 2);
    REQUIRE(f.graph.topics_of(1) == std::vector<std::string>{"Database"});
}

// ── Temporal chain ───────────────────────────────────────────

TEST_CASE("SqliteGraphStore: previous_memory finds highest lower id", "[graph]") {
    GraphFixture f;
    f.add(1, "a");
    f.add(3, "c");
    f.add(7, "g");

    REQUIRE(f.graph.previous_memory(7) == std::optional<int64_t>(3));
    REQUIRE(f.graph.previous_memory(3) == std::optional<int64_t>(1));
    REQUIRE_FALSE(f.graph.previous_memory(1).has_value());
    REQUIRE(f.graph.previous_memory(5) == std::optional<int64_t>(3));
}

// ── Topic / entity queries ───────────────────────────────────

TEST_CASE("SqliteGraphStore: memories_sharing_topics excludes self", "[graph]") {
    GraphFixture f;
    for (int64_t id = 1; id <= 4; id++) f.add(id, "m");
    f.graph.merge_topic("Docker");
    f.graph.merge_topic("Python");
    f.graph.link_topic(1, "Docker");
    f.graph.link_topic(2, "Docker");
    f.graph.link_topic(3, "Python");
    f.graph.link_topic(4, "Docker");
    f.graph.link_topic(4, "Python");

    auto shared = f.graph.memories_sharing_topics(4, 5);
    REQUIRE(shared == std::vector<int64_t>{3, 2, 1});
    REQUIRE(f.graph.memories_sharing_topics(4, 2).size() == 2);
}

TEST_CASE("SqliteGraphStore: memories_with_topics is most recent first", "[graph]") {
    GraphFixture f;
    f.add(1, "old", 100);
    f.add(2, "new", 200);
    f.add(3, "other", 300);
    f.graph.merge_topic("Database");
    f.graph.merge_topic("Performance");
    f.graph.link_topic(1, "Database");
    f.graph.link_topic(2, "Performance");
    f.graph.link_topic(2, "Database");

    auto ids = f.graph.memories_with_topics({"Database", "Performance"}, 5);
    REQUIRE(ids == std::vector<int64_t>{2, 1});
    REQUIRE(f.graph.memories_with_topics({}, 5).empty());
    REQUIRE(f.graph.memories_with_topics({"Unknown"}, 5).empty());
}

TEST_CASE("SqliteGraphStore: memories_mentioning", "[graph]") {
    GraphFixture f;
    f.add(1, "a");
    f.add(2, "b");
    f.graph.merge_entity({"Redis", EntityType::Technology});
    f.graph.link_entity(1, "Redis");

    REQUIRE(f.graph.memories_mentioning({"Redis"}, 5) == std::vector<int64_t>{1});
    REQUIRE(f.graph.memories_mentioning({"Kafka"}, 5).empty());
}

TEST_CASE("SqliteGraphStore: names with quotes are bound, not interpolated", "[graph]") {
    GraphFixture f;
    f.add(1, "it's O'Brien's \"quoted\" note");
    f.graph.merge_topic("O'Brien");
    f.graph.link_topic(1, "O'Brien");

    REQUIRE(f.graph.memories_with_topics({"O'Brien"}, 5) == std::vector<int64_t>{1});
    REQUIRE(f.graph.latest_memory_containing("o'brien's") == std::optional<int64_t>(1));
}

// ── Seed lookup and traversal ────────────────────────────────

TEST_CASE("SqliteGraphStore: latest_memory_containing is case-insensitive", "[graph]") {
    GraphFixture f;
    f.add(1, "Docker setup notes", 100);
    f.add(2, "More docker tips", 200);
    f.add(3, "Unrelated", 300);

    REQUIRE(f.graph.latest_memory_containing("DOCKER") == std::optional<int64_t>(2));
    REQUIRE_FALSE(f.graph.latest_memory_containing("kubernetes").has_value());
}

TEST_CASE("SqliteGraphStore: latest_memory_containing folds accented capitals", "[graph]") {
    GraphFixture f;
    f.add(1, "Configuração do CONTÊINER", 100);
    REQUIRE(f.graph.latest_memory_containing("contêiner") == std::optional<int64_t>(1));
    REQUIRE(f.graph.latest_memory_containing("CONFIGURAÇÃO") == std::optional<int64_t>(1));
}

TEST_CASE("SqliteGraphStore: neighbors follow related both ways, follows backwards", "[graph]") {
    GraphFixture f;
    for (int64_t id = 1; id <= 4; id++) f.add(id, "m");
    f.graph.link_follows(2, 1);
    f.graph.link_follows(3, 2);
    f.graph.link_related(4, 2, 0.8);

    auto n2 = f.graph.neighbors(2);
    std::sort(n2.begin(), n2.end());
    REQUIRE(n2 == std::vector<int64_t>{1, 4});

    REQUIRE(f.graph.neighbors(1).empty());
}

// ── Lifecycle ────────────────────────────────────────────────

TEST_CASE("SqliteGraphStore: clear removes everything", "[graph]") {
    GraphFixture f;
    f.add(1, "a");
    f.add(2, "b");
    f.graph.link_follows(2, 1);
    f.graph.clear();

    auto stats = f.graph.stats();
    REQUIRE(stats.node_count == 0);
    REQUIRE(stats.edge_count == 0);
}

TEST_CASE("SqliteGraphStore: unopenable directory raises GraphError", "[graph]") {
    TempDir dir("graph_blocked");
    // A regular file where the directory should be
    std::ofstream(dir.file("blocked")) << "x";
    REQUIRE_THROWS_AS(SqliteGraphStore(dir.file("blocked")), GraphError);
}
