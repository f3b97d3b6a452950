#include <catch2/catch.hpp>
#include "memory.hpp"

using namespace klaus;

// ── Importance / QueryType ───────────────────────────────────

TEST_CASE("parse_importance: rejects unknown levels", "[memory]") {
    REQUIRE(parse_importance("low") == std::optional<Importance>(Importance::Low));
    REQUIRE(parse_importance("medium") == std::optional<Importance>(Importance::Medium));
    REQUIRE(parse_importance("high") == std::optional<Importance>(Importance::High));
    REQUIRE_FALSE(parse_importance("bogus").has_value());
    REQUIRE_FALSE(parse_importance("HIGH").has_value());
    REQUIRE_FALSE(parse_importance("").has_value());
}

TEST_CASE("importance_from_string: unknown levels are medium", "[memory]") {
    REQUIRE(importance_from_string("high") == Importance::High);
    REQUIRE(importance_from_string("low") == Importance::Low);
    REQUIRE(importance_from_string("urgent") == Importance::Medium);
    REQUIRE(importance_from_string("") == Importance::Medium);
}

TEST_CASE("query_type_from_string: names match query_type_to_string", "[memory]") {
    for (auto type : {QueryType::Quick, QueryType::Semantic, QueryType::Context,
                      QueryType::Related}) {
        REQUIRE(query_type_from_string(query_type_to_string(type)) == type);
    }
    REQUIRE_FALSE(query_type_from_string("fuzzy").has_value());
    REQUIRE_FALSE(query_type_from_string("Quick").has_value());
}

// ── Sync payload ─────────────────────────────────────────────

TEST_CASE("payload_to_json: stores importance as text", "[memory]") {
    SyncPayload p;
    p.memory_id = 12;
    p.content = "ship it";
    p.category = "release";
    p.importance = Importance::High;
    p.created_at = 1700000000;

    auto j = payload_to_json(p);
    REQUIRE(j["id"] == 12);
    REQUIRE(j["importance"] == "high");
    REQUIRE(j["created_at"] == 1700000000);
}

TEST_CASE("payload_from_json: missing fields take defaults", "[memory]") {
    auto p = payload_from_json(nlohmann::json{{"id", 3}, {"content", "partial"}});
    REQUIRE(p.memory_id == 3);
    REQUIRE(p.content == "partial");
    REQUIRE(p.category == "general");
    REQUIRE(p.importance == Importance::Medium);
    REQUIRE(p.created_at == 0);
}

// ── RecallHit ────────────────────────────────────────────────

TEST_CASE("hit_from_record: score only when requested", "[memory]") {
    MemoryRecord rec;
    rec.id = 5;
    rec.content = "remember the milk";
    rec.category = "errand";
    rec.created_at = 42;
    rec.score = 2.0;

    auto scored = hit_from_record(rec, true);
    REQUIRE(scored.id == 5);
    REQUIRE(scored.category == "errand");
    REQUIRE(scored.created_at == 42);
    REQUIRE(scored.score == std::optional<double>(2.0));

    REQUIRE_FALSE(hit_from_record(rec, false).score.has_value());
}
