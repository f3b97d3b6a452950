#include "memory.hpp"

namespace klaus {

std::string importance_to_string(Importance imp) {
    switch (imp) {
        case Importance::Low:    return "low";
        case Importance::Medium: return "medium";
        case Importance::High:   return "high";
    }
    return "medium";
}

std::optional<Importance> parse_importance(const std::string& s) {
    if (s == "low")    return Importance::Low;
    if (s == "medium") return Importance::Medium;
    if (s == "high")   return Importance::High;
    return std::nullopt;
}

Importance importance_from_string(const std::string& s) {
    return parse_importance(s).value_or(Importance::Medium);
}

std::string query_type_to_string(QueryType type) {
    switch (type) {
        case QueryType::Quick:    return "quick";
        case QueryType::Semantic: return "semantic";
        case QueryType::Context:  return "context";
        case QueryType::Related:  return "related";
    }
    return "quick";
}

std::optional<QueryType> query_type_from_string(const std::string& s) {
    if (s == "quick")    return QueryType::Quick;
    if (s == "semantic") return QueryType::Semantic;
    if (s == "context")  return QueryType::Context;
    if (s == "related")  return QueryType::Related;
    return std::nullopt;
}

nlohmann::json payload_to_json(const SyncPayload& payload) {
    return {
        {"id", payload.memory_id},
        {"content", payload.content},
        {"category", payload.category},
        {"importance", importance_to_string(payload.importance)},
        {"created_at", payload.created_at}
    };
}

SyncPayload payload_from_json(const nlohmann::json& j) {
    SyncPayload payload;
    payload.memory_id = j.value("id", int64_t{0});
    payload.content = j.value("content", "");
    payload.category = j.value("category", "general");
    payload.importance = importance_from_string(j.value("importance", "medium"));
    payload.created_at = j.value("created_at", uint64_t{0});
    return payload;
}

RecallHit hit_from_record(const MemoryRecord& record, bool with_score) {
    RecallHit hit;
    hit.id = record.id;
    hit.content = record.content;
    hit.category = record.category;
    hit.created_at = record.created_at;
    if (with_score) hit.score = record.score;
    return hit;
}

} // namespace klaus
