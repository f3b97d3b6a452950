#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace klaus {

enum class EntityType { Technology, Class, File, Config };

struct Entity {
    std::string name;
    EntityType type = EntityType::Technology;
};

// Canonical topic with its lower-case trigger phrases.
struct TopicDefinition {
    std::string name;
    std::vector<std::string> triggers;
};

std::string entity_type_to_string(EntityType type);

// Ordered topic taxonomy (English + Portuguese triggers).
const std::vector<TopicDefinition>& topic_taxonomy();

// Fixed list of technology names, matched case-sensitively.
const std::vector<std::string>& known_technologies();

// Up to max topic labels: taxonomy matches first, then compound-capitalized
// tokens (e.g. "HybridMemory") not covered by a matched topic.
std::vector<std::string> extract_topics(const std::string& text, size_t max = 3);

// Up to max typed entities, deduplicated by name. Detectors run in order:
// technology names, compound-capitalized identifiers, file paths, config keys.
std::vector<Entity> extract_entities(const std::string& text, size_t max = 3);

} // namespace klaus
