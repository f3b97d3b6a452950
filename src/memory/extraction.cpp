#include "extraction.hpp"
#include "../util.hpp"
#include <algorithm>
#include <regex>

namespace klaus {

std::string entity_type_to_string(EntityType type) {
    switch (type) {
        case EntityType::Technology: return "TECHNOLOGY";
        case EntityType::Class:      return "CLASS";
        case EntityType::File:       return "FILE";
        case EntityType::Config:     return "CONFIG";
    }
    return "TECHNOLOGY";
}

const std::vector<TopicDefinition>& topic_taxonomy() {
    static const std::vector<TopicDefinition> taxonomy = {
        // Cloud & infra
        {"Docker", {"docker", "container", "contêiner", "dockerfile", "compose"}},
        {"Kubernetes", {"kubernetes", "k8s", "kubectl", "pod", "helm"}},
        {"AWS", {"aws", "amazon", "ec2", "s3", "lambda", "cloudwatch"}},
        {"GCP", {"gcp", "google cloud", "bigquery", "cloud run"}},
        // Backend
        {"API", {"api", "endpoint", "rest", "graphql", "fastapi", "flask", "django"}},
        {"Database", {"database", "banco de dados", "banco", "sql", "postgresql",
                      "mysql", "mongodb", "sqlite", "redis"}},
        {"Python", {"python", "pip", "venv", "virtualenv"}},
        {"JavaScript", {"javascript", "js", "typescript", "ts", "node", "nodejs"}},
        {"Performance", {"performance", "latency", "throughput", "cache",
                         "otimização", "optimization"}},
        // AI / ML
        {"LLM", {"llm", "language model", "modelo de linguagem", "gpt", "claude",
                 "kimi", "gemini"}},
        {"AI", {"ai", "artificial intelligence", "inteligência artificial",
                "machine learning", "ml", "embedding", "rag"}},
        {"Memory", {"memory", "memória", "kuzu", "graph", "grafo", "sqlite",
                    "vector store"}},
        // Assistant project
        {"Klaus", {"klaus", "boot.md", "soul.md", "user.md", "agents.md",
                   "setup_wizard", "ide_connector", "hybrid_memory",
                   "memory_relevance_gate"}},
        {"Docker Compose", {"docker-compose", "docker compose", "compose", "web-ui",
                            "telegram-bot", "kimi-agent"}},
        {"Telegram", {"telegram", "bot", "botfather", "webhook", "polling"}},
        {"Setup", {"setup", "wizard", "configuração", "configuration", "init.yaml", "env"}},
        // Architecture & design
        {"Architecture", {"architecture", "arquitetura", "design", "pattern", "padrão",
                          "microservice", "monolith"}},
        {"Testing", {"test", "teste", "unittest", "pytest", "mock", "coverage"}},
        {"Security", {"security", "segurança", "auth", "token", "api key", "secret",
                      "env var"}},
        {"Observability", {"observability", "observabilidade", "logging", "log",
                           "tracing", "metrics", "telemetry"}},
        // Project management
        {"Release", {"release", "versão", "version", "deploy", "deployment", "ci/cd",
                     "pipeline"}},
        {"Bug", {"bug", "erro", "error", "fix", "issue", "problema", "broken", "falha"}},
    };
    return taxonomy;
}

const std::vector<std::string>& known_technologies() {
    static const std::vector<std::string> techs = {
        "FastAPI", "Django", "Flask", "SQLAlchemy", "Pydantic",
        "PostgreSQL", "MongoDB", "Redis", "Elasticsearch", "Pinecone",
        "LangChain", "LlamaIndex", "OpenAI", "Anthropic", "MoonShot",
        "Kubernetes", "Terraform", "Ansible", "Prometheus", "Grafana",
        "React", "Vue", "Next.js", "Vite",
    };
    return techs;
}

static std::vector<std::string> find_all(const std::regex& re, const std::string& text) {
    std::vector<std::string> out;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re);
         it != std::sregex_iterator(); ++it) {
        out.push_back(it->str());
    }
    return out;
}

std::vector<std::string> extract_topics(const std::string& text, size_t max) {
    static const std::regex camel_re(R"(\b[A-Z][a-z]+(?:[A-Z][a-z]+)+\b)");

    std::vector<std::string> found;
    if (max == 0) return found;

    auto lowered = to_lower(text);
    std::vector<const TopicDefinition*> matched;
    for (const auto& topic : topic_taxonomy()) {
        for (const auto& trigger : topic.triggers) {
            if (lowered.find(trigger) != std::string::npos) {
                found.push_back(topic.name);
                matched.push_back(&topic);
                break;
            }
        }
    }

    for (const auto& token : find_all(camel_re, text)) {
        auto token_lower = to_lower(token);
        bool covered = std::any_of(matched.begin(), matched.end(),
            [&](const TopicDefinition* t) {
                return std::find(t->triggers.begin(), t->triggers.end(), token_lower)
                       != t->triggers.end();
            });
        if (!covered && std::find(found.begin(), found.end(), token) == found.end()) {
            found.push_back(token);
        }
    }

    if (found.size() > max) found.resize(max);
    return found;
}

std::vector<Entity> extract_entities(const std::string& text, size_t max) {
    static const std::regex class_re(R"(\b[A-Z][a-z0-9]+(?:[A-Z][a-zA-Z0-9]*)+\b)");
    static const std::regex file_re(
        R"([\w./]+\.(?:py|yaml|yml|md|sh|json|txt|cpp|hpp|h|toml)\b)");
    static const std::regex config_re(R"(\b[A-Z][A-Z0-9_]{3,}\b)");

    std::vector<Entity> entities;
    if (max == 0) return entities;

    auto add = [&entities](const std::string& name, EntityType type) {
        bool seen = std::any_of(entities.begin(), entities.end(),
                                [&](const Entity& e) { return e.name == name; });
        if (!seen) entities.push_back({name, type});
    };

    for (const auto& tech : known_technologies()) {
        if (text.find(tech) != std::string::npos) add(tech, EntityType::Technology);
    }
    for (const auto& name : find_all(class_re, text)) {
        if (name.size() >= 4) add(name, EntityType::Class);
    }
    for (const auto& path : find_all(file_re, text)) {
        add(path, EntityType::File);
    }
    for (const auto& var : find_all(config_re, text)) {
        add(var, EntityType::Config);
    }

    if (entities.size() > max) entities.resize(max);
    return entities;
}

} // namespace klaus
