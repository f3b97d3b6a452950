#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace klaus {

using Embedding = std::vector<float>;

class HttpClient;      // forward declare
struct EmbeddingConfig; // forward declare

// Abstract embedding provider interface
class Embedder {
public:
    virtual ~Embedder() = default;

    // Compute embedding vector for the given text. Empty = failure.
    // May be called from several threads at once.
    virtual Embedding embed(const std::string& text) = 0;

    // Dimensionality of the embedding vectors
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "openai", "ollama")
    virtual std::string embedder_name() const = 0;

    // Model identifier reported in stats
    virtual std::string model_name() const = 0;
};

// Scale to unit length in place. Returns false for empty or zero vectors.
bool normalize(Embedding& v);

// Dot product; 0.0 if either is empty or the lengths differ.
// For unit vectors this is the cosine similarity.
double dot_product(const Embedding& a, const Embedding& b);

// Create an embedder from config. Returns nullptr if embeddings are disabled
// or the configured provider is not recognized.
std::unique_ptr<Embedder> create_embedder(const EmbeddingConfig& config, HttpClient& http);

} // namespace klaus
