#include "embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <cmath>
#include <iostream>

namespace klaus {

bool normalize(Embedding& v) {
    if (v.empty()) return false;
    double norm = 0.0;
    for (float x : v) norm += static_cast<double>(x) * static_cast<double>(x);
    norm = std::sqrt(norm);
    if (norm < 1e-12) return false;
    for (auto& x : v) x = static_cast<float>(static_cast<double>(x) / norm);
    return true;
}

double dot_product(const Embedding& a, const Embedding& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) return 0.0;
    double dot = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return dot;
}

std::unique_ptr<Embedder> create_embedder(const EmbeddingConfig& emb, HttpClient& http) {
    // Explicit provider, or OpenAI when a key is all we have
    std::string provider = emb.provider;
    if (provider.empty() && !emb.api_key.empty()) {
        provider = "openai";
        std::cerr << "[embedder] Auto-detected OpenAI API key, enabling embeddings\n";
    }
    if (provider.empty() || provider == "none") return nullptr;

    const EmbeddingEndpoint* endpoint = find_embedding_endpoint(provider);
    if (!endpoint) {
        std::cerr << "[embedder] Unknown embedding provider: " << provider << "\n";
        return nullptr;
    }
    if (endpoint->needs_api_key && emb.api_key.empty()) {
        std::cerr << "[embedder] " << provider << " embeddings configured but no API key found\n";
        return nullptr;
    }

    EmbeddingEndpoint resolved = *endpoint;
    if (!emb.base_url.empty()) resolved.base_url = emb.base_url;
    if (!emb.model.empty()) resolved.model = emb.model;
    return std::make_unique<HttpEmbedder>(std::move(resolved), emb.api_key, http);
}

} // namespace klaus
