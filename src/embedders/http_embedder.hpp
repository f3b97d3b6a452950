#pragma once
#include "../embedder.hpp"
#include "../http.hpp"
#include <cstdint>
#include <mutex>
#include <string>

namespace klaus {

// Wire description of one remote embedding API.
struct EmbeddingEndpoint {
    std::string provider;       // "openai", "ollama"
    std::string base_url;       // default when the config leaves it empty
    std::string model;          // default when the config leaves it empty
    std::string path;           // appended to base_url
    std::string vector_pointer; // JSON pointer to the float array in the reply
    uint32_t dimensions = 0;    // expected size until the first reply
    long timeout_seconds = 30;
    bool needs_api_key = false;
};

// Known endpoints, or nullptr for an unrecognized provider name.
const EmbeddingEndpoint* find_embedding_endpoint(const std::string& provider);

// Embedder backed by a remote HTTP API. The first successful reply fixes the
// dimensionality; later replies of another size are rejected so stored
// vectors stay comparable.
class HttpEmbedder : public Embedder {
public:
    HttpEmbedder(EmbeddingEndpoint endpoint, std::string api_key, HttpClient& http);

    Embedding embed(const std::string& text) override;
    uint32_t dimensions() const override;
    std::string embedder_name() const override { return endpoint_.provider; }
    std::string model_name() const override { return endpoint_.model; }

private:
    EmbeddingEndpoint endpoint_;
    std::string api_key_;
    HttpClient& http_;

    mutable std::mutex mutex_; // guards the two fields below, not requests
    uint32_t dimensions_;
    bool dimensions_fixed_ = false;
};

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model);

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model);

} // namespace klaus
