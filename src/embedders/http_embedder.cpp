#include "http_embedder.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace klaus {

const EmbeddingEndpoint* find_embedding_endpoint(const std::string& provider) {
    static const EmbeddingEndpoint endpoints[] = {
        {"openai", "https://api.openai.com/v1", "text-embedding-3-small",
         "/embeddings", "/data/0/embedding", 1536, 30, true},
        // Local models may need to load on first use
        {"ollama", "http://localhost:11434", "all-minilm",
         "/api/embed", "/embeddings/0", 384, 60, false},
    };
    for (const auto& e : endpoints) {
        if (e.provider == provider) return &e;
    }
    return nullptr;
}

HttpEmbedder::HttpEmbedder(EmbeddingEndpoint endpoint, std::string api_key, HttpClient& http)
    : endpoint_(std::move(endpoint))
    , api_key_(std::move(api_key))
    , http_(http)
    , dimensions_(endpoint_.dimensions)
{}

Embedding HttpEmbedder::embed(const std::string& text) {
    nlohmann::json body = {
        {"model", endpoint_.model},
        {"input", text}
    };

    std::vector<Header> headers;
    if (!api_key_.empty()) {
        headers.push_back({"Authorization", "Bearer " + api_key_});
    }

    auto response = http_.post_json(
        endpoint_.base_url + endpoint_.path,
        body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
        headers, endpoint_.timeout_seconds);
    if (!response.ok()) {
        std::cerr << "[embedder] " << endpoint_.provider << " request failed: "
                  << (response.error.empty()
                          ? "HTTP " + std::to_string(response.status_code)
                          : response.error)
                  << "\n";
        return {};
    }

    Embedding result;
    try {
        auto j = nlohmann::json::parse(response.body);
        const auto& arr = j.at(nlohmann::json::json_pointer(endpoint_.vector_pointer));
        result.reserve(arr.size());
        for (const auto& val : arr) {
            result.push_back(val.get<float>());
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[embedder] " << endpoint_.provider << " reply unreadable: "
                  << e.what() << "\n";
        return {};
    }

    auto size = static_cast<uint32_t>(result.size());
    std::lock_guard<std::mutex> lock(mutex_);
    if (dimensions_fixed_ && size != dimensions_) {
        std::cerr << "[embedder] " << endpoint_.provider << " returned " << size
                  << " dimensions, expected " << dimensions_ << "\n";
        return {};
    }
    if (size > 0) {
        dimensions_ = size;
        dimensions_fixed_ = true;
    }
    return result;
}

uint32_t HttpEmbedder::dimensions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dimensions_;
}

static std::unique_ptr<Embedder> make_embedder(const std::string& provider,
                                               const std::string& api_key,
                                               HttpClient& http,
                                               const std::string& base_url,
                                               const std::string& model) {
    EmbeddingEndpoint endpoint = *find_embedding_endpoint(provider);
    if (!base_url.empty()) endpoint.base_url = base_url;
    if (!model.empty()) endpoint.model = model;
    return std::make_unique<HttpEmbedder>(std::move(endpoint), api_key, http);
}

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model) {
    return make_embedder("openai", api_key, http, base_url, model);
}

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model) {
    return make_embedder("ollama", "", http, base_url, model);
}

} // namespace klaus
