#include "embedding_gate.hpp"
#include <exception>
#include <iostream>

namespace klaus {

EmbeddingGate::EmbeddingGate(Factory factory) : factory_(std::move(factory)) {}

Embedder* EmbeddingGate::ensure_embedder() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) return embedder_.get();
    initialized_ = true;

    if (!factory_) return nullptr;
    try {
        embedder_ = factory_();
    } catch (const std::exception& e) {
        std::cerr << "[embedder] Initialization failed: " << e.what() << "\n";
        embedder_.reset();
    }
    if (embedder_) {
        std::cerr << "[embedder] Using " << embedder_->embedder_name()
                  << " (" << embedder_->model_name() << ")\n";
    } else {
        std::cerr << "[embedder] No embedder available, semantic recall uses topics\n";
    }
    return embedder_.get();
}

std::optional<Embedding> EmbeddingGate::embed(const std::string& text) {
    Embedder* embedder = ensure_embedder();
    if (!embedder) return std::nullopt;

    Embedding vec;
    try {
        vec = embedder->embed(text);
    } catch (const std::exception& e) {
        std::cerr << "[embedder] Embedding failed: " << e.what() << "\n";
        return std::nullopt;
    }
    if (!normalize(vec)) return std::nullopt;
    return vec;
}

bool EmbeddingGate::available() {
    return ensure_embedder() != nullptr;
}

std::optional<std::string> EmbeddingGate::model_name() {
    Embedder* embedder = ensure_embedder();
    if (!embedder) return std::nullopt;
    return embedder->model_name();
}

} // namespace klaus
