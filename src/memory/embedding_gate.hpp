#pragma once
#include "../embedder.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace klaus {

// Lazy, thread-safe access to an optional embedder. The factory runs at most
// once; if it throws or returns null the gate stays unavailable for the
// lifetime of the object. Only initialization is serialized; embed() calls
// run concurrently against the embedder.
class EmbeddingGate {
public:
    using Factory = std::function<std::unique_ptr<Embedder>()>;

    explicit EmbeddingGate(Factory factory);

    // Unit-length embedding of text, or nullopt when unavailable.
    std::optional<Embedding> embed(const std::string& text);

    // Triggers initialization if it has not happened yet.
    bool available();

    std::optional<std::string> model_name();

private:
    // The embedder is never replaced once initialized_ is set.
    Embedder* ensure_embedder();

    Factory factory_;
    std::unique_ptr<Embedder> embedder_;
    bool initialized_ = false;
    std::mutex mutex_;
};

} // namespace klaus
