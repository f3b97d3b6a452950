#pragma once
#include "embedder.hpp"
#include "memory.hpp"
#include "memory/graph_store.hpp"
#include "util.hpp"
#include <atomic>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace klaus {

// Unique per-process scratch directory, removed on destruction.
struct TempDir {
    std::string path;

    explicit TempDir(const std::string& name) {
        static std::atomic<int> counter{0};
        path = (std::filesystem::temp_directory_path() /
                ("klaus_test_" + name + "_" + std::to_string(getpid()) + "_" +
                 std::to_string(counter++))).string();
        std::filesystem::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string file(const std::string& name) const { return path + "/" + name; }
};

// Deterministic embedder: one axis per vocabulary word, value = 1 if the
// lower-cased text contains it. Text with no vocabulary word embeds to zeros.
class FakeEmbedder : public Embedder {
public:
    explicit FakeEmbedder(std::vector<std::string> vocabulary)
        : vocabulary_(std::move(vocabulary)) {}

    Embedding embed(const std::string& text) override {
        calls++;
        auto lowered = to_lower(text);
        Embedding v;
        for (const auto& word : vocabulary_) {
            v.push_back(lowered.find(word) != std::string::npos ? 1.0f : 0.0f);
        }
        return v;
    }

    uint32_t dimensions() const override { return static_cast<uint32_t>(vocabulary_.size()); }
    std::string embedder_name() const override { return "fake"; }
    std::string model_name() const override { return "fake-bow"; }

    std::atomic<int> calls{0};

private:
    std::vector<std::string> vocabulary_;
};

// Graph store whose every operation fails.
class FailingGraphStore : public GraphStore {
public:
    void upsert_memory(const SyncPayload&) override { fail(); }
    void merge_topic(const std::string&) override { fail(); }
    void merge_entity(const Entity&) override { fail(); }
    void link_topic(int64_t, const std::string&) override { fail(); }
    void link_entity(int64_t, const std::string&) override { fail(); }
    void link_related(int64_t, int64_t, double) override { fail(); }
    void link_follows(int64_t, int64_t) override { fail(); }
    void clear() override { fail(); }
    bool has_memory(int64_t) override { fail(); return false; }
    std::optional<int64_t> previous_memory(int64_t) override { fail(); return std::nullopt; }
    std::vector<int64_t> memories_sharing_topics(int64_t, uint32_t) override { fail(); return {}; }
    std::vector<int64_t> memories_with_topics(const std::vector<std::string>&,
                                              uint32_t) override { fail(); return {}; }
    std::vector<int64_t> memories_mentioning(const std::vector<std::string>&,
                                             uint32_t) override { fail(); return {}; }
    std::optional<int64_t> latest_memory_containing(const std::string&) override {
        fail();
        return std::nullopt;
    }
    std::vector<int64_t> neighbors(int64_t) override { fail(); return {}; }
    std::vector<std::string> topics_of(int64_t) override { fail(); return {}; }
    GraphStats stats() override { fail(); return {}; }

    std::atomic<int> calls{0};

private:
    void fail() {
        calls++;
        throw GraphError("graph offline");
    }
};

} // namespace klaus
