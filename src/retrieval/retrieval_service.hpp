#pragma once
#include "exact_matcher.hpp"
#include "index_sync.hpp"
#include "keyword_matcher.hpp"
#include "result.hpp"
#include "retrieval_cache.hpp"
#include "retrieval_config.hpp"
#include "vector_matcher.hpp"
#include <memory>
#include <optional>
#include <string>

namespace bankmatch {

// Entry point for collaborators such as the CLI. Holds no per-call state:
// every retrieve reads one config snapshot and one index snapshot and
// can run concurrently with other retrieves, config updates and rebuilds.
class RetrievalService {
public:
    // store, embedder and sync must outlive the service. The config is
    // owned by this instance and is not persisted.
    RetrievalService(RecordStore& store, Embedder& embedder, IndexSyncManager& sync,
                     RetrievalConfig initial = RetrievalConfig{},
                     uint32_t cache_max_entries = 1000);

    // Ranked results for question. Throws ConfigError if an override is out
    // of range; "no results" is an empty list, never an error.
    RetrievalResponse retrieve(const std::string& question,
                               std::optional<uint32_t> top_k = std::nullopt,
                               std::optional<double> similarity_threshold = std::nullopt);

    IndexStats stats();

    RetrievalConfig get_config() const;

    // Throws ConfigError; the live config is unchanged on error.
    RetrievalConfig update_config(const nlohmann::json& partial);

    RetrievalConfig reset_config();

    bool rebuild_index(bool force);
    bool update_index();

    const RetrievalCache& cache() const { return cache_; }

private:
    IndexSyncManager& sync_;
    ConfigStore config_;
    RetrievalCache cache_;

    ExactNameMatcher exact_;
    VectorMatcher vector_;
    KeywordMatcher keyword_;
};

} // namespace bankmatch
