#include "retrieval_service.hpp"
#include "entity_extractor.hpp"
#include "score_fusion.hpp"
#include "../bank_record.hpp"
#include <chrono>
#include <iostream>

namespace bankmatch {

RetrievalService::RetrievalService(RecordStore& store, Embedder& embedder,
                                   IndexSyncManager& sync, RetrievalConfig initial,
                                   uint32_t cache_max_entries)
    : sync_(sync),
      config_(initial),
      cache_(initial.cache_ttl, cache_max_entries),
      exact_(store),
      vector_(embedder),
      keyword_(store) {}

RetrievalResponse RetrievalService::retrieve(const std::string& question,
                                             std::optional<uint32_t> top_k,
                                             std::optional<double> similarity_threshold) {
    auto start = std::chrono::steady_clock::now();
    auto versioned = config_.versioned_snapshot();
    std::shared_ptr<const RetrievalConfig> cfg = versioned.first;
    uint64_t config_version = versioned.second;

    if (top_k) validate_top_k(*top_k);
    if (similarity_threshold) validate_threshold(*similarity_threshold);
    uint32_t k = top_k.value_or(cfg->top_k);
    double threshold = similarity_threshold.value_or(cfg->similarity_threshold);

    RetrievalResponse resp;
    resp.question = question;

    auto finish = [&]() {
        resp.total_found = static_cast<uint32_t>(resp.results.size());
        resp.search_time_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
    };

    auto snap = sync_.current();
    if (normalize_name(question).empty() || !snap || !snap->vectors ||
        snap->vectors->count() == 0) {
        finish();
        return resp;
    }

    CacheKey key{question, k, threshold, snap->generation, config_version};
    if (cfg->cache_enabled) {
        if (auto hit = cache_.get(key)) {
            resp.results = std::move(hit->results);
            finish();
            return resp;
        }
    }

    QueryEntities entities = extract_entities(question);
    std::optional<RetrievalResult> exact = exact_.match(entities, question);

    std::vector<ScoredCandidate> vector_hits =
        vector_.match(question, *snap->vectors, cfg->vector_candidates(k), threshold);
    std::vector<ScoredCandidate> keyword_hits =
        keyword_.match(entities, vector_hits, snap.get(), cfg->keyword_candidate_limit);

    FusionParams params;
    params.vector_weight = cfg->vector_weight;
    params.keyword_weight = cfg->keyword_weight;
    params.enable_hybrid = cfg->enable_hybrid;
    params.top_k = k;
    resp.results = fuse(vector_hits, keyword_hits, exact, params, question);

    finish();
    if (cfg->cache_enabled) cache_.put(key, resp);
    return resp;
}

IndexStats RetrievalService::stats() {
    return sync_.stats();
}

RetrievalConfig RetrievalService::get_config() const {
    return *config_.snapshot();
}

RetrievalConfig RetrievalService::update_config(const nlohmann::json& partial) {
    RetrievalConfig next = config_.update(partial);
    cache_.set_ttl(next.cache_ttl);
    if (!next.cache_enabled) cache_.clear();
    std::cerr << "[retrieval] Config updated: " << partial.dump() << "\n";
    return next;
}

RetrievalConfig RetrievalService::reset_config() {
    RetrievalConfig next = config_.reset();
    cache_.set_ttl(next.cache_ttl);
    std::cerr << "[retrieval] Config reset to defaults\n";
    return next;
}

bool RetrievalService::rebuild_index(bool force) {
    return sync_.rebuild(force, config_.snapshot()->batch_size);
}

bool RetrievalService::update_index() {
    return sync_.update(config_.snapshot()->batch_size);
}

} // namespace bankmatch
