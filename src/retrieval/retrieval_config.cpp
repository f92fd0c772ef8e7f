#include "retrieval_config.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace bankmatch {

uint32_t RetrievalConfig::vector_candidates(uint32_t k) const {
    uint64_t wanted = static_cast<uint64_t>(k) * candidate_multiplier;
    return static_cast<uint32_t>(std::min<uint64_t>(wanted, max_vector_candidates));
}

static void check_unit(const char* field, double v) {
    if (!(v >= 0.0 && v <= 1.0))
        throw ConfigError(std::string(field) + " must be in [0, 1], got " + std::to_string(v));
}

static void check_range(const char* field, uint32_t v, uint32_t lo, uint32_t hi) {
    if (v < lo || v > hi)
        throw ConfigError(std::string(field) + " must be in [" + std::to_string(lo) + ", " +
                          std::to_string(hi) + "], got " + std::to_string(v));
}

void validate_top_k(uint32_t top_k) {
    check_range("top_k", top_k, 1, kMaxTopK);
}

void validate_threshold(double threshold) {
    check_unit("similarity_threshold", threshold);
}

void validate(const RetrievalConfig& c) {
    validate_threshold(c.similarity_threshold);
    validate_top_k(c.top_k);
    check_unit("vector_weight", c.vector_weight);
    check_unit("keyword_weight", c.keyword_weight);
    if (std::fabs(c.vector_weight + c.keyword_weight - 1.0) > kWeightSumTolerance)
        throw ConfigError("vector_weight + keyword_weight must be 1, got " +
                          std::to_string(c.vector_weight + c.keyword_weight));
    check_range("candidate_multiplier", c.candidate_multiplier, 1, 100);
    check_range("max_vector_candidates", c.max_vector_candidates, 1, 1000);
    check_range("keyword_candidate_limit", c.keyword_candidate_limit, 1, 10000);
    check_range("batch_size", c.batch_size, 10, 1000);
    check_range("cache_ttl", c.cache_ttl, 60, 86400);
}

static double get_number(const std::string& key, const nlohmann::json& v) {
    if (!v.is_number())
        throw ConfigError(key + " must be a number");
    return v.get<double>();
}

static uint32_t get_count(const std::string& key, const nlohmann::json& v) {
    if (!v.is_number_integer())
        throw ConfigError(key + " must be an integer");
    if (!v.is_number_unsigned() && v.get<int64_t>() < 0)
        throw ConfigError(key + " must not be negative, got " + v.dump());
    auto n = v.get<uint64_t>();
    if (n > UINT32_MAX) throw ConfigError(key + " is too large");
    return static_cast<uint32_t>(n);
}

static bool get_flag(const std::string& key, const nlohmann::json& v) {
    if (!v.is_boolean())
        throw ConfigError(key + " must be true or false");
    return v.get<bool>();
}

RetrievalConfig apply_update(const RetrievalConfig& base, const nlohmann::json& partial) {
    if (!partial.is_object())
        throw ConfigError("config update must be a JSON object");

    RetrievalConfig c = base;
    bool vector_weight_set = false;
    bool keyword_weight_set = false;
    for (const auto& [key, v] : partial.items()) {
        if (key == "similarity_threshold")         c.similarity_threshold = get_number(key, v);
        else if (key == "top_k")                   c.top_k = get_count(key, v);
        else if (key == "vector_weight") {
            c.vector_weight = get_number(key, v);
            vector_weight_set = true;
        }
        else if (key == "keyword_weight") {
            c.keyword_weight = get_number(key, v);
            keyword_weight_set = true;
        }
        else if (key == "enable_hybrid")           c.enable_hybrid = get_flag(key, v);
        else if (key == "candidate_multiplier")    c.candidate_multiplier = get_count(key, v);
        else if (key == "max_vector_candidates")   c.max_vector_candidates = get_count(key, v);
        else if (key == "keyword_candidate_limit") c.keyword_candidate_limit = get_count(key, v);
        else if (key == "batch_size")              c.batch_size = get_count(key, v);
        else if (key == "cache_enabled")           c.cache_enabled = get_flag(key, v);
        else if (key == "cache_ttl")               c.cache_ttl = get_count(key, v);
        else throw ConfigError("unknown config field: " + key);
    }

    if (vector_weight_set != keyword_weight_set) {
        if (vector_weight_set) {
            check_unit("vector_weight", c.vector_weight);
            c.keyword_weight = 1.0 - c.vector_weight;
        } else {
            check_unit("keyword_weight", c.keyword_weight);
            c.vector_weight = 1.0 - c.keyword_weight;
        }
    }
    validate(c);
    return c;
}

nlohmann::json to_json(const RetrievalConfig& c) {
    return {
        {"similarity_threshold", c.similarity_threshold},
        {"top_k", c.top_k},
        {"vector_weight", c.vector_weight},
        {"keyword_weight", c.keyword_weight},
        {"enable_hybrid", c.enable_hybrid},
        {"candidate_multiplier", c.candidate_multiplier},
        {"max_vector_candidates", c.max_vector_candidates},
        {"keyword_candidate_limit", c.keyword_candidate_limit},
        {"batch_size", c.batch_size},
        {"cache_enabled", c.cache_enabled},
        {"cache_ttl", c.cache_ttl}
    };
}

// ── ConfigStore ──────────────────────────────────────────────────

ConfigStore::ConfigStore(RetrievalConfig initial) {
    validate(initial);
    current_ = std::make_shared<const RetrievalConfig>(initial);
}

std::shared_ptr<const RetrievalConfig> ConfigStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

RetrievalConfig ConfigStore::update(const nlohmann::json& partial) {
    std::lock_guard<std::mutex> lock(mutex_);
    RetrievalConfig next = apply_update(*current_, partial);
    current_ = std::make_shared<const RetrievalConfig>(next);
    version_++;
    return next;
}

RetrievalConfig ConfigStore::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::make_shared<const RetrievalConfig>();
    version_++;
    return *current_;
}

std::pair<std::shared_ptr<const RetrievalConfig>, uint64_t>
ConfigStore::versioned_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {current_, version_};
}

uint64_t ConfigStore::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

} // namespace bankmatch
