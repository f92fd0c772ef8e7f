#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <nlohmann/json.hpp>

namespace bankmatch {

// Thrown for malformed or out-of-range configuration and retrieve overrides.
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct RetrievalConfig {
    double similarity_threshold = 0.1;   // [0, 1]
    uint32_t top_k = 5;                  // [1, 50]
    double vector_weight = 0.6;          // [0, 1], sums to 1 with keyword_weight
    double keyword_weight = 0.4;         // [0, 1]
    bool enable_hybrid = true;

    uint32_t candidate_multiplier = 10;      // [1, 100]
    uint32_t max_vector_candidates = 500;    // [1, 1000]
    uint32_t keyword_candidate_limit = 200;  // [1, 10000]
    uint32_t batch_size = 100;               // [10, 1000]
    bool cache_enabled = true;
    uint32_t cache_ttl = 3600;               // [60, 86400] seconds

    // Vector candidates to request for a given result cap
    uint32_t vector_candidates(uint32_t k) const;
};

constexpr uint32_t kMaxTopK = 50;

// Allowed drift of vector_weight + keyword_weight from 1
constexpr double kWeightSumTolerance = 0.01;

// Throws ConfigError naming the first offending field.
void validate(const RetrievalConfig& config);

void validate_top_k(uint32_t top_k);
void validate_threshold(double threshold);

// Apply a partial JSON object onto base and validate the result.
// A weight given alone sets the other weight to its complement; weights
// given together must sum to 1.
// Throws ConfigError for a non-object, an unknown key, a wrong type or an
// out-of-range value. base is never modified.
RetrievalConfig apply_update(const RetrievalConfig& base, const nlohmann::json& partial);

nlohmann::json to_json(const RetrievalConfig& config);

// Holds the live RetrievalConfig as an immutable snapshot. Readers take a
// shared_ptr and keep a consistent view for the whole call; writers build
// and validate a complete new config, then swap it in.
class ConfigStore {
public:
    explicit ConfigStore(RetrievalConfig initial = RetrievalConfig{});

    std::shared_ptr<const RetrievalConfig> snapshot() const;

    // Snapshot together with the version it was published under
    std::pair<std::shared_ptr<const RetrievalConfig>, uint64_t> versioned_snapshot() const;

    // Validate and merge; on error the live config is unchanged.
    RetrievalConfig update(const nlohmann::json& partial);

    // Restore defaults
    RetrievalConfig reset();

    // Incremented on every successful update or reset
    uint64_t version() const;

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const RetrievalConfig> current_;
    uint64_t version_ = 0;
};

} // namespace bankmatch
