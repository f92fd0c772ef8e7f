#pragma once
#include "result.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace bankmatch {

struct CachedResponse {
    RetrievalResponse response;
    uint64_t timestamp;
    uint64_t last_access;
};

// Identifies one retrieve call. Index generation and config version are
// part of the key, so a rebuild or config change never serves stale hits.
struct CacheKey {
    std::string question;
    uint32_t top_k = 0;
    double threshold = 0.0;
    uint64_t index_generation = 0;
    uint64_t config_version = 0;
};

// In-process TTL + LRU cache of retrieve responses.
class RetrievalCache {
public:
    RetrievalCache(uint32_t ttl_seconds, uint32_t max_entries);

    // Returns nullopt on miss or expiry.
    std::optional<RetrievalResponse> get(const CacheKey& key);

    void put(const CacheKey& key, const RetrievalResponse& response);

    void set_ttl(uint32_t ttl_seconds);

    uint32_t size() const;
    void clear();

private:
    uint64_t compute_key(const CacheKey& key) const;
    void evict();

    uint32_t ttl_seconds_;
    uint32_t max_entries_;
    std::unordered_map<uint64_t, CachedResponse> entries_;
    mutable std::mutex mutex_;
};

} // namespace bankmatch
