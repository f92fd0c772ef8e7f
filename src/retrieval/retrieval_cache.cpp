#include "retrieval_cache.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cstdio>
#include <vector>

namespace bankmatch {

RetrievalCache::RetrievalCache(uint32_t ttl_seconds, uint32_t max_entries)
    : ttl_seconds_(ttl_seconds), max_entries_(max_entries) {}

uint64_t RetrievalCache::compute_key(const CacheKey& key) const {
    char threshold[32];
    std::snprintf(threshold, sizeof(threshold), "%.6f", key.threshold);

    // Separator byte between fields
    std::string data = key.question;
    data += '\x01';
    data += std::to_string(key.top_k);
    data += '\x01';
    data += threshold;
    data += '\x01';
    data += std::to_string(key.index_generation);
    data += '\x01';
    data += std::to_string(key.config_version);
    return fnv1a_64(data);
}

std::optional<RetrievalResponse> RetrievalCache::get(const CacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(compute_key(key));
    if (it == entries_.end()) return std::nullopt;

    uint64_t now = epoch_seconds();
    if ((now - it->second.timestamp) > ttl_seconds_) {
        entries_.erase(it);
        return std::nullopt;
    }
    // Hash collision guard
    if (it->second.response.question != key.question) return std::nullopt;

    it->second.last_access = now;
    return it->second.response;
}

void RetrievalCache::put(const CacheKey& key, const RetrievalResponse& response) {
    if (max_entries_ == 0) return;
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = epoch_seconds();
    entries_[compute_key(key)] = CachedResponse{response, now, now};
    evict();
}

void RetrievalCache::set_ttl(uint32_t ttl_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    ttl_seconds_ = ttl_seconds;
}

void RetrievalCache::evict() {
    // Must be called with mutex_ already held.
    uint64_t now = epoch_seconds();

    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if ((now - it->second.timestamp) > ttl_seconds_) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    if (entries_.size() > max_entries_) {
        std::vector<std::pair<uint64_t, uint64_t>> key_access; // {last_access, key}
        key_access.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            key_access.emplace_back(entry.last_access, key);
        }
        std::sort(key_access.begin(), key_access.end());

        size_t to_remove = entries_.size() - max_entries_;
        for (size_t i = 0; i < to_remove; ++i) {
            entries_.erase(key_access[i].second);
        }
    }
}

uint32_t RetrievalCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(entries_.size());
}

void RetrievalCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace bankmatch
