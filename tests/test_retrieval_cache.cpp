#include <catch2/catch_test_macros.hpp>
#include "retrieval/retrieval_cache.hpp"
#include <thread>
#include <chrono>

using namespace bankmatch;

static CacheKey key(const std::string& q, uint64_t generation = 1, uint64_t version = 0) {
    return CacheKey{q, 5, 0.1, generation, version};
}

static RetrievalResponse response(const std::string& q, const std::string& code) {
    RetrievalResponse r;
    r.question = q;
    RetrievalResult res;
    res.bank_code = code;
    r.results.push_back(res);
    r.total_found = 1;
    return r;
}

// ── Basic get/put ────────────────────────────────────────────

TEST_CASE("RetrievalCache: miss on empty cache", "[cache]") {
    RetrievalCache cache(3600, 100);
    REQUIRE_FALSE(cache.get(key("西单")).has_value());
}

TEST_CASE("RetrievalCache: hit after put", "[cache]") {
    RetrievalCache cache(3600, 100);
    cache.put(key("西单"), response("西单", "102100000101"));

    auto hit = cache.get(key("西单"));
    REQUIRE(hit.has_value());
    REQUIRE(hit->results.size() == 1);
    REQUIRE(hit->results[0].bank_code == "102100000101");
}

TEST_CASE("RetrievalCache: every key field matters", "[cache]") {
    RetrievalCache cache(3600, 100);
    cache.put(key("西单"), response("西单", "1"));

    REQUIRE_FALSE(cache.get(key("国贸")).has_value());
    REQUIRE_FALSE(cache.get(key("西单", 2)).has_value());    // index rebuilt
    REQUIRE_FALSE(cache.get(key("西单", 1, 1)).has_value()); // config changed

    CacheKey other_k = key("西单");
    other_k.top_k = 10;
    REQUIRE_FALSE(cache.get(other_k).has_value());

    CacheKey other_t = key("西单");
    other_t.threshold = 0.5;
    REQUIRE_FALSE(cache.get(other_t).has_value());
}

// ── Size tracking ────────────────────────────────────────────

TEST_CASE("RetrievalCache: size and clear", "[cache]") {
    RetrievalCache cache(3600, 100);
    REQUIRE(cache.size() == 0);
    cache.put(key("a"), response("a", "1"));
    cache.put(key("b"), response("b", "2"));
    REQUIRE(cache.size() == 2);
    cache.put(key("a"), response("a", "3"));
    REQUIRE(cache.size() == 2);

    cache.clear();
    REQUIRE(cache.size() == 0);
}

TEST_CASE("RetrievalCache: zero capacity stores nothing", "[cache]") {
    RetrievalCache cache(3600, 0);
    cache.put(key("a"), response("a", "1"));
    REQUIRE(cache.size() == 0);
}

// ── LRU eviction ─────────────────────────────────────────────

TEST_CASE("RetrievalCache: evicts down to max_entries", "[cache]") {
    RetrievalCache cache(3600, 3);
    for (int i = 0; i < 10; ++i) {
        std::string q = "q" + std::to_string(i);
        cache.put(key(q), response(q, std::to_string(i)));
    }
    REQUIRE(cache.size() == 3);
}

// ── TTL expiration ───────────────────────────────────────────

TEST_CASE("RetrievalCache: expired entries miss", "[cache]") {
    RetrievalCache cache(0, 100);
    cache.put(key("西单"), response("西单", "1"));

    // TTL 0 means anything older than the current second is stale
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    REQUIRE_FALSE(cache.get(key("西单")).has_value());
    REQUIRE(cache.size() == 0);
}

TEST_CASE("RetrievalCache: set_ttl applies to existing entries", "[cache]") {
    RetrievalCache cache(3600, 100);
    cache.put(key("西单"), response("西单", "1"));
    cache.set_ttl(0);
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    REQUIRE_FALSE(cache.get(key("西单")).has_value());
}
