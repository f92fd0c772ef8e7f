#include <catch2/catch_test_macros.hpp>
#include "retrieval/retrieval_config.hpp"
#include <atomic>
#include <limits>
#include <thread>
#include <vector>

using namespace bankmatch;

TEST_CASE("RetrievalConfig: defaults are valid", "[retrieval_config]") {
    RetrievalConfig c;
    REQUIRE(c.similarity_threshold == 0.1);
    REQUIRE(c.top_k == 5);
    REQUIRE(c.vector_weight == 0.6);
    REQUIRE(c.keyword_weight == 0.4);
    REQUIRE(c.enable_hybrid);
    REQUIRE_NOTHROW(validate(c));
}

TEST_CASE("RetrievalConfig: vector_candidates is capped", "[retrieval_config]") {
    RetrievalConfig c;
    REQUIRE(c.vector_candidates(5) == 50);
    REQUIRE(c.vector_candidates(50) == 500);
    c.max_vector_candidates = 30;
    REQUIRE(c.vector_candidates(5) == 30);
}

TEST_CASE("validate: rejects out-of-range values", "[retrieval_config]") {
    RetrievalConfig c;
    c.similarity_threshold = 1.5;
    REQUIRE_THROWS_AS(validate(c), ConfigError);

    c = RetrievalConfig{};
    c.top_k = 0;
    REQUIRE_THROWS_AS(validate(c), ConfigError);
    c.top_k = kMaxTopK + 1;
    REQUIRE_THROWS_AS(validate(c), ConfigError);

    c = RetrievalConfig{};
    c.vector_weight = -0.1;
    REQUIRE_THROWS_AS(validate(c), ConfigError);

    c = RetrievalConfig{};
    c.vector_weight = 0.0;
    c.keyword_weight = 0.0;
    REQUIRE_THROWS_AS(validate(c), ConfigError);

    c = RetrievalConfig{};
    c.batch_size = 5;
    REQUIRE_THROWS_AS(validate(c), ConfigError);

    c = RetrievalConfig{};
    c.cache_ttl = 10;
    REQUIRE_THROWS_AS(validate(c), ConfigError);
}

TEST_CASE("validate: NaN threshold is rejected", "[retrieval_config]") {
    REQUIRE_THROWS_AS(validate_threshold(std::numeric_limits<double>::quiet_NaN()), ConfigError);
}

// ── apply_update ─────────────────────────────────────────────────

TEST_CASE("apply_update: merges a partial object", "[retrieval_config]") {
    RetrievalConfig base;
    auto c = apply_update(base, {{"top_k", 10}, {"enable_hybrid", false}});
    REQUIRE(c.top_k == 10);
    REQUIRE_FALSE(c.enable_hybrid);
    REQUIRE(c.vector_weight == base.vector_weight);
    REQUIRE(base.top_k == 5);
}

TEST_CASE("apply_update: integer weights are accepted", "[retrieval_config]") {
    auto c = apply_update(RetrievalConfig{}, {{"vector_weight", 1}, {"keyword_weight", 0}});
    REQUIRE(c.vector_weight == 1.0);
    REQUIRE(c.keyword_weight == 0.0);
}

TEST_CASE("apply_update: a lone weight sets its complement", "[retrieval_config]") {
    auto c = apply_update(RetrievalConfig{}, {{"vector_weight", 1.0}});
    REQUIRE(c.vector_weight == 1.0);
    REQUIRE(c.keyword_weight == 0.0);

    c = apply_update(RetrievalConfig{}, {{"keyword_weight", 0.75}});
    REQUIRE(c.keyword_weight == 0.75);
    REQUIRE(c.vector_weight == 0.25);

    REQUIRE_THROWS_AS(apply_update(RetrievalConfig{}, {{"keyword_weight", 1.5}}), ConfigError);
}

TEST_CASE("apply_update: weights given together must sum to 1", "[retrieval_config]") {
    REQUIRE_THROWS_AS(apply_update(RetrievalConfig{}, {{"vector_weight", 1.0}, {"keyword_weight", 1.0}}),
                      ConfigError);
    REQUIRE_THROWS_AS(apply_update(RetrievalConfig{}, {{"vector_weight", 0.5}, {"keyword_weight", 0.3}}),
                      ConfigError);

    auto c = apply_update(RetrievalConfig{}, {{"vector_weight", 0.705}, {"keyword_weight", 0.3}});
    REQUIRE(c.vector_weight == 0.705);
    REQUIRE(c.keyword_weight == 0.3);
}

TEST_CASE("validate: weights off the unit sum are rejected", "[retrieval_config]") {
    RetrievalConfig c;
    c.vector_weight = 1.0;
    c.keyword_weight = 1.0;
    REQUIRE_THROWS_AS(validate(c), ConfigError);
}

TEST_CASE("apply_update: rejects bad input with a descriptive error", "[retrieval_config]") {
    RetrievalConfig base;
    REQUIRE_THROWS_AS(apply_update(base, nlohmann::json::array()), ConfigError);
    REQUIRE_THROWS_AS(apply_update(base, {{"topk", 3}}), ConfigError);
    REQUIRE_THROWS_AS(apply_update(base, {{"top_k", "ten"}}), ConfigError);
    REQUIRE_THROWS_AS(apply_update(base, {{"top_k", -1}}), ConfigError);
    REQUIRE_THROWS_AS(apply_update(base, {{"top_k", 2.5}}), ConfigError);
    REQUIRE_THROWS_AS(apply_update(base, {{"enable_hybrid", 1}}), ConfigError);
    REQUIRE_THROWS_AS(apply_update(base, {{"similarity_threshold", -0.01}}), ConfigError);

    try {
        apply_update(base, {{"similarity_threshold", 2.0}});
        FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        REQUIRE(std::string(e.what()).find("similarity_threshold") != std::string::npos);
    }
}

TEST_CASE("to_json: every field present", "[retrieval_config]") {
    auto j = to_json(RetrievalConfig{});
    REQUIRE(j.size() == 11);
    REQUIRE(j["top_k"] == 5);
    REQUIRE(j["cache_ttl"] == 3600);
    // Feeding the view back in is a no-op
    auto c = apply_update(RetrievalConfig{}, j);
    REQUIRE(to_json(c) == j);
}

// ── ConfigStore ──────────────────────────────────────────────────

TEST_CASE("ConfigStore: update swaps a new snapshot", "[retrieval_config]") {
    ConfigStore store;
    auto before = store.snapshot();
    REQUIRE(store.version() == 0);

    store.update({{"top_k", 7}});
    REQUIRE(store.snapshot()->top_k == 7);
    REQUIRE(before->top_k == 5); // old readers keep their view
    REQUIRE(store.version() == 1);
}

TEST_CASE("ConfigStore: failed update leaves config unchanged", "[retrieval_config]") {
    ConfigStore store;
    REQUIRE_THROWS_AS(store.update({{"top_k", 7}, {"vector_weight", 3.0}}), ConfigError);
    REQUIRE(store.snapshot()->top_k == 5);
    REQUIRE(store.version() == 0);
}

TEST_CASE("ConfigStore: reset restores defaults", "[retrieval_config]") {
    RetrievalConfig initial;
    initial.top_k = 9;
    ConfigStore store(initial);
    REQUIRE(store.snapshot()->top_k == 9);

    auto c = store.reset();
    REQUIRE(c.top_k == 5);
    REQUIRE(store.snapshot()->top_k == 5);
}

TEST_CASE("ConfigStore: invalid initial config throws", "[retrieval_config]") {
    RetrievalConfig bad;
    bad.top_k = 0;
    REQUIRE_THROWS_AS(ConfigStore(bad), ConfigError);
}

TEST_CASE("ConfigStore: readers never see a mixed config", "[retrieval_config]") {
    ConfigStore store;
    std::atomic<bool> mixed{false};

    std::thread writer([&] {
        for (int i = 0; i < 200; ++i) {
            if (i % 2 == 0) store.update({{"vector_weight", 1.0}, {"keyword_weight", 0.0}});
            else store.update({{"vector_weight", 0.0}, {"keyword_weight", 1.0}});
        }
    });
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            for (int i = 0; i < 500; ++i) {
                auto c = store.snapshot();
                if (c->vector_weight + c->keyword_weight != 1.0) mixed = true;
            }
        });
    }
    writer.join();
    for (auto& t : readers) t.join();
    REQUIRE_FALSE(mixed.load());
}

TEST_CASE("ConfigStore: versioned snapshot pairs config with its version", "[retrieval_config]") {
    ConfigStore store;
    auto first = store.versioned_snapshot();
    REQUIRE(first.second == 0);
    REQUIRE(first.first->top_k == 5);

    // Update n sets top_k to 3 when n is odd, 4 when even
    std::atomic<bool> torn{false};
    std::thread writer([&] {
        for (int n = 1; n <= 300; ++n) store.update({{"top_k", n % 2 ? 3 : 4}});
    });
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            for (int i = 0; i < 500; ++i) {
                auto v = store.versioned_snapshot();
                uint32_t expected = v.second == 0 ? 5u : (v.second % 2 ? 3u : 4u);
                if (v.first->top_k != expected) torn = true;
            }
        });
    }
    writer.join();
    for (auto& t : readers) t.join();

    REQUIRE_FALSE(torn.load());
    REQUIRE(store.versioned_snapshot().second == 300);
}
