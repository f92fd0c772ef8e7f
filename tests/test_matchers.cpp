#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "bank_fixture.hpp"
#include "retrieval/entity_extractor.hpp"
#include "retrieval/exact_matcher.hpp"
#include "retrieval/keyword_matcher.hpp"
#include "retrieval/vector_matcher.hpp"

using namespace bankmatch;

// ── ExactNameMatcher ─────────────────────────────────────────────

TEST_CASE("ExactNameMatcher: full name hit", "[matchers][exact]") {
    StoreFixture f("exact_hit");
    f.load_sample();
    ExactNameMatcher m(f.store);

    std::string q = "中国工商银行股份有限公司北京西单支行";
    auto r = m.match(extract_entities(q), q);
    REQUIRE(r);
    REQUIRE(r->bank_code == "102100000101");
    REQUIRE(r->similarity_score == 1.0);
    REQUIRE(r->final_score == 1.0);
    REQUIRE(r->retrieval_method == RetrievalMethod::ExactFullName);
}

TEST_CASE("ExactNameMatcher: normalized raw query also matches", "[matchers][exact]") {
    StoreFixture f("exact_norm");
    f.load_sample();
    ExactNameMatcher m(f.store);

    // Spacing differs from the stored name
    std::string q = "招商银行股份有限公司 深圳分行";
    auto r = m.match(extract_entities(q), q);
    REQUIRE(r);
    REQUIRE(r->bank_code == "308584000112");
}

TEST_CASE("ExactNameMatcher: miss is empty", "[matchers][exact]") {
    StoreFixture f("exact_miss");
    f.load_sample();
    ExactNameMatcher m(f.store);

    REQUIRE_FALSE(m.match(extract_entities("工行西单"), "工行西单"));
    REQUIRE_FALSE(m.match(extract_entities(""), ""));
}

// ── VectorMatcher ────────────────────────────────────────────────

TEST_CASE("distance_to_similarity: bounded and decreasing", "[matchers][vector]") {
    REQUIRE(distance_to_similarity(0.0) == 1.0);
    REQUIRE(distance_to_similarity(1.0) == Catch::Approx(0.5));
    REQUIRE(distance_to_similarity(2.0) == Catch::Approx(1.0 / 3.0));
    REQUIRE(distance_to_similarity(-0.5) == 1.0);
    REQUIRE(distance_to_similarity(0.2) > distance_to_similarity(0.3));
}

TEST_CASE("VectorMatcher: candidates ordered by similarity", "[matchers][vector]") {
    CorpusFixture f("vector_order");
    VectorMatcher m(f.embedder);
    auto snap = f.sync.current();
    REQUIRE(snap);

    auto hits = m.match("工商银行西单", *snap->vectors, 5, 0.0);
    REQUIRE(hits.size() == 5);
    for (size_t i = 1; i < hits.size(); ++i) REQUIRE(hits[i - 1].score >= hits[i].score);
    for (const auto& h : hits) {
        REQUIRE(h.score > 0.0);
        REQUIRE(h.score <= 1.0);
        REQUIRE_FALSE(h.bank_name.empty());
    }
}

TEST_CASE("VectorMatcher: raising the threshold never adds candidates", "[matchers][vector]") {
    CorpusFixture f("vector_threshold");
    VectorMatcher m(f.embedder);
    auto snap = f.sync.current();

    size_t prev = m.match("西单", *snap->vectors, 12, 0.0).size();
    for (double t : {0.1, 0.3, 0.5, 0.6, 0.7, 0.9, 1.0}) {
        auto hits = m.match("西单", *snap->vectors, 12, t);
        REQUIRE(hits.size() <= prev);
        for (const auto& h : hits) REQUIRE(h.score >= t);
        prev = hits.size();
    }
}

TEST_CASE("VectorMatcher: embedding failure degrades to empty", "[matchers][vector]") {
    CorpusFixture f("vector_fail");
    ToggleEmbedder broken;
    broken.failing = true;
    VectorMatcher m(broken);

    REQUIRE(m.match("西单", *f.sync.current()->vectors, 5, 0.0).empty());
}

TEST_CASE("VectorMatcher: dimension mismatch degrades to empty", "[matchers][vector]") {
    CorpusFixture f("vector_dims");
    HashingEmbedder other(32);
    VectorMatcher m(other);

    REQUIRE(m.match("西单", *f.sync.current()->vectors, 5, 0.0).empty());
}

// ── KeywordMatcher ───────────────────────────────────────────────

TEST_CASE("keyword_overlap: fraction of keywords found", "[matchers][keyword]") {
    std::string name = "中国工商银行股份有限公司北京西单支行";
    REQUIRE(keyword_overlap({"中国工商银行", "西单"}, name, "102100000101", "102100099996", {}) == 1.0);
    REQUIRE(keyword_overlap({"中国工商银行", "国贸"}, name, "102100000101", "102100099996", {}) == 0.5);
    REQUIRE(keyword_overlap({"工行"}, name, "102100000101", "102100099996", {"工行"}) == 1.0);
    REQUIRE(keyword_overlap({"102100099996"}, name, "102100000101", "102100099996", {}) == 1.0);
    REQUIRE(keyword_overlap({}, name, "", "", {}) == 0.0);
}

TEST_CASE("KeywordMatcher: scores candidates from the inverted index", "[matchers][keyword]") {
    CorpusFixture f("keyword_index");
    KeywordMatcher m(f.store);
    auto snap = f.sync.current();

    auto hits = m.match(extract_entities("工行西单"), {}, snap.get(), 200);
    REQUIRE_FALSE(hits.empty());
    REQUIRE(hits.front().bank_code == "102100000101");
    REQUIRE(hits.front().score == 1.0);
    for (size_t i = 1; i < hits.size(); ++i) REQUIRE(hits[i].score < 1.0);
}

TEST_CASE("KeywordMatcher: only district records for a district query", "[matchers][keyword]") {
    CorpusFixture f("keyword_district");
    KeywordMatcher m(f.store);

    auto hits = m.match(extract_entities("西单"), {}, f.sync.current().get(), 200);
    REQUIRE(hits.size() == kXidanCount);
    for (const auto& h : hits) REQUIRE(h.bank_name.find("西单") != std::string::npos);
}

TEST_CASE("KeywordMatcher: code pattern finds the record directly", "[matchers][keyword]") {
    CorpusFixture f("keyword_code");
    KeywordMatcher m(f.store);

    auto hits = m.match(extract_entities("联行号102100000105"), {}, f.sync.current().get(), 200);
    REQUIRE_FALSE(hits.empty());
    REQUIRE(hits.front().bank_name == "中国工商银行股份有限公司北京国贸支行");
}

TEST_CASE("KeywordMatcher: restricted to vector candidates without an index", "[matchers][keyword]") {
    CorpusFixture f("keyword_restricted");
    KeywordMatcher m(f.store);

    // Snapshot with vectors but no inverted index
    auto snap = f.sync.current();
    IndexSnapshot vectors_only;
    vectors_only.vectors = snap->vectors;

    auto rec = f.store.find_by_code("105100000102");
    REQUIRE(rec);
    std::vector<ScoredCandidate> candidates = {{rec->id, rec->bank_name, rec->bank_code, 0.7}};

    auto hits = m.match(extract_entities("西单"), candidates, &vectors_only, 200);
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].record_id == rec->id);
}

TEST_CASE("KeywordMatcher: bounded store fallback with nothing else", "[matchers][keyword]") {
    StoreFixture f("keyword_fallback");
    f.load_sample();
    KeywordMatcher m(f.store);

    auto hits = m.match(extract_entities("西单"), {}, nullptr, 3);
    REQUIRE(hits.size() == 3);
    for (const auto& h : hits) {
        REQUIRE(h.record_id <= 3);
        REQUIRE(h.bank_name.find("西单") != std::string::npos);
    }

    // Records past the window are never read
    REQUIRE(m.match(extract_entities("深圳"), {}, nullptr, 3).empty());
}

TEST_CASE("KeywordMatcher: no keywords gives nothing", "[matchers][keyword]") {
    StoreFixture f("keyword_none");
    f.load_sample();
    KeywordMatcher m(f.store);
    REQUIRE(m.match(extract_entities(""), {}, nullptr, 10).empty());
}
