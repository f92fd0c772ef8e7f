#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "retrieval/score_fusion.hpp"

using namespace bankmatch;

static ScoredCandidate cand(int64_t id, const std::string& name, const std::string& code, double score) {
    return {id, name, code, score};
}

static FusionParams params(uint32_t top_k = 5) {
    FusionParams p;
    p.top_k = top_k;
    return p;
}

TEST_CASE("fuse: merges both signals for one record", "[fusion]") {
    auto out = fuse({cand(1, "北京西单支行", "102100000101", 0.8)},
                    {cand(1, "北京西单支行", "102100000101", 0.5)},
                    std::nullopt, params(), "西单");
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].similarity_score == 0.8);
    REQUIRE(out[0].keyword_score == 0.5);
    REQUIRE(out[0].final_score == Catch::Approx(0.6 * 0.8 + 0.4 * 0.5));
    REQUIRE(out[0].retrieval_method == RetrievalMethod::Hybrid);
}

TEST_CASE("fuse: single-signal records are tagged by source", "[fusion]") {
    auto out = fuse({cand(1, "甲支行", "100000000001", 0.9)},
                    {cand(2, "乙支行", "100000000002", 1.0)},
                    std::nullopt, params(), "x");
    REQUIRE(out.size() == 2);
    REQUIRE(out[0].record_id == 1); // 0.54 > 0.40
    REQUIRE(out[0].retrieval_method == RetrievalMethod::Vector);
    REQUIRE(out[0].keyword_score == 0.0);
    REQUIRE(out[1].retrieval_method == RetrievalMethod::Keyword);
    REQUIRE(out[1].similarity_score == 0.0);
}

TEST_CASE("fuse: truncates to top_k", "[fusion]") {
    std::vector<ScoredCandidate> v;
    for (int i = 1; i <= 10; ++i) v.push_back(cand(i, "支行" + std::to_string(i), std::to_string(100000000000 + i), 0.1 * i));
    auto out = fuse(v, {}, std::nullopt, params(3), "");
    REQUIRE(out.size() == 3);
    REQUIRE(out[0].record_id == 10);
    REQUIRE(out[2].record_id == 8);
}

TEST_CASE("fuse: zero final scores are dropped", "[fusion]") {
    FusionParams p = params();
    p.vector_weight = 1.0;
    p.keyword_weight = 0.0;
    auto out = fuse({cand(1, "甲", "100000000001", 0.5)},
                    {cand(2, "乙", "100000000002", 1.0)},
                    std::nullopt, p, "");
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].record_id == 1);
}

TEST_CASE("fuse: vector-only weights keep vector order", "[fusion]") {
    FusionParams p = params(4);
    p.vector_weight = 1.0;
    p.keyword_weight = 0.0;
    std::vector<ScoredCandidate> v = {
        cand(3, "丙支行", "100000000003", 0.9),
        cand(1, "甲支行", "100000000001", 0.7),
        cand(2, "乙支行", "100000000002", 0.6),
        cand(4, "丁支行", "100000000004", 0.4),
    };
    std::vector<ScoredCandidate> k = {
        cand(4, "丁支行", "100000000004", 1.0),
        cand(2, "乙支行", "100000000002", 1.0),
    };
    auto out = fuse(v, k, std::nullopt, p, "");
    REQUIRE(out.size() == 4);
    for (size_t i = 0; i < v.size(); ++i) {
        REQUIRE(out[i].record_id == v[i].record_id);
        REQUIRE(out[i].final_score == Catch::Approx(v[i].score));
    }
}

TEST_CASE("fuse: hybrid off uses the dominant strategy only", "[fusion]") {
    FusionParams p = params();
    p.enable_hybrid = false;

    auto out = fuse({cand(1, "甲", "100000000001", 0.7)},
                    {cand(2, "乙", "100000000002", 1.0), cand(1, "甲", "100000000001", 1.0)},
                    std::nullopt, p, "");
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].record_id == 1);
    REQUIRE(out[0].final_score == Catch::Approx(0.7));
    REQUIRE(out[0].retrieval_method == RetrievalMethod::Vector);

    // No vector candidates: keyword takes over
    out = fuse({}, {cand(2, "乙", "100000000002", 0.5)}, std::nullopt, p, "");
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].final_score == Catch::Approx(0.5));
    REQUIRE(out[0].retrieval_method == RetrievalMethod::Keyword);
}

// ── Tie-breaks ───────────────────────────────────────────────────

TEST_CASE("fuse: tie prefers names containing the query", "[fusion]") {
    auto out = fuse({cand(1, "建行国贸支行", "100000000001", 0.5),
                     cand(2, "建行西单支行", "100000000002", 0.5)},
                    {}, std::nullopt, params(), "西单支行");
    REQUIRE(out[0].record_id == 2);
}

TEST_CASE("fuse: tie prefers the shorter name", "[fusion]") {
    auto out = fuse({cand(1, "中国银行北京分行西单支行营业部", "100000000001", 0.5),
                     cand(2, "中国银行西单支行", "100000000002", 0.5)},
                    {}, std::nullopt, params(), "西单");
    REQUIRE(out[0].record_id == 2);
}

TEST_CASE("fuse: tie falls back to the smaller bank code", "[fusion]") {
    auto out = fuse({cand(7, "甲支行", "300000000000", 0.5),
                     cand(8, "乙支行", "200000000000", 0.5)},
                    {}, std::nullopt, params(), "");
    REQUIRE(out[0].bank_code == "200000000000");
}

TEST_CASE("fuse: near-equal scores count as ties", "[fusion]") {
    auto out = fuse({cand(1, "甲乙丙支行", "100000000001", 0.5 + 1e-12),
                     cand(2, "甲支行", "100000000002", 0.5)},
                    {}, std::nullopt, params(), "");
    REQUIRE(out[0].record_id == 2);
}

// ── Exact match ──────────────────────────────────────────────────

TEST_CASE("fuse: exact result always first and not repeated", "[fusion]") {
    RetrievalResult exact;
    exact.record_id = 5;
    exact.bank_name = "中国工商银行股份有限公司北京西单支行";
    exact.bank_code = "102100000101";
    exact.similarity_score = 1.0;
    exact.final_score = 1.0;
    exact.retrieval_method = RetrievalMethod::ExactFullName;

    auto out = fuse({cand(9, "其他支行", "100000000009", 1.0), cand(5, exact.bank_name, exact.bank_code, 0.99)},
                    {cand(9, "其他支行", "100000000009", 1.0)},
                    exact, params(2), exact.bank_name);
    REQUIRE(out.size() == 2);
    REQUIRE(out[0].record_id == 5);
    REQUIRE(out[0].retrieval_method == RetrievalMethod::ExactFullName);
    REQUIRE(out[0].final_score == 1.0);
    REQUIRE(out[1].record_id == 9);
}

TEST_CASE("fuse: exact result counts toward top_k", "[fusion]") {
    RetrievalResult exact;
    exact.record_id = 1;
    exact.final_score = 1.0;
    exact.retrieval_method = RetrievalMethod::ExactFullName;

    auto out = fuse({cand(2, "乙", "100000000002", 0.9)}, {}, exact, params(1), "");
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].record_id == 1);
}

TEST_CASE("fuse: nothing in, nothing out", "[fusion]") {
    REQUIRE(fuse({}, {}, std::nullopt, params(), "西单").empty());
}
