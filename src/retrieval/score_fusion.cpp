#include "score_fusion.hpp"
#include "../bank_record.hpp"
#include "../util.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace bankmatch {

namespace {

struct Ranked {
    RetrievalResult result;
    bool has_vector = false;
    bool has_keyword = false;
    bool contains_query = false;
    size_t name_length = 0;
};

bool ranks_before(const Ranked& a, const Ranked& b) {
    double diff = a.result.final_score - b.result.final_score;
    if (std::fabs(diff) > kScoreEpsilon) return diff > 0;
    if (a.contains_query != b.contains_query) return a.contains_query;
    if (a.name_length != b.name_length) return a.name_length < b.name_length;
    if (a.result.bank_code != b.result.bank_code) return a.result.bank_code < b.result.bank_code;
    return a.result.record_id < b.result.record_id;
}

} // namespace

std::vector<RetrievalResult> fuse(const std::vector<ScoredCandidate>& vector_hits,
                                  const std::vector<ScoredCandidate>& keyword_hits,
                                  const std::optional<RetrievalResult>& exact,
                                  const FusionParams& params,
                                  const std::string& raw_query) {
    std::vector<RetrievalResult> out;
    if (params.top_k == 0) return out;
    if (exact) out.push_back(*exact);

    bool use_vector = true;
    bool use_keyword = true;
    if (!params.enable_hybrid) {
        use_vector = !vector_hits.empty();
        use_keyword = !use_vector;
    }

    std::unordered_map<int64_t, size_t> slot;
    std::vector<Ranked> merged;
    auto entry = [&](const ScoredCandidate& c) -> Ranked& {
        auto it = slot.find(c.record_id);
        if (it != slot.end()) return merged[it->second];
        slot[c.record_id] = merged.size();
        merged.emplace_back();
        Ranked& r = merged.back();
        r.result.record_id = c.record_id;
        r.result.bank_name = c.bank_name;
        r.result.bank_code = c.bank_code;
        return r;
    };

    if (use_vector) {
        for (const auto& c : vector_hits) {
            Ranked& r = entry(c);
            r.result.similarity_score = std::max(r.result.similarity_score, c.score);
            r.has_vector = true;
        }
    }
    if (use_keyword) {
        for (const auto& c : keyword_hits) {
            Ranked& r = entry(c);
            r.result.keyword_score = std::max(r.result.keyword_score, c.score);
            r.has_keyword = true;
        }
    }

    std::string needle = normalize_name(raw_query);
    std::vector<Ranked> ranked;
    ranked.reserve(merged.size());
    for (auto& r : merged) {
        if (exact && r.result.record_id == exact->record_id) continue;

        double vs = use_vector ? r.result.similarity_score : 0.0;
        double ks = use_keyword ? r.result.keyword_score : 0.0;
        if (params.enable_hybrid) {
            r.result.final_score = params.vector_weight * vs + params.keyword_weight * ks;
        } else {
            r.result.final_score = use_vector ? vs : ks;
        }
        if (r.result.final_score <= 0.0) continue;

        if (r.has_vector && r.has_keyword) r.result.retrieval_method = RetrievalMethod::Hybrid;
        else if (r.has_vector) r.result.retrieval_method = RetrievalMethod::Vector;
        else r.result.retrieval_method = RetrievalMethod::Keyword;

        r.contains_query = !needle.empty() &&
                           normalize_name(r.result.bank_name).find(needle) != std::string::npos;
        r.name_length = utf8_length(r.result.bank_name);
        ranked.push_back(std::move(r));
    }

    std::sort(ranked.begin(), ranked.end(), ranks_before);

    for (auto& r : ranked) {
        if (out.size() >= params.top_k) break;
        out.push_back(std::move(r.result));
    }
    return out;
}

} // namespace bankmatch
