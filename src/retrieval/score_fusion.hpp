#pragma once
#include "result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bankmatch {

struct FusionParams {
    double vector_weight = 0.6;
    double keyword_weight = 0.4;
    bool enable_hybrid = true;
    uint32_t top_k = 5;
};

// Scores closer than this are treated as equal and go to the tie-breaks
constexpr double kScoreEpsilon = 1e-9;

// Merge matcher outputs into the final ranking.
//
// Candidates are deduplicated by record id and scored as
// vector_weight * similarity + keyword_weight * keyword_score. With
// enable_hybrid off only the dominant strategy (vector when it produced
// anything, keyword otherwise) contributes. Results with a final score of
// 0 are dropped. Ties are broken by: name contains the raw query, then
// shorter name, then smaller bank_code. An exact hit is always first and
// counts toward top_k.
std::vector<RetrievalResult> fuse(const std::vector<ScoredCandidate>& vector_hits,
                                  const std::vector<ScoredCandidate>& keyword_hits,
                                  const std::optional<RetrievalResult>& exact,
                                  const FusionParams& params,
                                  const std::string& raw_query);

} // namespace bankmatch
