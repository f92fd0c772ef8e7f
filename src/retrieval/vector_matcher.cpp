#include "vector_matcher.hpp"
#include <iostream>
#include <stdexcept>

namespace bankmatch {

std::vector<ScoredCandidate> VectorMatcher::match(const std::string& query,
                                                  const VectorIndex& index,
                                                  uint32_t k, double threshold) {
    std::vector<ScoredCandidate> out;
    if (k == 0 || index.count() == 0) return out;

    std::vector<VectorHit> hits;
    try {
        Embedding q = embedder_.embed(query);
        if (q.empty()) {
            std::cerr << "[vector] Embedding failed (" << embedder_.embedder_name()
                      << "), skipping vector search\n";
            return out;
        }
        hits = index.query(q, k);
    } catch (const std::exception& e) {
        std::cerr << "[vector] Search failed: " << e.what() << "\n";
        return out;
    }

    out.reserve(hits.size());
    for (const auto& h : hits) {
        double sim = distance_to_similarity(h.distance);
        if (sim < threshold) continue;
        out.push_back(ScoredCandidate{h.record_id, h.metadata.bank_name, h.metadata.bank_code, sim});
    }
    return out;
}

} // namespace bankmatch
