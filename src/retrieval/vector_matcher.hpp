#pragma once
#include "result.hpp"
#include "../embedder.hpp"
#include "../index/vector_index.hpp"
#include <string>
#include <vector>

namespace bankmatch {

// Bounded, monotonically decreasing map from distance to [0, 1]
inline double distance_to_similarity(double distance) {
    if (distance < 0.0) distance = 0.0;
    return 1.0 / (1.0 + distance);
}

// Semantic nearest-neighbour candidates for a query.
class VectorMatcher {
public:
    explicit VectorMatcher(Embedder& embedder) : embedder_(embedder) {}

    // Up to k candidates with similarity >= threshold, best first.
    // Embedding or index failures are logged and yield an empty list.
    std::vector<ScoredCandidate> match(const std::string& query, const VectorIndex& index,
                                       uint32_t k, double threshold);

private:
    Embedder& embedder_;
};

} // namespace bankmatch
