#pragma once
#include "entity_extractor.hpp"
#include "index_sync.hpp"
#include "result.hpp"
#include "../store/record_store.hpp"
#include <vector>

namespace bankmatch {

// Fraction of keywords found in a record: substring of its normalized
// name, equal to one of its metadata keywords, or equal to either code.
double keyword_overlap(const std::vector<std::string>& keywords,
                       const std::string& bank_name,
                       const std::string& bank_code,
                       const std::string& clearing_code,
                       const std::vector<std::string>& metadata_keywords);

// Re-scores a restricted candidate set by keyword overlap. Candidates come
// from the vector matcher, a direct code lookup and the snapshot's
// inverted index; the record corpus is never scanned.
class KeywordMatcher {
public:
    explicit KeywordMatcher(RecordStore& store) : store_(store) {}

    // Candidates with a non-zero score, best first, ties by id.
    // snapshot may be null; with no snapshot and no vector candidates the
    // store's first limit records are scored.
    std::vector<ScoredCandidate> match(const QueryEntities& entities,
                                       const std::vector<ScoredCandidate>& vector_candidates,
                                       const IndexSnapshot* snapshot,
                                       uint32_t limit);

private:
    RecordStore& store_;
};

} // namespace bankmatch
