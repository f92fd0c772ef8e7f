#include "keyword_matcher.hpp"
#include "lexicon.hpp"
#include "../bank_record.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace bankmatch {

double keyword_overlap(const std::vector<std::string>& keywords,
                       const std::string& bank_name,
                       const std::string& bank_code,
                       const std::string& clearing_code,
                       const std::vector<std::string>& metadata_keywords) {
    if (keywords.empty()) return 0.0;
    std::string name = normalize_name(bank_name);

    size_t matched = 0;
    for (const auto& k : keywords) {
        if (k.empty()) continue;
        if (name.find(k) != std::string::npos ||
            k == bank_code || k == clearing_code ||
            std::find(metadata_keywords.begin(), metadata_keywords.end(), k) !=
                metadata_keywords.end()) {
            matched++;
        }
    }
    return static_cast<double>(matched) / static_cast<double>(keywords.size());
}

namespace {

struct Candidate {
    std::string bank_name;
    std::string bank_code;
    std::string clearing_code;
    std::vector<std::string> keywords;
};

} // namespace

std::vector<ScoredCandidate> KeywordMatcher::match(
        const QueryEntities& entities,
        const std::vector<ScoredCandidate>& vector_candidates,
        const IndexSnapshot* snapshot,
        uint32_t limit) {
    std::vector<ScoredCandidate> out;
    if (entities.keywords.empty()) return out;

    const VectorIndex* vectors = (snapshot && snapshot->vectors) ? snapshot->vectors.get() : nullptr;
    std::unordered_map<int64_t, Candidate> pool;

    auto add_id = [&](int64_t id) {
        if (pool.count(id) || !vectors) return;
        const VectorMetadata* m = vectors->metadata(id);
        if (!m) return;
        pool.emplace(id, Candidate{m->bank_name, m->bank_code, m->clearing_code, m->keywords});
    };
    auto add_record = [&](const BankRecord& r) {
        if (pool.count(r.id)) return;
        const VectorMetadata* m = vectors ? vectors->metadata(r.id) : nullptr;
        pool.emplace(r.id, Candidate{r.bank_name, r.bank_code, r.clearing_code,
                                     m ? m->keywords : record_keywords(r.bank_name)});
    };

    for (const auto& c : vector_candidates) add_id(c.record_id);

    try {
        if (entities.code_pattern) {
            if (auto rec = store_.find_by_code(*entities.code_pattern)) add_record(*rec);
        }

        bool have_inverted = snapshot && !snapshot->keywords.empty();
        if (have_inverted) {
            for (int64_t id : snapshot->keywords.lookup(entities.keywords, limit)) add_id(id);
        } else if (vector_candidates.empty()) {
            // No index yet: score a fixed window of the first limit records
            for (const auto& r : store_.get_first(limit)) add_record(r);
        }
    } catch (const std::exception& e) {
        std::cerr << "[keyword] Candidate lookup failed: " << e.what() << "\n";
    }

    out.reserve(pool.size());
    for (const auto& [id, c] : pool) {
        double score = keyword_overlap(entities.keywords, c.bank_name, c.bank_code,
                                       c.clearing_code, c.keywords);
        if (score <= 0.0) continue;
        out.push_back(ScoredCandidate{id, c.bank_name, c.bank_code, score});
    }
    std::sort(out.begin(), out.end(), [](const ScoredCandidate& a, const ScoredCandidate& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.record_id < b.record_id;
    });
    return out;
}

} // namespace bankmatch
