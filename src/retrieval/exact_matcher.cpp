#include "exact_matcher.hpp"
#include "../bank_record.hpp"
#include <iostream>
#include <stdexcept>

namespace bankmatch {

std::optional<RetrievalResult> ExactNameMatcher::match(const QueryEntities& entities,
                                                       const std::string& raw_query) {
    const std::string& name = entities.full_name ? *entities.full_name : raw_query;
    if (normalize_name(name).empty()) return std::nullopt;

    std::optional<BankRecord> rec;
    try {
        rec = store_.find_by_exact_name(name);
    } catch (const std::exception& e) {
        std::cerr << "[exact] Lookup failed: " << e.what() << "\n";
        return std::nullopt;
    }
    if (!rec) return std::nullopt;

    RetrievalResult r;
    r.record_id = rec->id;
    r.bank_name = rec->bank_name;
    r.bank_code = rec->bank_code;
    r.similarity_score = 1.0;
    r.keyword_score = 0.0;
    r.final_score = 1.0;
    r.retrieval_method = RetrievalMethod::ExactFullName;
    return r;
}

} // namespace bankmatch
