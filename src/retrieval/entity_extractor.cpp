#include "entity_extractor.hpp"
#include "lexicon.hpp"
#include "../bank_record.hpp"
#include "../util.hpp"
#include <algorithm>

namespace bankmatch {

static void add_keyword(std::vector<std::string>& keywords, const std::string& k) {
    if (k.empty()) return;
    if (std::find(keywords.begin(), keywords.end(), k) != keywords.end()) return;
    keywords.push_back(k);
}

QueryEntities extract_entities(const std::string& query) {
    QueryEntities e;
    std::string normalized = normalize_name(query);
    if (normalized.empty()) return e;

    TextAnalysis a = analyze_text(query);

    if (!a.code && looks_like_full_name(normalized)) {
        e.full_name = trim(query);
    }

    if (a.brand) e.bank_type = a.brand->canonical;
    if (a.city) e.location = *a.city;
    if (!a.areas.empty()) {
        e.branch_name = a.areas.front();
    } else if (!a.residual.empty()) {
        e.branch_name = a.residual.front();
    }
    e.code_pattern = a.code;

    if (e.bank_type) add_keyword(e.keywords, *e.bank_type);
    if (e.location) add_keyword(e.keywords, *e.location);
    for (const auto& area : a.areas) add_keyword(e.keywords, area);
    for (const auto& r : a.residual) add_keyword(e.keywords, r);
    if (e.code_pattern) add_keyword(e.keywords, *e.code_pattern);

    if (e.keywords.empty()) {
        for (const auto& seg : a.segments) add_keyword(e.keywords, seg);
    }
    return e;
}

} // namespace bankmatch
