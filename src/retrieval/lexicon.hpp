#pragma once
#include <optional>
#include <string>
#include <vector>

namespace bankmatch {

// Fixed vocabularies for Chinese bank-branch names: bank brands and their
// colloquial aliases, a city gazetteer, well-known districts and business
// areas, branch-type markers and query stopwords. All terms are stored in
// normalize_name() form.

struct BrandMatch {
    std::string canonical;  // e.g. "中国工商银行"
    std::string matched;    // alias as it appeared, e.g. "工行"
};

// Result of peeling the known vocabularies off a piece of text.
// Terms are removed in order: brand, city, areas, code, markers/stopwords.
struct TextAnalysis {
    std::vector<std::string> segments;     // normalized, split on whitespace/punctuation
    std::optional<BrandMatch> brand;
    std::optional<std::string> city;
    std::vector<std::string> areas;        // in order of first appearance
    std::vector<std::string> markers;      // branch-type markers present
    std::optional<std::string> code;       // first run of exactly 12 digits
    std::vector<std::string> residual;     // leftover tokens of 2+ code points
};

TextAnalysis analyze_text(const std::string& text);

// Aliases (canonical first) of a brand's canonical name; empty if unknown
std::vector<std::string> brand_aliases(const std::string& canonical);

// Branch-type markers, longest first: 营业部, 分理处, 支行, ...
const std::vector<std::string>& branch_markers();

// True if normalized text reads like a complete legal branch name:
// it names an institution and ends with a branch-type marker.
bool looks_like_full_name(const std::string& normalized);

// Keywords stored alongside a record: canonical brand plus aliases,
// city, areas and branch markers found in its name.
std::vector<std::string> record_keywords(const std::string& bank_name);

} // namespace bankmatch
