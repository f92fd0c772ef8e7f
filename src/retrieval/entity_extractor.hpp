#pragma once
#include <optional>
#include <string>
#include <vector>

namespace bankmatch {

// Structured hints pulled out of one query. Lives for a single retrieve call.
struct QueryEntities {
    std::optional<std::string> full_name;     // query reads as a complete legal name
    std::optional<std::string> bank_type;     // canonical brand, e.g. "中国工商银行"
    std::optional<std::string> location;      // city, e.g. "北京"
    std::optional<std::string> branch_name;   // district/area or residual branch token
    std::optional<std::string> code_pattern;  // 12-digit run
    std::vector<std::string> keywords;        // unique, in extraction order
};

// Pure function; never fails. With nothing recognised, keywords are the
// normalized query split on whitespace and punctuation.
QueryEntities extract_entities(const std::string& query);

} // namespace bankmatch
