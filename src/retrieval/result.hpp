#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace bankmatch {

enum class RetrievalMethod {
    ExactFullName,
    Vector,
    Keyword,
    Hybrid,
};

std::string method_to_string(RetrievalMethod method);

struct RetrievalResult {
    int64_t record_id = 0;
    std::string bank_name;
    std::string bank_code;
    double similarity_score = 0.0;  // vector contribution, [0, 1]
    double keyword_score = 0.0;     // keyword contribution, [0, 1]
    double final_score = 0.0;
    RetrievalMethod retrieval_method = RetrievalMethod::Vector;
};

// One matcher's view of a record before fusion.
struct ScoredCandidate {
    int64_t record_id = 0;
    std::string bank_name;
    std::string bank_code;
    double score = 0.0;
};

struct RetrievalResponse {
    std::string question;
    std::vector<RetrievalResult> results;
    uint32_t total_found = 0;
    double search_time_ms = 0.0;
};

nlohmann::json to_json(const RetrievalResult& result);
nlohmann::json to_json(const RetrievalResponse& response);

} // namespace bankmatch
