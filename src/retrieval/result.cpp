#include "result.hpp"

namespace bankmatch {

std::string method_to_string(RetrievalMethod method) {
    switch (method) {
        case RetrievalMethod::ExactFullName: return "exact_full_name";
        case RetrievalMethod::Vector:        return "vector";
        case RetrievalMethod::Keyword:       return "keyword";
        case RetrievalMethod::Hybrid:        return "hybrid";
    }
    return "vector";
}

nlohmann::json to_json(const RetrievalResult& result) {
    return {
        {"bank_name", result.bank_name},
        {"bank_code", result.bank_code},
        {"similarity_score", result.similarity_score},
        {"keyword_score", result.keyword_score},
        {"final_score", result.final_score},
        {"retrieval_method", method_to_string(result.retrieval_method)}
    };
}

nlohmann::json to_json(const RetrievalResponse& response) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& r : response.results) results.push_back(to_json(r));
    return {
        {"question", response.question},
        {"results", results},
        {"total_found", response.total_found},
        {"search_time_ms", response.search_time_ms}
    };
}

} // namespace bankmatch
