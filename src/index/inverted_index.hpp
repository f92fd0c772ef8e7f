#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace bankmatch {

// token -> record ids. Tokens are whole metadata keywords plus every
// character bigram of the normalized name, so any keyword of 2+ characters
// can be resolved by intersecting bigram postings instead of scanning names.
class InvertedIndex {
public:
    void add(int64_t record_id, const std::string& normalized_name,
             const std::vector<std::string>& keywords);

    // Sort and dedupe postings; call once after the last add().
    void finalize();

    // Records that may contain keyword (a superset for bigram lookups).
    std::vector<int64_t> postings(const std::string& keyword) const;

    // Up to limit candidate ids, most keywords matched first, ties by id.
    // Only posting lists are touched; record text is never read.
    std::vector<int64_t> lookup(const std::vector<std::string>& keywords, size_t limit) const;

    size_t token_count() const { return postings_.size(); }
    bool empty() const { return postings_.empty(); }

private:
    std::unordered_map<std::string, std::vector<int64_t>> postings_;
};

// Character bigrams of a UTF-8 string, in order
std::vector<std::string> char_bigrams(const std::string& s);

} // namespace bankmatch
