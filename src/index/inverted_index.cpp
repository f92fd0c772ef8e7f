#include "inverted_index.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace bankmatch {

std::vector<std::string> char_bigrams(const std::string& s) {
    std::u32string cps = decode_utf8(s);
    std::vector<std::string> out;
    if (cps.size() < 2) return out;
    out.reserve(cps.size() - 1);
    for (size_t i = 0; i + 1 < cps.size(); ++i) {
        std::string bg;
        append_utf8(bg, cps[i]);
        append_utf8(bg, cps[i + 1]);
        out.push_back(std::move(bg));
    }
    return out;
}

void InvertedIndex::add(int64_t record_id, const std::string& normalized_name,
                        const std::vector<std::string>& keywords) {
    for (const auto& k : keywords) postings_[k].push_back(record_id);
    for (const auto& bg : char_bigrams(normalized_name)) postings_[bg].push_back(record_id);
}

void InvertedIndex::finalize() {
    for (auto& [token, ids] : postings_) {
        std::sort(ids.begin(), ids.end());
        ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
    }
}

static std::vector<int64_t> intersect(const std::vector<int64_t>& a, const std::vector<int64_t>& b) {
    std::vector<int64_t> out;
    std::set_intersection(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
}

std::vector<int64_t> InvertedIndex::postings(const std::string& keyword) const {
    std::vector<int64_t> direct;
    if (auto it = postings_.find(keyword); it != postings_.end()) direct = it->second;

    auto bigrams = char_bigrams(keyword);
    if (bigrams.size() < 2) return direct; // a 2-char keyword is its own bigram

    // Intersect smallest lists first
    std::vector<const std::vector<int64_t>*> lists;
    for (const auto& bg : bigrams) {
        auto it = postings_.find(bg);
        if (it == postings_.end()) return direct;
        lists.push_back(&it->second);
    }
    std::sort(lists.begin(), lists.end(), [](const auto* x, const auto* y) {
        return x->size() < y->size();
    });
    std::vector<int64_t> acc = *lists.front();
    for (size_t i = 1; i < lists.size() && !acc.empty(); ++i) {
        acc = intersect(acc, *lists[i]);
    }

    std::vector<int64_t> merged;
    std::set_union(direct.begin(), direct.end(), acc.begin(), acc.end(),
                   std::back_inserter(merged));
    return merged;
}

std::vector<int64_t> InvertedIndex::lookup(const std::vector<std::string>& keywords,
                                           size_t limit) const {
    if (limit == 0 || keywords.empty()) return {};

    std::vector<std::vector<int64_t>> lists;
    for (const auto& k : keywords) {
        auto ids = postings(k);
        if (!ids.empty()) lists.push_back(std::move(ids));
    }
    if (lists.empty()) return {};
    std::sort(lists.begin(), lists.end(), [](const auto& x, const auto& y) {
        return x.size() < y.size();
    });

    // Records matching every keyword enter the pool first, then the most
    // selective lists fill what is left of it
    const size_t pool_cap = limit * 4;
    std::vector<int64_t> pool;
    std::unordered_set<int64_t> seen;
    std::vector<int64_t> full = lists.front();
    for (size_t i = 1; i < lists.size() && !full.empty(); ++i) {
        full = intersect(full, lists[i]);
    }
    for (int64_t id : full) {
        if (pool.size() >= pool_cap) break;
        if (seen.insert(id).second) pool.push_back(id);
    }
    for (const auto& ids : lists) {
        for (int64_t id : ids) {
            if (pool.size() >= pool_cap) break;
            if (seen.insert(id).second) pool.push_back(id);
        }
        if (pool.size() >= pool_cap) break;
    }

    std::vector<std::pair<size_t, int64_t>> ranked; // {hits, id}
    ranked.reserve(pool.size());
    for (int64_t id : pool) {
        size_t hits = 0;
        for (const auto& ids : lists) {
            if (std::binary_search(ids.begin(), ids.end(), id)) hits++;
        }
        ranked.emplace_back(hits, id);
    }
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second < b.second;
    });
    if (ranked.size() > limit) ranked.resize(limit);

    std::vector<int64_t> out;
    out.reserve(ranked.size());
    for (const auto& r : ranked) out.push_back(r.second);
    return out;
}

} // namespace bankmatch
