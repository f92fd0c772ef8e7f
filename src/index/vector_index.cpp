#include "vector_index.hpp"
#include <algorithm>
#include <stdexcept>

namespace bankmatch {

void InMemoryVectorIndex::upsert(int64_t record_id, const Embedding& vector,
                                 VectorMetadata metadata) {
    if (vector.empty())
        throw std::invalid_argument("empty vector for record " + std::to_string(record_id));
    if (dims_ == 0) dims_ = static_cast<uint32_t>(vector.size());
    if (vector.size() != dims_)
        throw std::invalid_argument("vector dimension " + std::to_string(vector.size()) +
                                    " != index dimension " + std::to_string(dims_));

    Embedding unit = vector;
    l2_normalize(unit);

    auto it = slot_.find(record_id);
    if (it != slot_.end()) {
        std::copy(unit.begin(), unit.end(), data_.begin() + static_cast<std::ptrdiff_t>(it->second * dims_));
        meta_[it->second] = std::move(metadata);
        return;
    }

    slot_[record_id] = ids_.size();
    ids_.push_back(record_id);
    meta_.push_back(std::move(metadata));
    data_.insert(data_.end(), unit.begin(), unit.end());
}

bool InMemoryVectorIndex::remove(int64_t record_id) {
    auto it = slot_.find(record_id);
    if (it == slot_.end()) return false;

    size_t slot = it->second;
    size_t last = ids_.size() - 1;
    if (slot != last) {
        // Move the last row into the hole
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(last * dims_),
                  data_.begin() + static_cast<std::ptrdiff_t>((last + 1) * dims_),
                  data_.begin() + static_cast<std::ptrdiff_t>(slot * dims_));
        ids_[slot] = ids_[last];
        meta_[slot] = std::move(meta_[last]);
        slot_[ids_[slot]] = slot;
    }
    ids_.pop_back();
    meta_.pop_back();
    data_.resize(ids_.size() * dims_);
    slot_.erase(it);
    return true;
}

std::vector<VectorHit> InMemoryVectorIndex::query(const Embedding& vector, uint32_t k) const {
    if (ids_.empty() || k == 0) return {};
    if (vector.size() != dims_)
        throw std::invalid_argument("query dimension " + std::to_string(vector.size()) +
                                    " != index dimension " + std::to_string(dims_));

    Embedding q = vector;
    l2_normalize(q);

    std::vector<std::pair<double, size_t>> scored;
    scored.reserve(ids_.size());
    for (size_t row = 0; row < ids_.size(); ++row) {
        const float* v = data_.data() + row * dims_;
        double dot = 0.0;
        for (uint32_t d = 0; d < dims_; ++d) {
            dot += static_cast<double>(q[d]) * static_cast<double>(v[d]);
        }
        double dist = std::clamp(1.0 - dot, 0.0, 2.0);
        scored.emplace_back(dist, row);
    }

    size_t n = std::min<size_t>(k, scored.size());
    auto by_distance = [this](const std::pair<double, size_t>& a,
                              const std::pair<double, size_t>& b) {
        if (a.first != b.first) return a.first < b.first;
        return ids_[a.second] < ids_[b.second];
    };
    std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(n),
                      scored.end(), by_distance);

    std::vector<VectorHit> hits;
    hits.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        size_t row = scored[i].second;
        hits.push_back({ids_[row], scored[i].first, meta_[row]});
    }
    return hits;
}

std::optional<Embedding> InMemoryVectorIndex::embedding(int64_t record_id) const {
    auto it = slot_.find(record_id);
    if (it == slot_.end()) return std::nullopt;
    auto begin = data_.begin() + static_cast<std::ptrdiff_t>(it->second * dims_);
    return Embedding(begin, begin + dims_);
}

const VectorMetadata* InMemoryVectorIndex::metadata(int64_t record_id) const {
    auto it = slot_.find(record_id);
    if (it == slot_.end()) return nullptr;
    return &meta_[it->second];
}

VectorIndexFactory in_memory_index_factory() {
    return [] { return std::make_unique<InMemoryVectorIndex>(); };
}

} // namespace bankmatch
