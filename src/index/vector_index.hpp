#pragma once
#include "../embedder.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bankmatch {

// Denormalized copy of the record fields a hit needs, so matchers never
// join back to the record store.
struct VectorMetadata {
    std::string bank_name;
    std::string bank_code;
    std::string clearing_code;
    std::vector<std::string> keywords; // aliases, cities, areas, branch markers
};

struct VectorHit {
    int64_t record_id = 0;
    double distance = 0.0;  // 0 = identical direction
    VectorMetadata metadata;
};

// Nearest-neighbour index over record embeddings. Writers populate it
// before it is published; published indexes are only read.
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    virtual std::string backend_name() const = 0;

    // Throws std::invalid_argument on an empty vector or a dimension
    // different from the first one inserted.
    virtual void upsert(int64_t record_id, const Embedding& vector, VectorMetadata metadata) = 0;

    virtual bool remove(int64_t record_id) = 0;

    // Up to k hits ordered by ascending distance.
    // Throws std::invalid_argument on a dimension mismatch.
    virtual std::vector<VectorHit> query(const Embedding& vector, uint32_t k) const = 0;

    virtual uint32_t count() const = 0;

    // 0 until the first upsert
    virtual uint32_t dimensions() const = 0;

    // Stored (normalized) vector, for reuse during incremental updates
    virtual std::optional<Embedding> embedding(int64_t record_id) const = 0;

    // nullptr if record_id is not indexed
    virtual const VectorMetadata* metadata(int64_t record_id) const = 0;
};

using VectorIndexFactory = std::function<std::unique_ptr<VectorIndex>()>;

// Exact brute-force cosine search over a contiguous float buffer.
// distance = 1 - cosine, so it lies in [0, 2].
class InMemoryVectorIndex : public VectorIndex {
public:
    std::string backend_name() const override { return "memory"; }

    void upsert(int64_t record_id, const Embedding& vector, VectorMetadata metadata) override;
    bool remove(int64_t record_id) override;
    std::vector<VectorHit> query(const Embedding& vector, uint32_t k) const override;
    uint32_t count() const override { return static_cast<uint32_t>(ids_.size()); }
    uint32_t dimensions() const override { return dims_; }
    std::optional<Embedding> embedding(int64_t record_id) const override;
    const VectorMetadata* metadata(int64_t record_id) const override;

private:
    uint32_t dims_ = 0;
    std::vector<float> data_;               // count() rows of dims_ floats
    std::vector<int64_t> ids_;
    std::vector<VectorMetadata> meta_;
    std::unordered_map<int64_t, size_t> slot_;
};

VectorIndexFactory in_memory_index_factory();

} // namespace bankmatch
