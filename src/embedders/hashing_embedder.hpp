#pragma once
#include "../embedder.hpp"

namespace bankmatch {

// Offline embedder: character unigrams and bigrams of the normalized text
// are hashed into signed buckets, then the vector is L2-normalized.
// Deterministic for a given (dimensions, seed). Suited to CJK names, where
// shared characters carry most of the similarity signal.
class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(uint32_t dims = 384, uint64_t seed = 0);

    Embedding embed(const std::string& text) override;
    uint32_t dimensions() const override { return dims_; }
    std::string embedder_name() const override { return "local"; }

private:
    void add_feature(Embedding& out, const std::string& feature, float weight) const;

    uint32_t dims_;
    uint64_t seed_;
};

} // namespace bankmatch
