#include "hashing_embedder.hpp"
#include "../bank_record.hpp"
#include "../util.hpp"

namespace bankmatch {

static constexpr float kUnigramWeight = 1.0f;
static constexpr float kBigramWeight = 2.0f;

HashingEmbedder::HashingEmbedder(uint32_t dims, uint64_t seed)
    : dims_(dims == 0 ? 384 : dims), seed_(seed) {}

void HashingEmbedder::add_feature(Embedding& out, const std::string& feature,
                                  float weight) const {
    uint64_t h = fnv1a_64(feature, 14695981039346656037ULL ^ seed_);
    auto idx = static_cast<size_t>(h % dims_);
    float sign = ((h >> 32) & 1) ? -1.0f : 1.0f;
    out[idx] += sign * weight;
}

Embedding HashingEmbedder::embed(const std::string& text) {
    std::u32string cps = decode_utf8(normalize_name(text));
    if (cps.empty()) return {};

    Embedding out(dims_, 0.0f);
    std::string prev;
    for (char32_t cp : cps) {
        std::string cur;
        append_utf8(cur, cp);
        add_feature(out, "u:" + cur, kUnigramWeight);
        if (!prev.empty()) add_feature(out, "b:" + prev + cur, kBigramWeight);
        prev = std::move(cur);
    }

    l2_normalize(out);
    return out;
}

} // namespace bankmatch
