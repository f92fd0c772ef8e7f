#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <cmath>

namespace bankmatch {

using Embedding = std::vector<float>;

class HttpClient; // forward declare
struct EmbeddingConfig; // forward declare

// Abstract embedding provider interface.
// An empty Embedding is the failure signal; implementations never throw
// for transport or decoding problems.
class Embedder {
public:
    virtual ~Embedder() = default;

    // Compute embedding vector for the given text
    virtual Embedding embed(const std::string& text) = 0;

    // Embed several texts. Result has one entry per input, empty on failure.
    // Default implementation calls embed() for each text.
    virtual std::vector<Embedding> embed_batch(const std::vector<std::string>& texts);

    // Dimensionality of the embedding vectors
    virtual uint32_t dimensions() const = 0;

    // Human-readable name (e.g. "local", "openai", "ollama")
    virtual std::string embedder_name() const = 0;
};

// Cosine similarity between two embedding vectors.
// Returns value in [-1, 1]. Returns 0.0 if either vector is empty,
// zero-magnitude, or the lengths differ.
inline double cosine_similarity(const Embedding& a, const Embedding& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) return 0.0;

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
        norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
        norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
    }

    double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
    if (denom < 1e-12) return 0.0;

    return dot / denom;
}

// Scale v to unit length in place. Zero vectors are left unchanged.
void l2_normalize(Embedding& v);

// Create an embedder from config. Returns nullptr if the configured
// provider is unknown or lacks required credentials.
std::unique_ptr<Embedder> create_embedder(const EmbeddingConfig& config, HttpClient& http);

} // namespace bankmatch
