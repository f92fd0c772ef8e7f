#include "embedder.hpp"
#include "embedders/hashing_embedder.hpp"
#include "embedders/http_embedder.hpp"
#include "config.hpp"
#include "http.hpp"
#include <iostream>

namespace bankmatch {

std::vector<Embedding> Embedder::embed_batch(const std::vector<std::string>& texts) {
    std::vector<Embedding> out;
    out.reserve(texts.size());
    for (const auto& t : texts) out.push_back(embed(t));
    return out;
}

void l2_normalize(Embedding& v) {
    double norm = 0.0;
    for (float x : v) norm += static_cast<double>(x) * static_cast<double>(x);
    norm = std::sqrt(norm);
    if (norm < 1e-12) return;
    for (auto& x : v) x = static_cast<float>(x / norm);
}

std::unique_ptr<Embedder> create_embedder(const EmbeddingConfig& config, HttpClient& http) {
    const std::string& provider = config.provider;

    if (provider.empty() || provider == "local") {
        return std::make_unique<HashingEmbedder>(config.dimensions);
    }

    if (provider == "openai") {
        if (config.api_key.empty()) {
            std::cerr << "[embedder] OpenAI embeddings configured but no API key found\n";
            return nullptr;
        }
        return create_openai_embedder(config.api_key, http, config.base_url, config.model);
    }

    if (provider == "ollama") {
        return create_ollama_embedder(http, config.base_url, config.model);
    }

    std::cerr << "[embedder] Unknown embedding provider: " << provider << "\n";
    return nullptr;
}

} // namespace bankmatch
