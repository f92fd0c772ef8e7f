#pragma once
#include "../embedder.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <string>

namespace bankmatch {

// Unified HTTP-based embedder. Supports OpenAI-compatible and Ollama APIs
// by parameterizing the endpoint, auth, and response JSON paths.
class HttpEmbedder : public Embedder {
public:
    struct Config {
        std::string name;           // e.g. "openai", "ollama"
        std::string api_key;        // empty = no Authorization header
        std::string base_url;       // e.g. "https://api.openai.com/v1"
        std::string model;          // e.g. "text-embedding-3-small"
        std::string endpoint;       // URL path, e.g. "/embeddings"
        std::string list_path;      // JSON pointer to the per-input list, e.g. "/data"
        std::string item_path;      // pointer inside each list item, "" = item is the array
        uint32_t default_dims;      // fallback until first response
        long timeout_seconds = 30;
    };

    HttpEmbedder(Config config, HttpClient& http);

    Embedding embed(const std::string& text) override;
    std::vector<Embedding> embed_batch(const std::vector<std::string>& texts) override;
    uint32_t dimensions() const override { return dimensions_.load(); }
    std::string embedder_name() const override { return config_.name; }

private:
    std::vector<Embedding> request(const nlohmann::json& input, size_t expected);

    Config config_;
    HttpClient& http_;
    std::atomic<uint32_t> dimensions_; // learned from the first response
};

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model);

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model);

} // namespace bankmatch
