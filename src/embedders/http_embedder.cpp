#include "http_embedder.hpp"
#include <iostream>

namespace bankmatch {

HttpEmbedder::HttpEmbedder(Config config, HttpClient& http)
    : config_(std::move(config))
    , http_(http)
    , dimensions_(config_.default_dims)
{}

Embedding HttpEmbedder::embed(const std::string& text) {
    auto out = request(nlohmann::json(text), 1);
    if (out.empty()) return {};
    return std::move(out.front());
}

std::vector<Embedding> HttpEmbedder::embed_batch(const std::vector<std::string>& texts) {
    if (texts.empty()) return {};
    auto out = request(nlohmann::json(texts), texts.size());
    if (out.size() != texts.size()) return std::vector<Embedding>(texts.size());
    return out;
}

// Both providers accept a string or an array under "input" and answer with
// one vector per input, in order.
std::vector<Embedding> HttpEmbedder::request(const nlohmann::json& input, size_t expected) {
    nlohmann::json body = {
        {"model", config_.model},
        {"input", input}
    };

    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!config_.api_key.empty()) {
        headers.push_back({"Authorization", "Bearer " + config_.api_key});
    }

    auto response = http_.post(
        config_.base_url + config_.endpoint, body.dump(), headers, config_.timeout_seconds);
    if (response.status_code != 200) {
        std::cerr << "[embedder] " << config_.name << " returned HTTP "
                  << response.status_code << "\n";
        return {};
    }

    try {
        auto j = nlohmann::json::parse(response.body);
        const auto& list = j.at(nlohmann::json::json_pointer(config_.list_path));
        if (!list.is_array() || list.size() != expected) {
            std::cerr << "[embedder] " << config_.name << " returned "
                      << (list.is_array() ? list.size() : 0) << " vectors, expected "
                      << expected << "\n";
            return {};
        }

        std::vector<Embedding> out;
        out.reserve(list.size());
        for (const auto& item : list) {
            const auto& arr = config_.item_path.empty()
                ? item
                : item.at(nlohmann::json::json_pointer(config_.item_path));
            Embedding emb;
            emb.reserve(arr.size());
            for (const auto& val : arr) {
                emb.push_back(val.get<float>());
            }
            out.push_back(std::move(emb));
        }
        if (!out.empty() && !out.front().empty())
            dimensions_.store(static_cast<uint32_t>(out.front().size()));
        return out;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[embedder] " << config_.name << " response not understood: "
                  << e.what() << "\n";
        return {};
    }
}

std::unique_ptr<Embedder> create_openai_embedder(
    const std::string& api_key, HttpClient& http,
    const std::string& base_url, const std::string& model) {
    HttpEmbedder::Config cfg;
    cfg.name = "openai";
    cfg.api_key = api_key;
    cfg.base_url = base_url.empty() ? "https://api.openai.com/v1" : base_url;
    cfg.model = model.empty() ? "text-embedding-3-small" : model;
    cfg.endpoint = "/embeddings";
    cfg.list_path = "/data";
    cfg.item_path = "/embedding";
    cfg.default_dims = 1536;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

std::unique_ptr<Embedder> create_ollama_embedder(
    HttpClient& http, const std::string& base_url, const std::string& model) {
    HttpEmbedder::Config cfg;
    cfg.name = "ollama";
    cfg.base_url = base_url.empty() ? "http://localhost:11434" : base_url;
    cfg.model = model.empty() ? "nomic-embed-text" : model;
    cfg.endpoint = "/api/embed";
    cfg.list_path = "/embeddings";
    cfg.default_dims = 768;
    return std::make_unique<HttpEmbedder>(std::move(cfg), http);
}

} // namespace bankmatch
