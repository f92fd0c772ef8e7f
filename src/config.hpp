#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace bankmatch {

struct StoreConfig {
    std::string path; // empty = ~/.bankmatch/banks.db
};

struct EmbeddingConfig {
    std::string provider = "local"; // local | openai | ollama
    std::string api_key;
    std::string base_url;
    std::string model;
    uint32_t dimensions = 384;      // local embedder only
};

// Expiry and on/off live in the retrieval section; this only sizes the cache.
struct CacheConfig {
    uint32_t max_entries = 1000;
};

struct Config {
    StoreConfig store;
    EmbeddingConfig embeddings;
    CacheConfig cache;

    // Raw "retrieval" section; validated by the retrieval layer
    nlohmann::json retrieval = nlohmann::json::object();

    // Load from ~/.bankmatch/config.json (or $BANKMATCH_CONFIG) + env vars
    static Config load();

    // Parse an already-merged JSON document (used by load() and tests)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Resolved database path
    std::string store_path() const;
};

// Path of the config file load() reads
std::string config_file_path();

} // namespace bankmatch
