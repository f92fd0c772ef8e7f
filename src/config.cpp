#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace bankmatch {

nlohmann::json Config::defaults_json() {
    return {
        {"store", {
            {"path", ""}
        }},
        {"embeddings", {
            {"provider", "local"},
            {"api_key", ""},
            {"base_url", ""},
            {"model", ""},
            {"dimensions", 384}
        }},
        {"retrieval", {
            {"similarity_threshold", 0.1},
            {"top_k", 5},
            {"vector_weight", 0.6},
            {"keyword_weight", 0.4},
            {"enable_hybrid", true},
            {"candidate_multiplier", 10},
            {"max_vector_candidates", 500},
            {"keyword_candidate_limit", 200},
            {"batch_size", 100},
            {"cache_enabled", true},
            {"cache_ttl", 3600}
        }},
        {"cache", {
            {"max_entries", 1000}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

std::string config_file_path() {
    if (const char* v = std::getenv("BANKMATCH_CONFIG")) {
        if (*v) return v;
    }
    return expand_home("~/.bankmatch/config.json");
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("store") && j["store"].is_object()) {
        auto& s = j["store"];
        if (s.contains("path") && s["path"].is_string())
            cfg.store.path = s["path"].get<std::string>();
    }

    if (j.contains("embeddings") && j["embeddings"].is_object()) {
        auto& e = j["embeddings"];
        if (e.contains("provider") && e["provider"].is_string())
            cfg.embeddings.provider = e["provider"].get<std::string>();
        if (e.contains("api_key") && e["api_key"].is_string())
            cfg.embeddings.api_key = e["api_key"].get<std::string>();
        if (e.contains("base_url") && e["base_url"].is_string())
            cfg.embeddings.base_url = e["base_url"].get<std::string>();
        if (e.contains("model") && e["model"].is_string())
            cfg.embeddings.model = e["model"].get<std::string>();
        if (e.contains("dimensions") && e["dimensions"].is_number_integer() &&
            e["dimensions"].get<int64_t>() > 0)
            cfg.embeddings.dimensions = e["dimensions"].get<uint32_t>();
    }

    if (j.contains("retrieval") && j["retrieval"].is_object())
        cfg.retrieval = j["retrieval"];

    if (j.contains("cache") && j["cache"].is_object()) {
        auto& c = j["cache"];
        if (c.contains("max_entries") && c["max_entries"].is_number_integer() &&
            c["max_entries"].get<int64_t>() >= 0)
            cfg.cache.max_entries = c["max_entries"].get<uint32_t>();
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = config_file_path();
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("BANKMATCH_DB"))
        cfg.store.path = v;
    if (const char* v = std::getenv("BANKMATCH_EMBEDDER"))
        cfg.embeddings.provider = v;
    if (const char* v = std::getenv("OPENAI_API_KEY")) {
        if (cfg.embeddings.api_key.empty()) cfg.embeddings.api_key = v;
    }
    if (const char* v = std::getenv("OLLAMA_BASE_URL")) {
        if (cfg.embeddings.provider == "ollama") cfg.embeddings.base_url = v;
    }

    return cfg;
}

std::string Config::store_path() const {
    if (!store.path.empty()) return expand_home(store.path);
    return expand_home("~/.bankmatch/banks.db");
}

} // namespace bankmatch
