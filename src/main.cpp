#include "config.hpp"
#include "embedder.hpp"
#include "http.hpp"
#include "util.hpp"
#include "store/sqlite_record_store.hpp"
#include "store/unl_loader.hpp"
#include "retrieval/index_sync.hpp"
#include "retrieval/retrieval_service.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdio>
#include <cstdlib>
#include <atomic>
#include <csignal>
#include <optional>
#include <vector>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: bankmatch [options]\n"
              << "\n"
              << "Options:\n"
              << "  --load FILE          Import a UNL file (bank_code|bank_name|clearing_code)\n"
              << "  --rebuild            Force a full index rebuild\n"
              << "  --update             Incrementally update the index\n"
              << "  --stats              Print index statistics as JSON\n"
              << "  -q, --query TEXT     Run one query and print the JSON response\n"
              << "  --top-k N            Result cap for --query\n"
              << "  --threshold X        Similarity threshold for --query\n"
              << "  --set KEY=VALUE      Apply a retrieval config change (repeatable)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /stats               Show index statistics\n"
              << "  /config              Show retrieval config\n"
              << "  /set KEY=VALUE       Change a retrieval config field\n"
              << "  /reset               Restore default retrieval config\n"
              << "  /rebuild             Force a full index rebuild\n"
              << "  /update              Incrementally update the index\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  BANKMATCH_CONFIG     Config file (default: ~/.bankmatch/config.json)\n"
              << "  BANKMATCH_DB         Record database path\n"
              << "  BANKMATCH_EMBEDDER   Embedding provider (local, openai, ollama)\n"
              << "  OPENAI_API_KEY       API key for OpenAI embeddings\n"
              << "  OLLAMA_BASE_URL      Base URL for Ollama (default: http://localhost:11434)\n";
}

// "key=value" -> {"key": value}; value is parsed as JSON, else taken as a string
static nlohmann::json parse_assignment(const std::string& arg) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0)
        throw bankmatch::ConfigError("expected KEY=VALUE, got: " + arg);

    std::string key = bankmatch::trim(arg.substr(0, eq));
    std::string raw = bankmatch::trim(arg.substr(eq + 1));
    nlohmann::json value;
    try {
        value = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::parse_error&) {
        value = raw;
    }
    return {{key, value}};
}

static void print_response(const bankmatch::RetrievalResponse& resp) {
    if (resp.results.empty()) {
        std::cout << "No results (" << resp.search_time_ms << " ms)\n";
        return;
    }
    int rank = 1;
    for (const auto& r : resp.results) {
        std::printf("%2d. %s  %s  final=%.3f vec=%.3f kw=%.3f  [%s]\n",
                    rank++, r.bank_code.c_str(), r.bank_name.c_str(), r.final_score,
                    r.similarity_score, r.keyword_score,
                    bankmatch::method_to_string(r.retrieval_method).c_str());
    }
    std::cout << resp.total_found << " result(s) in " << resp.search_time_ms << " ms\n";
}

static void report_sync(bool ok, const bankmatch::IndexSyncManager& sync) {
    if (ok) {
        std::cout << "Index is up to date.\n";
    } else {
        std::cout << "Index build failed: " << sync.last_error() << "\n";
    }
}

int main(int argc, char* argv[]) try {
    // Parse arguments
    std::string load_file;
    std::string query;
    bool do_rebuild = false;
    bool do_update = false;
    bool do_stats = false;
    std::optional<uint32_t> top_k;
    std::optional<double> threshold;
    std::vector<std::string> assignments;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--load") == 0 && i + 1 < argc) {
            load_file = argv[++i];
        } else if (std::strcmp(argv[i], "--rebuild") == 0) {
            do_rebuild = true;
        } else if (std::strcmp(argv[i], "--update") == 0) {
            do_update = true;
        } else if (std::strcmp(argv[i], "--stats") == 0) {
            do_stats = true;
        } else if ((std::strcmp(argv[i], "-q") == 0 || std::strcmp(argv[i], "--query") == 0) && i + 1 < argc) {
            query = argv[++i];
        } else if (std::strcmp(argv[i], "--top-k") == 0 && i + 1 < argc) {
            top_k = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--threshold") == 0 && i + 1 < argc) {
            threshold = std::strtod(argv[++i], nullptr);
        } else if (std::strcmp(argv[i], "--set") == 0 && i + 1 < argc) {
            assignments.emplace_back(argv[++i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    bankmatch::http_init();
    bankmatch::http_set_abort_flag(&g_shutdown);

    auto config = bankmatch::Config::load();
    bankmatch::RetrievalConfig initial =
        bankmatch::apply_update(bankmatch::RetrievalConfig{}, config.retrieval);

    bankmatch::SqliteRecordStore store(config.store_path());

    if (!load_file.empty()) {
        auto report = bankmatch::load_unl_file(store, load_file);
        std::cout << "Loaded " << load_file << ": "
                  << report.imported << " imported, "
                  << report.updated << " updated, "
                  << report.skipped << " skipped, "
                  << report.rejected << " rejected\n";
    }

    bankmatch::CurlHttpClient http_client;
    auto embedder = bankmatch::create_embedder(config.embeddings, http_client);
    if (!embedder) {
        std::cerr << "Error: no usable embedder for provider '"
                  << config.embeddings.provider << "'\n";
        bankmatch::http_cleanup();
        return 1;
    }

    bankmatch::IndexSyncManager sync(store, *embedder);
    bankmatch::RetrievalService service(store, *embedder, sync, initial,
                                        config.cache.max_entries);

    for (const auto& a : assignments) {
        service.update_config(parse_assignment(a));
    }

    // The vector index lives in memory, so every run starts with a build
    bool built = do_update ? service.update_index() : service.rebuild_index(do_rebuild);

    if (do_stats) {
        std::cout << bankmatch::to_json(service.stats()).dump(2) << "\n";
    }

    if (!query.empty()) {
        auto resp = service.retrieve(query, top_k, threshold);
        std::cout << bankmatch::to_json(resp).dump(2) << "\n";
        bankmatch::http_cleanup();
        return 0;
    }

    if (do_stats || do_rebuild || do_update || !load_file.empty()) {
        bankmatch::http_cleanup();
        return built ? 0 : 1;
    }

    // Interactive REPL
    auto st = service.stats();
    std::cout << "BankMatch branch lookup\n"
              << "Records: " << st.source_db_count
              << " | Indexed: " << st.vector_db_count
              << " | Embedder: " << embedder->embedder_name() << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (!g_shutdown.load()) {
        std::cout << "bankmatch> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }

        line = bankmatch::trim(line);
        if (line.empty()) continue;

        // Handle slash commands
        if (line[0] == '/') {
            try {
                if (line == "/quit" || line == "/exit") {
                    break;
                } else if (line == "/stats") {
                    std::cout << bankmatch::to_json(service.stats()).dump(2) << "\n";
                } else if (line == "/config") {
                    std::cout << bankmatch::to_json(service.get_config()).dump(2) << "\n";
                } else if (line.substr(0, 5) == "/set ") {
                    auto next = service.update_config(parse_assignment(line.substr(5)));
                    std::cout << bankmatch::to_json(next).dump(2) << "\n";
                } else if (line == "/reset") {
                    service.reset_config();
                    std::cout << "Config restored to defaults.\n";
                } else if (line == "/rebuild") {
                    report_sync(service.rebuild_index(true), sync);
                } else if (line == "/update") {
                    report_sync(service.update_index(), sync);
                } else if (line == "/help") {
                    std::cout << "Commands:\n"
                              << "  /stats         Show index statistics\n"
                              << "  /config        Show retrieval config\n"
                              << "  /set K=V       Change a retrieval config field\n"
                              << "  /reset         Restore default config\n"
                              << "  /rebuild       Force a full index rebuild\n"
                              << "  /update        Incrementally update the index\n"
                              << "  /quit          Exit\n"
                              << "  /help          Show this help\n"
                              << "Any other line is looked up as a query.\n";
                } else {
                    std::cout << "Unknown command: " << line << "\n";
                }
            } catch (const bankmatch::ConfigError& e) {
                std::cout << "Config error: " << e.what() << "\n";
            }
            continue;
        }

        print_response(service.retrieve(line));
    }

    bankmatch::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
