#pragma once
#include "store/sqlite_record_store.hpp"
#include "embedders/hashing_embedder.hpp"
#include "retrieval/index_sync.hpp"
#include <filesystem>
#include <string>
#include <vector>
#include <unistd.h>

namespace bankmatch {

// Small branch corpus: five 西单 branches across brands, several other
// ICBC branches, and branches in Shanghai and Shenzhen.
inline std::vector<BankRecord> sample_records() {
    return {
        {0, "中国工商银行股份有限公司北京西单支行",   "102100000101", "102100099996"},
        {0, "中国建设银行股份有限公司北京西单支行",   "105100000102", "105100000017"},
        {0, "中国银行股份有限公司北京西单支行",       "104100000103", "104100000004"},
        {0, "招商银行股份有限公司北京西单支行",       "308100000104", "308584000013"},
        {0, "中国工商银行股份有限公司北京国贸支行",   "102100000105", "102100099996"},
        {0, "中国工商银行股份有限公司上海陆家嘴支行", "102290000106", "102290002916"},
        {0, "中国农业银行股份有限公司北京中关村支行", "103100000107", "103100000026"},
        {0, "交通银行股份有限公司上海徐家汇支行",     "301290000108", "301290000007"},
        {0, "中国建设银行股份有限公司深圳南山支行",   "105584000109", "105584000005"},
        {0, "北京银行股份有限公司西单支行",           "313100000110", "313100000013"},
        {0, "中国工商银行股份有限公司北京分行营业部", "102100000111", "102100099996"},
        {0, "招商银行股份有限公司深圳分行",           "308584000112", "308584000013"},
    };
}

constexpr uint32_t kXidanCount = 5;

// Fresh SQLite store under /tmp, removed with its WAL files on destruction.
struct StoreFixture {
    std::string path;
    SqliteRecordStore store;

    explicit StoreFixture(const std::string& tag)
        : path("/tmp/bankmatch_test_" + tag + "_" + std::to_string(getpid()) + ".db"),
          store(reset(path)) {}

    ~StoreFixture() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }

    void load_sample() { store.upsert_all(sample_records()); }

private:
    static const std::string& reset(const std::string& p) {
        std::filesystem::remove(p);
        std::filesystem::remove(p + "-wal");
        std::filesystem::remove(p + "-shm");
        return p;
    }
};

// Store plus local embedder plus sync manager over the sample corpus.
struct CorpusFixture : StoreFixture {
    HashingEmbedder embedder{256};
    IndexSyncManager sync{store, embedder};

    explicit CorpusFixture(const std::string& tag, bool build = true) : StoreFixture(tag) {
        load_sample();
        if (build) sync.rebuild(true);
    }
};

// Embedder that can be switched to fail, for sync and degradation tests.
class ToggleEmbedder : public Embedder {
public:
    explicit ToggleEmbedder(uint32_t dims = 64) : inner_(dims) {}

    Embedding embed(const std::string& text) override {
        calls++;
        if (failing) return {};
        return inner_.embed(text);
    }
    uint32_t dimensions() const override { return inner_.dimensions(); }
    std::string embedder_name() const override { return "toggle"; }

    bool failing = false;
    int calls = 0;

private:
    HashingEmbedder inner_;
};

} // namespace bankmatch
