#include "index_sync.hpp"
#include "lexicon.hpp"
#include "../util.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <stdexcept>

namespace bankmatch {

nlohmann::json to_json(const IndexStats& s) {
    return {
        {"vector_db_count", s.vector_db_count},
        {"source_db_count", s.source_db_count},
        {"is_synced", s.is_synced},
        {"embedding_dimension", s.embedding_dimension},
        {"last_synced_at", s.last_synced_at}
    };
}

std::string corpus_checksum(const std::vector<BankRecord>& records) {
    std::vector<const BankRecord*> sorted;
    sorted.reserve(records.size());
    for (const auto& r : records) sorted.push_back(&r);
    std::sort(sorted.begin(), sorted.end(), [](const BankRecord* a, const BankRecord* b) {
        return a->id < b->id;
    });

    std::string data;
    data.reserve(records.size() * 80);
    for (const auto* r : sorted) {
        data += std::to_string(r->id);
        data += '\x1f';
        data += r->bank_name;
        data += '\x1f';
        data += r->bank_code;
        data += '\x1f';
        data += r->clearing_code;
        data += '\n';
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::string hex;
    hex.reserve(SHA256_DIGEST_LENGTH * 2);
    char buf[3];
    for (unsigned char b : hash) {
        std::snprintf(buf, sizeof(buf), "%02x", b);
        hex += buf;
    }
    return hex;
}

VectorMetadata make_metadata(const BankRecord& record) {
    VectorMetadata m;
    m.bank_name = record.bank_name;
    m.bank_code = record.bank_code;
    m.clearing_code = record.clearing_code;
    m.keywords = record_keywords(record.bank_name);
    return m;
}

IndexSyncManager::IndexSyncManager(RecordStore& store, Embedder& embedder,
                                   VectorIndexFactory factory)
    : store_(store), embedder_(embedder), factory_(std::move(factory)) {}

std::shared_ptr<const IndexSnapshot> IndexSyncManager::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

std::string IndexSyncManager::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

void IndexSyncManager::fail(const std::string& reason) {
    std::cerr << "[sync] Index build failed, previous index kept: " << reason << "\n";
    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = reason;
}

bool IndexSyncManager::rebuild(bool force, uint32_t batch_size) {
    std::lock_guard<std::mutex> writer(build_mutex_);

    std::vector<BankRecord> records = store_.get_all();
    if (records.empty()) {
        fail("record store is empty");
        return false;
    }
    std::string checksum = corpus_checksum(records);

    if (!force) {
        auto cur = current();
        if (cur && cur->checksum == checksum && cur->vectors->count() == records.size()) {
            return true;
        }
    }
    return build(records, std::move(checksum), nullptr, batch_size);
}

bool IndexSyncManager::update(uint32_t batch_size) {
    std::lock_guard<std::mutex> writer(build_mutex_);

    std::vector<BankRecord> records = store_.get_all();
    if (records.empty()) {
        fail("record store is empty");
        return false;
    }
    std::string checksum = corpus_checksum(records);

    auto cur = current();
    if (cur && cur->checksum == checksum && cur->vectors->count() == records.size()) {
        return true;
    }
    return build(records, std::move(checksum), cur.get(), batch_size);
}

bool IndexSyncManager::build(const std::vector<BankRecord>& records, std::string checksum,
                             const IndexSnapshot* reuse, uint32_t batch_size) {
    if (batch_size == 0) batch_size = 100;

    std::unique_ptr<VectorIndex> index = factory_();
    if (!index) {
        fail("vector index factory returned null");
        return false;
    }
    auto snap = std::make_shared<IndexSnapshot>();

    size_t reused = 0;
    size_t embedded = 0;
    try {
        // Records that need a fresh embedding, in batches
        std::vector<const BankRecord*> pending;
        std::vector<uint64_t> pending_hashes;

        auto flush = [&]() -> bool {
            if (pending.empty()) return true;
            std::vector<std::string> texts;
            texts.reserve(pending.size());
            for (const auto* r : pending) texts.push_back(document_text(*r));

            auto vectors = embedder_.embed_batch(texts);
            if (vectors.size() != pending.size()) {
                fail("embedder returned " + std::to_string(vectors.size()) + " vectors for " +
                     std::to_string(pending.size()) + " texts");
                return false;
            }
            for (size_t i = 0; i < pending.size(); ++i) {
                if (vectors[i].empty()) {
                    fail("embedding failed for record " + std::to_string(pending[i]->id));
                    return false;
                }
                index->upsert(pending[i]->id, vectors[i], make_metadata(*pending[i]));
                snap->doc_hashes[pending[i]->id] = pending_hashes[i];
            }
            embedded += pending.size();
            std::cerr << "[sync] Embedded " << embedded << " records\n";
            pending.clear();
            pending_hashes.clear();
            return true;
        };

        for (const auto& r : records) {
            uint64_t h = fnv1a_64(document_text(r));
            if (reuse) {
                auto it = reuse->doc_hashes.find(r.id);
                if (it != reuse->doc_hashes.end() && it->second == h) {
                    if (auto vec = reuse->vectors->embedding(r.id)) {
                        index->upsert(r.id, *vec, make_metadata(r));
                        snap->doc_hashes[r.id] = h;
                        reused++;
                        continue;
                    }
                }
            }
            pending.push_back(&r);
            pending_hashes.push_back(h);
            if (pending.size() >= batch_size && !flush()) return false;
        }
        if (!flush()) return false;
    } catch (const std::exception& e) {
        fail(e.what());
        return false;
    }

    for (const auto& r : records) {
        const VectorMetadata* m = index->metadata(r.id);
        snap->keywords.add(r.id, normalize_name(r.bank_name),
                           m ? m->keywords : std::vector<std::string>{});
    }
    snap->keywords.finalize();

    snap->checksum = std::move(checksum);
    snap->source_count = static_cast<uint32_t>(records.size());
    snap->built_at = epoch_seconds();
    snap->vectors = std::move(index);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        snap->generation = ++generation_;
        snapshot_ = std::move(snap);
        last_error_.clear();
    }
    std::cerr << "[sync] Published index: " << records.size() << " records ("
              << embedded << " embedded, " << reused << " reused)\n";
    return true;
}

IndexStats IndexSyncManager::stats() {
    IndexStats s;
    s.source_db_count = store_.count();

    auto cur = current();
    if (cur) {
        s.vector_db_count = cur->vectors->count();
        s.embedding_dimension = cur->vectors->dimensions();
        s.last_synced_at = cur->built_at;
    }
    if (s.embedding_dimension == 0) s.embedding_dimension = embedder_.dimensions();

    // The corpus is read and hashed only when the counts already agree
    s.is_synced = cur && s.vector_db_count > 0 &&
                  s.vector_db_count == s.source_db_count &&
                  cur->checksum == corpus_checksum(store_.get_all());
    return s;
}

} // namespace bankmatch
