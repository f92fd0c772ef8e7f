#pragma once
#include "../embedder.hpp"
#include "../index/inverted_index.hpp"
#include "../index/vector_index.hpp"
#include "../store/record_store.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace bankmatch {

// Everything a retrieve call reads, built together and published at once.
// Immutable after publication.
struct IndexSnapshot {
    std::shared_ptr<const VectorIndex> vectors;
    InvertedIndex keywords;
    std::unordered_map<int64_t, uint64_t> doc_hashes; // record id -> hash of embedded text
    std::string checksum;       // corpus_checksum() of the records it was built from
    uint32_t source_count = 0;
    uint64_t generation = 0;    // increases with every publication
    uint64_t built_at = 0;      // epoch seconds
};

struct IndexStats {
    uint32_t vector_db_count = 0;
    uint32_t source_db_count = 0;
    bool is_synced = false;
    uint32_t embedding_dimension = 0;
    uint64_t last_synced_at = 0;  // 0 = never
};

nlohmann::json to_json(const IndexStats& stats);

// Hex SHA-256 over (id, name, codes) of every record, in id order.
std::string corpus_checksum(const std::vector<BankRecord>& records);

// Metadata snapshot stored with a record's vector
VectorMetadata make_metadata(const BankRecord& record);

// Keeps the vector and keyword indexes consistent with the record store.
// Builds happen off to the side; readers only ever see a complete snapshot.
class IndexSyncManager {
public:
    IndexSyncManager(RecordStore& store, Embedder& embedder,
                     VectorIndexFactory factory = in_memory_index_factory());

    // Re-embed every record and publish a fresh snapshot. Without force,
    // returns true immediately when the current snapshot is in sync.
    // On failure returns false, keeps the previous snapshot and records
    // the reason in last_error().
    bool rebuild(bool force, uint32_t batch_size = 100);

    // Like rebuild(true), but reuses vectors of records whose text is
    // unchanged since the current snapshot.
    bool update(uint32_t batch_size = 100);

    IndexStats stats();

    // nullptr before the first successful build
    std::shared_ptr<const IndexSnapshot> current() const;

    std::string last_error() const;

private:
    bool build(const std::vector<BankRecord>& records, std::string checksum,
               const IndexSnapshot* reuse, uint32_t batch_size);
    void fail(const std::string& reason);

    RecordStore& store_;
    Embedder& embedder_;
    VectorIndexFactory factory_;

    std::mutex build_mutex_;   // one writer at a time
    mutable std::mutex mutex_; // guards snapshot_, last_error_, generation_
    std::shared_ptr<const IndexSnapshot> snapshot_;
    std::string last_error_;
    uint64_t generation_ = 0;
};

} // namespace bankmatch
