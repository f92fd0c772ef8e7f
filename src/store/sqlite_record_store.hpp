#pragma once
#include "record_store.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace bankmatch {

struct UpsertCounts {
    uint32_t inserted = 0;
    uint32_t updated = 0;
};

class SqliteRecordStore : public RecordStore {
public:
    explicit SqliteRecordStore(const std::string& path);
    ~SqliteRecordStore() override;

    // Non-copyable
    SqliteRecordStore(const SqliteRecordStore&) = delete;
    SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    std::vector<BankRecord> get_all() override;
    std::optional<BankRecord> find_by_exact_name(const std::string& name) override;
    std::optional<BankRecord> find_by_code(const std::string& code) override;
    uint32_t count() override;
    std::vector<BankRecord> get_first(uint32_t limit) override;

    // Insert or update keyed by bank_code; returns the record id.
    // Throws RecordError if the record fails validation.
    int64_t upsert(const BankRecord& record);

    // Validate all records first, then write them in one transaction.
    // Throws RecordError (nothing written) if any record is invalid.
    UpsertCounts upsert_all(const std::vector<BankRecord>& records);

    bool remove(int64_t id);

private:
    void init_schema();
    int64_t upsert_locked(const BankRecord& record, bool& inserted);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace bankmatch
