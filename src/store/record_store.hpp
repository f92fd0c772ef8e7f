#pragma once
#include "../bank_record.hpp"
#include <optional>
#include <string>
#include <vector>

namespace bankmatch {

// Source-of-truth record store. Read-only from the retrieval engine's
// point of view; ingestion goes through the concrete store.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual std::string backend_name() const = 0;

    // Every record, ordered by id
    virtual std::vector<BankRecord> get_all() = 0;

    // Equality on normalize_name(name)
    virtual std::optional<BankRecord> find_by_exact_name(const std::string& name) = 0;

    // bank_code match first, then clearing_code
    virtual std::optional<BankRecord> find_by_code(const std::string& code) = 0;

    virtual uint32_t count() = 0;

    // The first limit records in id order.
    virtual std::vector<BankRecord> get_first(uint32_t limit) = 0;
};

} // namespace bankmatch
