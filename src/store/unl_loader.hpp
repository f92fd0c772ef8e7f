#pragma once
#include "sqlite_record_store.hpp"
#include <istream>
#include <string>
#include <vector>

namespace bankmatch {

struct LoadReport {
    uint32_t total_lines = 0; // non-blank lines seen
    uint32_t imported = 0;
    uint32_t updated = 0;
    uint32_t skipped = 0;     // fewer than 3 fields or an empty field
    uint32_t rejected = 0;    // well-formed but failed validation
};

// Parse "bank_code|bank_name|clearing_code" lines. Valid records are
// appended to out; invalid lines are counted in report.
void parse_unl(std::istream& in, std::vector<BankRecord>& out, LoadReport& report);

// Import a UNL file into store in a single transaction.
// Throws std::runtime_error if the file cannot be opened.
LoadReport load_unl_file(SqliteRecordStore& store, const std::string& path);

} // namespace bankmatch
