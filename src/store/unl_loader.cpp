#include "unl_loader.hpp"
#include "../util.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace bankmatch {

void parse_unl(std::istream& in, std::vector<BankRecord>& out, LoadReport& report) {
    std::string line;
    uint32_t line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (trim(line).empty()) continue;
        report.total_lines++;

        auto fields = split(line, '|');
        if (fields.size() < 3) {
            report.skipped++;
            continue;
        }

        BankRecord r;
        r.bank_code = trim(fields[0]);
        r.bank_name = trim(fields[1]);
        r.clearing_code = trim(fields[2]);
        if (r.bank_code.empty() || r.bank_name.empty() || r.clearing_code.empty()) {
            report.skipped++;
            continue;
        }

        try {
            validate_record(r);
        } catch (const RecordError& e) {
            std::cerr << "[store] line " << line_no << " rejected: " << e.what() << "\n";
            report.rejected++;
            continue;
        }
        out.push_back(std::move(r));
    }
}

LoadReport load_unl_file(SqliteRecordStore& store, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open " + path);
    }

    LoadReport report;
    std::vector<BankRecord> records;
    parse_unl(file, records, report);

    auto counts = store.upsert_all(records);
    report.imported = counts.inserted;
    report.updated = counts.updated;

    std::cerr << "[store] Loaded " << path << ": " << report.imported << " new, "
              << report.updated << " updated, " << report.skipped << " skipped, "
              << report.rejected << " rejected\n";
    return report;
}

} // namespace bankmatch
