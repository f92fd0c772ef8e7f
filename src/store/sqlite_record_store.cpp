#include "sqlite_record_store.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace bankmatch {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static void exec_or_throw(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error(std::string("SqliteRecordStore: ") + msg);
    }
}

SqliteRecordStore::SqliteRecordStore(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteRecordStore: failed to open database: " + err);
    }

    // Performance pragmas
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);

    try {
        init_schema();
    } catch (const std::runtime_error&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteRecordStore::~SqliteRecordStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteRecordStore::init_schema() {
    exec_or_throw(db_,
        "CREATE TABLE IF NOT EXISTS banks ("
        "  id            INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  bank_name     TEXT NOT NULL,"
        "  name_norm     TEXT NOT NULL,"
        "  bank_code     TEXT NOT NULL UNIQUE,"
        "  clearing_code TEXT NOT NULL,"
        "  updated_at    INTEGER NOT NULL"
        ");");

    // Exact-name shortcut and clearing-code lookup must not scan
    exec_or_throw(db_,
        "CREATE INDEX IF NOT EXISTS banks_name_norm ON banks(name_norm);");
    exec_or_throw(db_,
        "CREATE INDEX IF NOT EXISTS banks_clearing ON banks(clearing_code);");
}

// Columns 0-3: id, bank_name, bank_code, clearing_code
static constexpr const char* kSelectCols =
    "SELECT id, bank_name, bank_code, clearing_code FROM banks";

static BankRecord record_from_stmt(sqlite3_stmt* stmt) {
    BankRecord r;
    r.id = sqlite3_column_int64(stmt, 0);
    if (auto* v = sqlite3_column_text(stmt, 1)) r.bank_name     = reinterpret_cast<const char*>(v);
    if (auto* v = sqlite3_column_text(stmt, 2)) r.bank_code     = reinterpret_cast<const char*>(v);
    if (auto* v = sqlite3_column_text(stmt, 3)) r.clearing_code = reinterpret_cast<const char*>(v);
    return r;
}

// Prepare, bind text params, step, collect. Returns empty on prepare failure.
static std::vector<BankRecord> run_query(sqlite3* db, const std::string& sql,
                                         const std::vector<std::string>& text_params,
                                         int limit = -1) {
    StmtGuard g;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[store] prepare failed: " << sqlite3_errmsg(db) << "\n";
        return {};
    }

    int col = 1;
    for (const auto& p : text_params) {
        sqlite3_bind_text(g.stmt, col++, p.c_str(), -1, SQLITE_TRANSIENT);
    }
    if (limit >= 0) sqlite3_bind_int(g.stmt, col, limit);

    std::vector<BankRecord> results;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        results.push_back(record_from_stmt(g.stmt));
    }
    return results;
}

std::vector<BankRecord> SqliteRecordStore::get_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    return run_query(db_, std::string(kSelectCols) + " ORDER BY id;", {});
}

std::optional<BankRecord> SqliteRecordStore::find_by_exact_name(const std::string& name) {
    std::string norm = normalize_name(name);
    if (norm.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = run_query(db_,
        std::string(kSelectCols) + " WHERE name_norm = ? ORDER BY id LIMIT 1;", {norm});
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::optional<BankRecord> SqliteRecordStore::find_by_code(const std::string& code) {
    if (!is_valid_code(code)) return std::nullopt;

    std::lock_guard<std::mutex> lock(mutex_);
    auto rows = run_query(db_,
        std::string(kSelectCols) + " WHERE bank_code = ? LIMIT 1;", {code});
    if (rows.empty()) {
        rows = run_query(db_,
            std::string(kSelectCols) + " WHERE clearing_code = ? ORDER BY id LIMIT 1;", {code});
    }
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

uint32_t SqliteRecordStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM banks;", -1, &g.stmt, nullptr) != SQLITE_OK)
        return 0;
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int64(g.stmt, 0));
}

std::vector<BankRecord> SqliteRecordStore::get_first(uint32_t limit) {
    if (limit == 0) return {};
    std::lock_guard<std::mutex> lock(mutex_);
    return run_query(db_, std::string(kSelectCols) + " ORDER BY id LIMIT ?;", {},
                     static_cast<int>(limit));
}

int64_t SqliteRecordStore::upsert_locked(const BankRecord& record, bool& inserted) {
    // Reuse the existing id so VectorEntry back-references stay stable
    int64_t existing_id = 0;
    {
        StmtGuard g;
        const char* sql = "SELECT id FROM banks WHERE bank_code = ?;";
        if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) == SQLITE_OK) {
            sqlite3_bind_text(g.stmt, 1, record.bank_code.c_str(), -1, SQLITE_STATIC);
            if (sqlite3_step(g.stmt) == SQLITE_ROW) {
                existing_id = sqlite3_column_int64(g.stmt, 0);
            }
        }
    }

    std::string name = trim(record.bank_name);
    std::string norm = normalize_name(name);
    auto ts = static_cast<int64_t>(epoch_seconds());

    StmtGuard g;
    const char* sql = existing_id != 0
        ? "UPDATE banks SET bank_name = ?, name_norm = ?, clearing_code = ?, updated_at = ?"
          " WHERE id = ?;"
        : "INSERT INTO banks (bank_name, name_norm, clearing_code, updated_at, bank_code)"
          " VALUES (?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteRecordStore: ") + sqlite3_errmsg(db_));
    }
    sqlite3_bind_text(g.stmt, 1, name.c_str(),                 -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, norm.c_str(),                 -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, record.clearing_code.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 4, ts);
    if (existing_id != 0)
        sqlite3_bind_int64(g.stmt, 5, existing_id);
    else
        sqlite3_bind_text(g.stmt, 5, record.bank_code.c_str(), -1, SQLITE_STATIC);

    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteRecordStore: ") + sqlite3_errmsg(db_));
    }

    inserted = existing_id == 0;
    return inserted ? sqlite3_last_insert_rowid(db_) : existing_id;
}

int64_t SqliteRecordStore::upsert(const BankRecord& record) {
    validate_record(record);
    std::lock_guard<std::mutex> lock(mutex_);
    bool inserted = false;
    return upsert_locked(record, inserted);
}

UpsertCounts SqliteRecordStore::upsert_all(const std::vector<BankRecord>& records) {
    for (const auto& r : records) validate_record(r);

    std::lock_guard<std::mutex> lock(mutex_);
    UpsertCounts counts;
    exec_or_throw(db_, "BEGIN IMMEDIATE;");
    try {
        for (const auto& r : records) {
            bool inserted = false;
            upsert_locked(r, inserted);
            if (inserted) counts.inserted++;
            else counts.updated++;
        }
        exec_or_throw(db_, "COMMIT;");
    } catch (const std::runtime_error&) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    return counts;
}

bool SqliteRecordStore::remove(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    if (sqlite3_prepare_v2(db_, "DELETE FROM banks WHERE id = ?;", -1, &g.stmt, nullptr) != SQLITE_OK)
        return false;
    sqlite3_bind_int64(g.stmt, 1, id);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) return false;
    return sqlite3_changes(db_) > 0;
}

} // namespace bankmatch
