#include "sqlite_db.hpp"
#include "../memory.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <cstring>
#include <filesystem>
#include <iostream>

namespace klaus {

static std::string db_error(sqlite3* db, const std::string& context) {
    std::string msg = db ? sqlite3_errmsg(db) : "unknown error";
    return context + ": " + msg;
}

// fold_case(text): to_lower() as a SQL function, so prefilters agree with
// the C++ side on accented letters.
static void fold_case_fn(sqlite3_context* ctx, int, sqlite3_value** argv) {
    if (sqlite3_value_type(argv[0]) == SQLITE_NULL) {
        sqlite3_result_null(ctx);
        return;
    }
    const unsigned char* text = sqlite3_value_text(argv[0]);
    int bytes = sqlite3_value_bytes(argv[0]);
    std::string folded = to_lower(
        std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(bytes)));
    sqlite3_result_text(ctx, folded.c_str(), static_cast<int>(folded.size()),
                        SQLITE_TRANSIENT);
}

SqliteDb::SqliteDb(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw StorageError("cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_error(db_, "failed to open " + path_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StorageError(err);
    }

    sqlite3_busy_timeout(db_, 5000);

    if (sqlite3_create_function(db_, "fold_case", 1, SQLITE_UTF8 | SQLITE_DETERMINISTIC,
                                nullptr, fold_case_fn, nullptr, nullptr) != SQLITE_OK) {
        std::string err = db_error(db_, "failed to register fold_case");
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError(err);
    }

    // Performance pragmas
    try_exec("PRAGMA journal_mode=WAL;");
    try_exec("PRAGMA synchronous=NORMAL;");
    try_exec("PRAGMA temp_store=MEMORY;");
    try_exec("PRAGMA foreign_keys=ON;");
}

SqliteDb::~SqliteDb() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteDb::exec(const std::string& sql) {
    auto guard = lock();
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db_);
        sqlite3_free(err);
        throw StorageError("sqlite exec failed: " + msg);
    }
}

bool SqliteDb::try_exec(const std::string& sql) {
    auto guard = lock();
    return sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK;
}

int64_t SqliteDb::last_insert_rowid() const {
    return static_cast<int64_t>(sqlite3_last_insert_rowid(db_));
}

int SqliteDb::changes() const {
    return sqlite3_changes(db_);
}

// ── Statement ────────────────────────────────────────────────

Statement::Statement(const SqliteDb& db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db_.handle(), sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        std::string err = db_error(db_.handle(), "prepare failed");
        if (stmt_) sqlite3_finalize(stmt_);
        stmt_ = nullptr;
        throw StorageError(err);
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement& Statement::bind(int idx, int64_t value) {
    sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value));
    return *this;
}

Statement& Statement::bind(int idx, const std::string& value) {
    sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int idx, double value) {
    sqlite3_bind_double(stmt_, idx, value);
    return *this;
}

Statement& Statement::bind_embedding(int idx, const Embedding& value) {
    if (value.empty()) return bind_null(idx);
    sqlite3_bind_blob(stmt_, idx, value.data(),
                      static_cast<int>(value.size() * sizeof(float)),
                      SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind_null(int idx) {
    sqlite3_bind_null(stmt_, idx);
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StorageError(db_error(db_.handle(), "step failed"));
}

void Statement::run() {
    while (step()) {}
}

bool Statement::column_is_null(int col) const {
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

int64_t Statement::column_int64(int col) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

double Statement::column_double(int col) const {
    return sqlite3_column_double(stmt_, col);
}

std::string Statement::column_text(int col) const {
    const unsigned char* v = sqlite3_column_text(stmt_, col);
    if (!v) return {};
    return std::string(reinterpret_cast<const char*>(v),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
}

Embedding Statement::column_embedding(int col) const {
    const void* blob = sqlite3_column_blob(stmt_, col);
    int bytes = sqlite3_column_bytes(stmt_, col);
    if (!blob || bytes <= 0 || bytes % static_cast<int>(sizeof(float)) != 0) return {};

    Embedding emb(static_cast<size_t>(bytes) / sizeof(float));
    std::memcpy(emb.data(), blob, static_cast<size_t>(bytes));
    return emb;
}

// ── Transaction ──────────────────────────────────────────────

Transaction::Transaction(SqliteDb& db) : db_(db), lock_(db.lock()) {
    db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (!done_ && !db_.try_exec("ROLLBACK;")) {
        std::cerr << "[memory] Rollback failed on " << db_.path() << "\n";
    }
}

void Transaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

} // namespace klaus
