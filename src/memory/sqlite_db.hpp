#pragma once
#include "../embedder.hpp"
#include <cstdint>
#include <mutex>
#include <string>

struct sqlite3;      // forward declare
struct sqlite3_stmt; // forward declare

namespace klaus {

// Owning handle to one SQLite database file. All statement execution against
// the handle must happen while holding lock(); the mutex is recursive so a
// transaction can span helpers that lock again.
class SqliteDb {
public:
    // Opens (creating parent directories), applies WAL pragmas and registers
    // the fold_case() SQL function.
    // Throws StorageError on failure.
    explicit SqliteDb(const std::string& path);
    ~SqliteDb();

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    using Lock = std::unique_lock<std::recursive_mutex>;
    Lock lock() const { return Lock(mutex_); }

    // Execute one or more statements without results. Throws StorageError.
    void exec(const std::string& sql);

    // Like exec(), but returns false instead of throwing (schema migrations
    // that may legitimately fail, e.g. ADD COLUMN on an existing column).
    bool try_exec(const std::string& sql);

    int64_t last_insert_rowid() const;
    int changes() const;

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::recursive_mutex mutex_;
};

// RAII prepared statement. Bind indices are 1-based, column indices 0-based.
class Statement {
public:
    Statement(const SqliteDb& db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, int64_t value);
    Statement& bind(int idx, const std::string& value);
    Statement& bind(int idx, double value);
    Statement& bind_embedding(int idx, const Embedding& value);
    Statement& bind_null(int idx);

    // Returns true when a row is available, false when done.
    // Throws StorageError on any other result.
    bool step();

    // Step a statement that returns no rows.
    void run();

    bool column_is_null(int col) const;
    int64_t column_int64(int col) const;
    double column_double(int col) const;
    std::string column_text(int col) const;
    Embedding column_embedding(int col) const;

private:
    const SqliteDb& db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// BEGIN IMMEDIATE on construction; rolls back on destruction unless
// commit() was called. Holds the database lock for its lifetime.
class Transaction {
public:
    explicit Transaction(SqliteDb& db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    SqliteDb& db_;
    SqliteDb::Lock lock_;
    bool done_ = false;
};

} // namespace klaus
