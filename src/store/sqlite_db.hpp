#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// StoreError — any SQLite failure surfaced by the store layer
// ---------------------------------------------------------------------------
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// ---------------------------------------------------------------------------
// Statement — owning wrapper around sqlite3_stmt. Bind indices are 1-based.
// ---------------------------------------------------------------------------
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db_);
            throw StoreError("prepare failed: " + msg + " [" + sql + "]");
        }
    }

    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement(Statement&& other) noexcept
        : db_(other.db_), stmt_(std::exchange(other.stmt_, nullptr)) {}

    Statement& bind(int idx, int64_t v) {
        check(sqlite3_bind_int64(stmt_, idx, v), "bind int64");
        return *this;
    }
    Statement& bind(int idx, int v) { return bind(idx, static_cast<int64_t>(v)); }
    Statement& bind(int idx, uint64_t v) { return bind(idx, static_cast<int64_t>(v)); }
    Statement& bind(int idx, bool v) { return bind(idx, static_cast<int64_t>(v ? 1 : 0)); }

    Statement& bind(int idx, double v) {
        check(sqlite3_bind_double(stmt_, idx, v), "bind double");
        return *this;
    }

    Statement& bind(int idx, const std::string& v) {
        check(sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()),
                                SQLITE_TRANSIENT), "bind text");
        return *this;
    }
    Statement& bind(int idx, const char* v) { return bind(idx, std::string(v)); }

    Statement& bind(int idx, const std::optional<double>& v) {
        if (v) return bind(idx, *v);
        check(sqlite3_bind_null(stmt_, idx), "bind null");
        return *this;
    }

    Statement& bind_null(int idx) {
        check(sqlite3_bind_null(stmt_, idx), "bind null");
        return *this;
    }

    // Returns true while a row is available.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    // Execute a statement that returns no rows.
    void run() {
        while (step()) {}
    }

    void reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    int64_t col_int64(int c) const { return sqlite3_column_int64(stmt_, c); }
    int col_int(int c) const { return sqlite3_column_int(stmt_, c); }
    double col_double(int c) const { return sqlite3_column_double(stmt_, c); }
    bool col_is_null(int c) const { return sqlite3_column_type(stmt_, c) == SQLITE_NULL; }

    std::optional<double> col_opt_double(int c) const {
        if (col_is_null(c)) return std::nullopt;
        return col_double(c);
    }

    std::string col_text(int c) const {
        const unsigned char* t = sqlite3_column_text(stmt_, c);
        return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
    }

private:
    void check(int rc, const char* what) {
        if (rc != SQLITE_OK) {
            throw StoreError(std::string(what) + ": " + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// ---------------------------------------------------------------------------
// SqliteDb — owning connection handle
// ---------------------------------------------------------------------------
class SqliteDb {
public:
    explicit SqliteDb(const std::string& path) {
        int rc = sqlite3_open_v2(path.c_str(), &db_,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                     SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
            if (db_) sqlite3_close(db_);
            throw StoreError("cannot open database " + path + ": " + msg);
        }
        sqlite3_busy_timeout(db_, 5000);
    }

    ~SqliteDb() {
        if (db_) sqlite3_close(db_);
    }

    SqliteDb(const SqliteDb&) = delete;
    SqliteDb& operator=(const SqliteDb&) = delete;

    void exec(const std::string& sql) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw StoreError("exec failed: " + msg);
        }
    }

    Statement prepare(const std::string& sql) { return Statement(db_, sql); }

    int64_t last_insert_id() const { return sqlite3_last_insert_rowid(db_); }
    int changes() const { return sqlite3_changes(db_); }

private:
    sqlite3* db_ = nullptr;
};

// ---------------------------------------------------------------------------
// Transaction — BEGIN IMMEDIATE on construction, ROLLBACK unless committed
// ---------------------------------------------------------------------------
class Transaction {
public:
    explicit Transaction(SqliteDb& db) : db_(db) { db_.exec("BEGIN IMMEDIATE"); }

    ~Transaction() {
        if (!done_) {
            try {
                db_.exec("ROLLBACK");
            } catch (const StoreError& e) {
                // Destructor must not throw; the connection reports the failure on next use.
                (void)e;
            }
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        db_.exec("COMMIT");
        done_ = true;
    }

private:
    SqliteDb& db_;
    bool done_ = false;
};
