#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

namespace nom::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    // Bind helpers (1-based parameter index)
    [[nodiscard]] VoidResult bind_text(int index, std::string_view text);
    [[nodiscard]] VoidResult bind_int(int index, int value);
    [[nodiscard]] VoidResult bind_int64(int index, int64_t value);
    [[nodiscard]] VoidResult bind_bool(int index, bool value);

    // Column getters (0-based column index)
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_bool(int index) const;

    // Returns true while there is a row
    [[nodiscard]] Result<bool, Error> step();
    [[nodiscard]] VoidResult reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Collapse a sequence of bind results into the first failure, if any.
 * Braced lists evaluate left to right, so binds run in parameter order.
 */
[[nodiscard]] VoidResult all_ok(std::initializer_list<VoidResult> results);

/**
 * Database - SQLite connection wrapper.
 *
 * - RAII connection management
 * - Transaction support
 * - Error handling via Result; every failure is ErrorKind::Persistence
 *   carrying the SQLite result code
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open (creating if needed) a database file.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open a private in-memory database.
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    void close();

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Execute one or more statements without results.
     */
    [[nodiscard]] VoidResult execute(const std::string& sql);

    /**
     * Run a query and hand every row to `callback`.
     */
    template<typename F>
    [[nodiscard]] VoidResult query(const std::string& sql, F&& callback) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return VoidResult::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return VoidResult::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }

        return VoidResult::ok();
    }

    [[nodiscard]] VoidResult begin_transaction();
    [[nodiscard]] VoidResult commit();
    [[nodiscard]] VoidResult rollback();

    /**
     * Whether an explicit transaction is currently open on this connection.
     */
    [[nodiscard]] bool in_transaction() const;

    /**
     * Execute a function within a transaction.
     * Commits on success, rolls back on failure.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            rollback_or_log();
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            rollback_or_log();
            return ResultType::err(commit_result.unwrap_err());
        }

        return result;
    }

    [[nodiscard]] int64_t last_insert_rowid() const;

    /**
     * Rows changed by the most recent INSERT, UPDATE or DELETE.
     */
    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    Database(sqlite3* db, std::string path) : db_(db), path_(std::move(path)) {}

    // Rollback after a failed body; a failing rollback is logged, the
    // original error is what the caller sees.
    void rollback_or_log();

    sqlite3* db_ = nullptr;
    std::string path_;
};

/**
 * Transaction RAII guard.
 * Rolls back if not explicitly committed.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    /**
     * Result of opening the transaction.
     */
    [[nodiscard]] const VoidResult& status() const { return begin_status_; }

    [[nodiscard]] VoidResult commit();
    void rollback();

    [[nodiscard]] bool is_active() const { return active_; }

private:
    Database& db_;
    VoidResult begin_status_;
    bool active_ = false;
};

} // namespace nom::storage
