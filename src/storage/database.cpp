#include "storage/database.hpp"
#include "storage/store_log.hpp"

#include <QString>

namespace nom::storage {

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

VoidResult bind_status(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        return VoidResult::err(Error::persistence(
            std::string("Failed to bind ") + what + ": " + sqlite3_errstr(rc), rc));
    }
    return VoidResult::ok();
}

} // namespace

// ============================================================================
// Statement implementation
// ============================================================================

VoidResult Statement::bind_text(int index, std::string_view text) {
    return bind_status(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                         static_cast<int>(text.size()), SQLITE_TRANSIENT),
                       "text");
}

VoidResult Statement::bind_int(int index, int value) {
    return bind_status(sqlite3_bind_int(stmt_.get(), index, value), "int");
}

VoidResult Statement::bind_int64(int index, int64_t value) {
    return bind_status(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
}

VoidResult Statement::bind_bool(int index, bool value) {
    return bind_int(index, value ? 1 : 0);
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_bool(int index) const {
    return sqlite3_column_int(stmt_.get(), index) != 0;
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(Error::persistence(
        std::string("Step failed: ") + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)), rc));
}

VoidResult Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return VoidResult::err(Error::persistence("Reset failed", rc));
    }
    return VoidResult::ok();
}

VoidResult all_ok(std::initializer_list<VoidResult> results) {
    for (const auto& result : results) {
        if (result.is_err()) {
            return result;
        }
    }
    return VoidResult::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        if (db) sqlite3_close(db);
        return Result<Database, Error>::err(
            Error::persistence("Failed to open " + path + ": " + error, rc));
    }

    sqlite3_busy_timeout(db, BUSY_TIMEOUT_MS);
    sqlite3_extended_result_codes(db, 1);

    Database database(db, path);

    // WAL is unavailable for in-memory databases; SQLite keeps "memory" there.
    auto journal = database.execute("PRAGMA journal_mode = WAL;");
    if (journal.is_err()) {
        qCWarning(nomStoreLog) << "could not enable WAL for" << QString::fromStdString(path)
                               << QString::fromStdString(journal.unwrap_err().message);
    }

    auto sync = database.execute("PRAGMA synchronous = NORMAL;");
    if (sync.is_err()) {
        return Result<Database, Error>::err(sync.unwrap_err());
    }

    return Result<Database, Error>::ok(std::move(database));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK) {
            qCWarning(nomStoreLog) << "close failed for" << QString::fromStdString(path_) << sqlite3_errstr(rc);
            sqlite3_close_v2(db_);
        }
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement, Error>::err(Error::persistence("Database not open", SQLITE_MISUSE));
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error::persistence(last_error(), rc));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

VoidResult Database::execute(const std::string& sql) {
    if (!db_) {
        return VoidResult::err(Error::persistence("Database not open", SQLITE_MISUSE));
    }
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errstr(rc);
        sqlite3_free(error_msg);
        return VoidResult::err(Error::persistence(error, rc));
    }
    return VoidResult::ok();
}

VoidResult Database::begin_transaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

VoidResult Database::commit() {
    return execute("COMMIT;");
}

VoidResult Database::rollback() {
    return execute("ROLLBACK;");
}

bool Database::in_transaction() const {
    return db_ != nullptr && sqlite3_get_autocommit(db_) == 0;
}

void Database::rollback_or_log() {
    if (!in_transaction()) return;
    auto result = rollback();
    if (result.is_err()) {
        qCWarning(nomStoreLog) << "rollback failed:" << QString::fromStdString(result.unwrap_err().message);
    }
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

// ============================================================================
// TransactionGuard implementation
// ============================================================================

TransactionGuard::TransactionGuard(Database& db)
    : db_(db), begin_status_(db.begin_transaction()) {
    active_ = begin_status_.is_ok();
}

TransactionGuard::~TransactionGuard() {
    rollback();
}

VoidResult TransactionGuard::commit() {
    if (!active_) {
        return VoidResult::err(Error::invalid_state("No active transaction"));
    }
    auto result = db_.commit();
    if (result.is_ok()) {
        active_ = false;
    }
    return result;
}

void TransactionGuard::rollback() {
    if (!active_) return;
    active_ = false;
    auto result = db_.rollback();
    if (result.is_err()) {
        qCWarning(nomStoreLog) << "rollback failed:" << QString::fromStdString(result.unwrap_err().message);
    }
}

} // namespace nom::storage
