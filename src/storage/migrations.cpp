#include "storage/migrations.hpp"

#include "core/types.hpp"
#include "storage/store_log.hpp"

#include <QString>

namespace nom::storage {

VoidResult MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<int, Error> MigrationRunner::current_version() {
    auto ensure_result = ensure_migrations_table();
    if (ensure_result.is_err()) {
        return Result<int, Error>::err(ensure_result.unwrap_err());
    }

    auto stmt_result = db_.prepare(
        "SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }

    return Result<int, Error>::ok(stmt.column_int(0));
}

VoidResult MigrationRunner::run_migration(const Migration& m) {
    auto exec_result = db_.execute(m.up_sql);
    if (exec_result.is_err()) {
        const auto& cause = exec_result.unwrap_err();
        return VoidResult::err(Error::persistence(
            "Migration " + std::to_string(m.version) + " (" + m.name + ") failed: " +
            cause.message, cause.code));
    }

    auto stmt_result = db_.prepare(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);");
    if (stmt_result.is_err()) {
        return VoidResult::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = all_ok({
        stmt.bind_int(1, m.version),
        stmt.bind_text(2, m.name),
        stmt.bind_int64(3, Timestamp::now().millis())
    });
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return VoidResult::err(step_result.unwrap_err());
    }

    qCInfo(nomStoreLog) << "applied migration" << m.version << QString::fromStdString(m.name);
    return VoidResult::ok();
}

VoidResult MigrationRunner::migrate() {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return VoidResult::err(current_result.unwrap_err());
    }

    int current = current_result.unwrap();
    if (current >= latest_version()) {
        return VoidResult::ok();
    }

    return db_.transaction([&]() -> VoidResult {
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version > current) {
                auto result = run_migration(m);
                if (result.is_err()) {
                    return result;
                }
            }
        }
        return VoidResult::ok();
    });
}

} // namespace nom::storage
