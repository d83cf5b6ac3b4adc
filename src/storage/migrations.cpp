#include "storage/migrations.hpp"
#include "storage/logging.hpp"
#include "core/theme.hpp"
#include <map>

namespace sparkle::storage {

namespace {

Error migration_error(const Migration& m, const Error& cause) {
    return Error{
        ErrorKind::MigrationFailure,
        "Migration " + std::to_string(m.version) + " (" + m.name + ") failed: " + cause.message
    };
}

} // namespace

// ============================================================================
// v2: normalize_themes
// ============================================================================

Result<void, Error> normalize_themes(MigrationContext& ctx) {
    auto& db = ctx.db;
    const auto now = ctx.clock.now();
    const std::string marker{THEME_MARKER};

    auto created = db.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS themes (
            name TEXT PRIMARY KEY NOT NULL,
            icon TEXT NOT NULL DEFAULT '💡',
            color INTEGER NOT NULL DEFAULT 4283076834,
            description TEXT NOT NULL DEFAULT '',
            createdAt INTEGER NOT NULL,
            lastUsed INTEGER NOT NULL,
            inspirationCount INTEGER NOT NULL DEFAULT 0
        );
    )SQL");
    if (created.is_err()) return created;

    // Distinct labels of the surviving rows. Labels that cannot be theme
    // names are folded into the default theme.
    std::map<std::string, int> counts;
    int relabelled = 0;
    {
        auto stmt_result = db.prepare(R"SQL(
            SELECT theme_name, COUNT(*) FROM inspirations
            WHERE content != ?
            GROUP BY theme_name;
        )SQL");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        stmt.bind_text(1, marker);

        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;

            auto label = stmt.column_text(0);
            int rows = stmt.column_int(1);
            if (validate_theme_name(label) == NameValidation::Valid) {
                counts[label] += rows;
            } else {
                counts[ctx.default_theme] += rows;
                relabelled += rows;
            }
        }
    }

    {
        auto stmt_result = db.prepare(R"SQL(
            INSERT INTO themes (name, icon, color, description, createdAt, lastUsed, inspirationCount)
            VALUES (?, ?, ?, '', ?, ?, ?)
            ON CONFLICT(name) DO UPDATE SET inspirationCount = excluded.inspirationCount;
        )SQL");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();

        for (const auto& [name, count] : counts) {
            stmt.bind_text(1, name);
            stmt.bind_text(2, DEFAULT_THEME_ICON);
            stmt.bind_int64(3, static_cast<int64_t>(DEFAULT_THEME_COLOR));
            stmt.bind_int64(4, now.millis());
            stmt.bind_int64(5, now.millis());
            stmt.bind_int(6, count);

            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            auto reset_result = stmt.reset();
            if (reset_result.is_err()) return reset_result;
        }
    }

    auto rebuilt = db.execute(R"SQL(
        CREATE TABLE inspirations_new (
            id INTEGER PRIMARY KEY AUTOINCREMENT NOT NULL,
            content TEXT NOT NULL,
            theme_name TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            word_count INTEGER NOT NULL,
            FOREIGN KEY (theme_name) REFERENCES themes(name)
                ON DELETE CASCADE ON UPDATE CASCADE
        );
    )SQL");
    if (rebuilt.is_err()) return rebuilt;

    {
        auto stmt_result = db.prepare(R"SQL(
            INSERT INTO inspirations_new (id, content, theme_name, created_at, word_count)
            SELECT id, content,
                   CASE WHEN theme_name IN (SELECT name FROM themes) THEN theme_name ELSE ? END,
                   created_at, word_count
            FROM inspirations
            WHERE content != ?;
        )SQL");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        stmt.bind_text(1, ctx.default_theme);
        stmt.bind_text(2, marker);
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<void, Error>::err(step_result.unwrap_err());
        }
    }
    int copied = db.changes();

    auto swapped = db.execute(R"SQL(
        DROP TABLE inspirations;
        ALTER TABLE inspirations_new RENAME TO inspirations;
        CREATE INDEX IF NOT EXISTS index_inspirations_content ON inspirations(content);
        CREATE INDEX IF NOT EXISTS index_inspirations_theme_name ON inspirations(theme_name);
    )SQL");
    if (swapped.is_err()) return swapped;

    qCInfo(sparkleMigrationLog) << "normalize_themes: themes=" << counts.size()
                                << "inspirations=" << copied
                                << "relabelled=" << relabelled;
    return Result<void, Error>::ok();
}

// ============================================================================
// MigrationRunner
// ============================================================================

MigrationRunner::MigrationRunner(Database& db, const Clock& clock, std::string default_theme)
    : db_(db), clock_(clock), default_theme_(std::move(default_theme)) {}

Result<bool, Error> MigrationRunner::table_exists(const std::string& name) {
    auto stmt_result = db_.prepare(
        "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = ?;");
    if (stmt_result.is_err()) {
        return Result<bool, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, name);
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<bool, Error>::err(step_result.unwrap_err());
    }
    return Result<bool, Error>::ok(stmt.column_int(0) > 0);
}

Result<void, Error> MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<int, Error> MigrationRunner::recorded_version() {
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

Result<int, Error> MigrationRunner::detect_legacy_version() {
    auto stmt_result = db_.prepare("PRAGMA user_version;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    int user_version = stmt.column_int(0);

    auto has_inspirations = table_exists("inspirations");
    if (has_inspirations.is_err()) {
        return Result<int, Error>::err(has_inspirations.unwrap_err());
    }
    if (!has_inspirations.unwrap()) {
        return Result<int, Error>::ok(0);
    }

    auto has_themes = table_exists("themes");
    if (has_themes.is_err()) {
        return Result<int, Error>::err(has_themes.unwrap_err());
    }
    if (has_themes.unwrap() && user_version >= 2) {
        return Result<int, Error>::ok(2);
    }
    return Result<int, Error>::ok(1);
}

Result<int, Error> MigrationRunner::current_version() {
    auto guard = db_.lock();

    auto has_table = table_exists("schema_migrations");
    if (has_table.is_err()) {
        return Result<int, Error>::err(has_table.unwrap_err());
    }

    if (has_table.unwrap()) {
        auto recorded = recorded_version();
        if (recorded.is_err() || recorded.unwrap() > 0) {
            return recorded;
        }
    }
    return detect_legacy_version();
}

Result<void, Error> MigrationRunner::set_version(int version, const std::string& name) {
    auto stmt_result = db_.prepare(
        "INSERT OR REPLACE INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int(1, version);
    stmt.bind_text(2, name);
    stmt.bind_int64(3, clock_.now().millis());

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> MigrationRunner::run_migration(const Migration& m) {
    if (m.apply) {
        MigrationContext ctx{db_, clock_, default_theme_};
        auto result = m.apply(ctx);
        if (result.is_err()) {
            return Result<void, Error>::err(migration_error(m, result.unwrap_err()));
        }
    } else {
        auto exec_result = db_.execute(m.up_sql);
        if (exec_result.is_err()) {
            return Result<void, Error>::err(migration_error(m, exec_result.unwrap_err()));
        }
    }

    qCInfo(sparkleMigrationLog) << "applied migration" << m.version << m.name.c_str();
    return set_version(m.version, m.name);
}

Result<void, Error> MigrationRunner::run_rollback(const Migration& m) {
    if (m.down_sql.empty()) {
        return Result<void, Error>::err(Error{
            ErrorKind::MigrationFailure,
            "Migration " + std::to_string(m.version) + " has no rollback SQL"
        });
    }

    auto exec_result = db_.execute(m.down_sql);
    if (exec_result.is_err()) {
        return Result<void, Error>::err(Error{
            ErrorKind::MigrationFailure,
            "Rollback of migration " + std::to_string(m.version) + " failed: " +
            exec_result.unwrap_err().message
        });
    }

    return db_.execute(
        "DELETE FROM schema_migrations WHERE version = " + std::to_string(m.version) + ";");
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    auto guard = db_.lock();

    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void, Error>::err(Error{
            ErrorKind::MigrationFailure,
            "Cannot read schema version: " + current_result.unwrap_err().message
        });
    }

    int current = current_result.unwrap();
    if (current >= target_version) {
        return Result<void, Error>::ok();
    }

    auto result = db_.transaction([&]() -> Result<void, Error> {
        auto ensure_result = ensure_migrations_table();
        if (ensure_result.is_err()) return ensure_result;

        // Record the versions a legacy database already has.
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version <= current) {
                auto adopted = set_version(m.version, m.name);
                if (adopted.is_err()) return adopted;
            }
        }

        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version > current && m.version <= target_version) {
                auto step = run_migration(m);
                if (step.is_err()) return step;
            }
        }
        return Result<void, Error>::ok();
    });

    if (result.is_err()) {
        auto error = result.unwrap_err();
        error.kind = ErrorKind::MigrationFailure;
        qCCritical(sparkleMigrationLog) << "migration aborted:" << error.message.c_str();
        return Result<void, Error>::err(std::move(error));
    }
    return result;
}

Result<void, Error> MigrationRunner::rollback_to(int target_version) {
    auto guard = db_.lock();

    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void, Error>::err(current_result.unwrap_err());
    }

    int current = current_result.unwrap();
    if (current <= target_version) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (auto it = ALL_MIGRATIONS.rbegin(); it != ALL_MIGRATIONS.rend(); ++it) {
            if (it->version <= current && it->version > target_version) {
                auto result = run_rollback(*it);
                if (result.is_err()) {
                    return result;
                }
            }
        }
        return Result<void, Error>::ok();
    });
}

} // namespace sparkle::storage
