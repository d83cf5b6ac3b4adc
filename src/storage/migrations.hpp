#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include <functional>
#include <string>
#include <vector>

namespace sparkle::storage {

/**
 * MigrationContext - What a programmatic migration step may use.
 */
struct MigrationContext {
    Database& db;
    const Clock& clock;
    const std::string& default_theme;
};

/**
 * Migration - A database schema migration.
 *
 * Plain migrations are `up_sql`. Structural rewrites that need to look at
 * the data first provide `apply` instead; it runs inside the migration
 * transaction.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;  // Optional - for rollback
    std::function<Result<void, Error>(MigrationContext&)> apply;
};

/**
 * Rebuild the flat legacy schema into themes + inspirations with a foreign
 * key. Exposed for tests; normally reached through MigrationRunner.
 */
[[nodiscard]] Result<void, Error> normalize_themes(MigrationContext& ctx);

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "legacy_flat_schema",
        .up_sql = R"SQL(
            -- Notes carry their theme as a free-text label
            CREATE TABLE IF NOT EXISTS inspirations (
                id INTEGER PRIMARY KEY AUTOINCREMENT NOT NULL,
                content TEXT NOT NULL,
                theme_name TEXT NOT NULL,
                created_at INTEGER NOT NULL,
                word_count INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS index_inspirations_content ON inspirations(content);
            CREATE INDEX IF NOT EXISTS index_inspirations_theme_name ON inspirations(theme_name);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS inspirations;
        )SQL"
    },
    {
        .version = 2,
        .name = "normalize_themes",
        // Sentinel rows are discarded, so there is no way back.
        .apply = normalize_themes
    }
};

/**
 * MigrationRunner - Runs database migrations.
 *
 * A database written by the legacy app has an `inspirations` table but no
 * `schema_migrations` table; it is adopted as version 1.
 */
class MigrationRunner {
public:
    MigrationRunner(Database& db, const Clock& clock, std::string default_theme);

    /**
     * Run all pending migrations in a single transaction.
     * Fails with ErrorKind::MigrationFailure and leaves the schema untouched.
     */
    [[nodiscard]] Result<void, Error> migrate();

    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    /**
     * Get the current schema version (0 for an empty database).
     */
    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;
    const Clock& clock_;
    std::string default_theme_;

    [[nodiscard]] Result<bool, Error> table_exists(const std::string& name);
    [[nodiscard]] Result<int, Error> recorded_version();
    [[nodiscard]] Result<int, Error> detect_legacy_version();
    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> run_rollback(const Migration& m);
    [[nodiscard]] Result<void, Error> set_version(int version, const std::string& name);
};

} // namespace sparkle::storage
