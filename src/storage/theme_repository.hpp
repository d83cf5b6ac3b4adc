#pragma once

#include "storage/database.hpp"
#include "core/theme.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sparkle::storage {

/**
 * ThemeRepository - Data access layer for the theme catalog.
 *
 * Owns name validation and uniqueness. Operations that must keep
 * inspirations consistent (rename, delete) are only complete when composed
 * by the IntegrityCoordinator.
 */
class ThemeRepository {
public:
    ThemeRepository(Database& db, std::string default_theme)
        : db_(db), default_theme_(std::move(default_theme)) {}

    /**
     * Insert a new theme. InvalidName carries the precise NameValidation.
     */
    [[nodiscard]] Result<void, Error> create(const Theme& theme);

    /**
     * Insert the theme unless one with the same name exists.
     */
    [[nodiscard]] Result<void, Error> ensure(const Theme& theme);

    [[nodiscard]] Result<std::optional<Theme>, Error> get(const std::string& name);

    [[nodiscard]] Result<std::vector<Theme>, Error> list(ThemeOrder order = ThemeOrder::Name);

    /**
     * Change the primary key. Inspirations are not touched here.
     */
    [[nodiscard]] Result<void, Error> rename(const std::string& old_name,
                                             const std::string& new_name);

    /**
     * Delete the theme row. Refuses the default theme.
     */
    [[nodiscard]] Result<void, Error> remove(const std::string& name);

    [[nodiscard]] Result<void, Error> update_metadata(const std::string& name,
                                                      const std::string& icon,
                                                      uint32_t color,
                                                      const std::string& description);

    // Aggregate primitives
    [[nodiscard]] Result<void, Error> set_last_used(const std::string& name, Timestamp ts);
    [[nodiscard]] Result<void, Error> set_inspiration_count(const std::string& name, int count);

    /**
     * Recompute every cached inspiration count in one statement.
     */
    [[nodiscard]] Result<int, Error> recount_all();

    [[nodiscard]] Result<bool, Error> exists(const std::string& name);
    [[nodiscard]] Result<int64_t, Error> count();

    [[nodiscard]] const std::string& default_theme() const { return default_theme_; }

private:
    Database& db_;
    std::string default_theme_;

    [[nodiscard]] Theme row_to_theme(Statement& stmt);
    [[nodiscard]] Result<void, Error> check_name(const std::string& name);
    [[nodiscard]] Result<void, Error> update_one(const std::string& sql,
                                                 const std::string& name,
                                                 int64_t value);
};

} // namespace sparkle::storage
