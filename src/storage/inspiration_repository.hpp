#pragma once

#include "storage/database.hpp"
#include "core/inspiration.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sparkle::storage {

/**
 * InspirationRepository - Data access layer for notes.
 *
 * Every row references exactly one theme; the foreign key rejects writes
 * that name a missing theme. Cached theme aggregates are not maintained
 * here, see IntegrityCoordinator.
 */
class InspirationRepository {
public:
    explicit InspirationRepository(Database& db) : db_(db) {}

    /**
     * Insert a note and return its store-assigned id.
     * InvalidContent for blank or over-long content, NotFound if the theme
     * does not exist.
     */
    [[nodiscard]] Result<int64_t, Error> insert(const Inspiration& inspiration);

    [[nodiscard]] Result<std::optional<Inspiration>, Error> get_by_id(int64_t id);

    /**
     * All notes, newest first.
     */
    [[nodiscard]] Result<std::vector<Inspiration>, Error> get_all();

    [[nodiscard]] Result<std::vector<Inspiration>, Error> get_by_theme(const std::string& theme_name);

    /**
     * Case-insensitive substring match over content and theme name.
     * Wildcards in the keyword are matched literally.
     */
    [[nodiscard]] Result<std::vector<Inspiration>, Error> search(const std::string& keyword);

    [[nodiscard]] Result<int64_t, Error> count();
    [[nodiscard]] Result<int, Error> count_by_theme(const std::string& theme_name);

    /**
     * Replace every field of the row with the same id.
     */
    [[nodiscard]] Result<void, Error> update(const Inspiration& inspiration);

    [[nodiscard]] Result<int, Error> remove(int64_t id);
    [[nodiscard]] Result<int, Error> remove_by_theme(const std::string& theme_name);

    // Bulk relabelling, used by the rename cascade and by reassignment.
    [[nodiscard]] Result<int, Error> update_theme_name_for_all(const std::string& old_name,
                                                               const std::string& new_name);
    [[nodiscard]] Result<int, Error> reassign_theme(const std::string& from,
                                                    const std::string& to);

    [[nodiscard]] Result<std::vector<std::string>, Error> distinct_theme_names();

    /**
     * Notes whose theme does not exist in the catalog.
     */
    [[nodiscard]] Result<std::vector<Inspiration>, Error> find_orphans();

    /**
     * Move every orphan to `to` in one statement. Only theme_name changes,
     * so rows with content that would no longer validate are moved as-is.
     */
    [[nodiscard]] Result<int, Error> reassign_orphans(const std::string& to);

private:
    Database& db_;

    [[nodiscard]] Inspiration row_to_inspiration(Statement& stmt);
    [[nodiscard]] Result<std::vector<Inspiration>, Error> select_many(
        const std::string& where_and_order,
        const std::vector<std::string>& params);
    [[nodiscard]] Result<int, Error> relabel(const std::string& from, const std::string& to);
};

} // namespace sparkle::storage
