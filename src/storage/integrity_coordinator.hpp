#pragma once

#include "storage/database.hpp"
#include "storage/inspiration_repository.hpp"
#include "storage/theme_repository.hpp"
#include "core/cancellation.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>

namespace sparkle::storage {

/**
 * IntegrityCoordinator - Multi-step operations spanning themes and notes.
 *
 * Each public operation is one transaction: it either completes or leaves
 * the store exactly as it was. Cached aggregates (inspiration count, last
 * used) are refreshed as part of the unit that changed them.
 */
class IntegrityCoordinator {
public:
    IntegrityCoordinator(Database& db,
                         ThemeRepository& themes,
                         InspirationRepository& inspirations,
                         const Clock& clock,
                         std::string default_theme);

    [[nodiscard]] Result<void, Error> create_theme(const Theme& theme);

    /**
     * Rename a theme and every note filed under it.
     * InvalidName, DuplicateKey, NotFound, ProtectedTheme, Cancelled.
     */
    [[nodiscard]] Result<void, Error> rename_theme(const std::string& old_name,
                                                   const std::string& new_name,
                                                   const CancellationToken& cancel = {});

    /**
     * Move the notes of `name` to `move_to` (the default theme if unset),
     * then delete `name`. `move_to` must already exist.
     */
    [[nodiscard]] Result<void, Error> delete_theme(const std::string& name,
                                                   const std::optional<std::string>& move_to = std::nullopt,
                                                   const CancellationToken& cancel = {});

    /**
     * Set last_used = now and recount the theme's notes. Failures are
     * logged as AggregateRefreshFailure and never reported to the caller.
     */
    void record_usage(const std::string& theme_name);

    [[nodiscard]] Result<int64_t, Error> save_inspiration(const Inspiration& inspiration,
                                                          const CancellationToken& cancel = {});
    [[nodiscard]] Result<void, Error> update_inspiration(const Inspiration& inspiration,
                                                         const CancellationToken& cancel = {});
    [[nodiscard]] Result<void, Error> delete_inspiration(int64_t id);

    /**
     * Delete a theme together with its notes. Returns the number of notes
     * removed.
     */
    [[nodiscard]] Result<int, Error> discard_theme(const std::string& name,
                                                   const CancellationToken& cancel = {});

    /**
     * Reassign notes whose theme is missing to `target` (the default theme
     * if unset). Returns the number of notes moved.
     */
    [[nodiscard]] Result<int, Error> repair_orphans(const std::optional<std::string>& target = std::nullopt,
                                                    const CancellationToken& cancel = {});

    /**
     * Recompute every cached count. Returns the number of themes corrected.
     */
    [[nodiscard]] Result<int, Error> refresh_all_counts();

    [[nodiscard]] const std::string& default_theme() const { return default_theme_; }

private:
    Database& db_;
    ThemeRepository& themes_;
    InspirationRepository& inspirations_;
    const Clock& clock_;
    std::string default_theme_;

    [[nodiscard]] Result<void, Error> require_theme(const std::string& name);
    [[nodiscard]] Result<void, Error> refresh_aggregates(const std::string& name);
};

} // namespace sparkle::storage
