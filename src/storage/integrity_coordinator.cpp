#include "storage/integrity_coordinator.hpp"
#include "storage/logging.hpp"

namespace sparkle::storage {

namespace {

Result<void, Error> check_cancel(const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        return Result<void, Error>::err(Error{ErrorKind::Cancelled, "Operation cancelled"});
    }
    return Result<void, Error>::ok();
}

Error protected_theme(const std::string& action) {
    return Error{ErrorKind::ProtectedTheme, "The default theme cannot be " + action};
}

} // namespace

IntegrityCoordinator::IntegrityCoordinator(Database& db,
                                           ThemeRepository& themes,
                                           InspirationRepository& inspirations,
                                           const Clock& clock,
                                           std::string default_theme)
    : db_(db)
    , themes_(themes)
    , inspirations_(inspirations)
    , clock_(clock)
    , default_theme_(std::move(default_theme)) {}

Result<void, Error> IntegrityCoordinator::require_theme(const std::string& name) {
    auto present = themes_.exists(name);
    if (present.is_err()) {
        return Result<void, Error>::err(present.unwrap_err());
    }
    if (!present.unwrap()) {
        return Result<void, Error>::err(Error{ErrorKind::NotFound, "Theme not found: " + name});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> IntegrityCoordinator::refresh_aggregates(const std::string& name) {
    auto counted = inspirations_.count_by_theme(name);
    if (counted.is_err()) {
        return Result<void, Error>::err(counted.unwrap_err());
    }
    auto used = themes_.set_last_used(name, clock_.now());
    if (used.is_err()) return used;
    return themes_.set_inspiration_count(name, counted.unwrap());
}

Result<void, Error> IntegrityCoordinator::create_theme(const Theme& theme) {
    return themes_.create(theme);
}

Result<void, Error> IntegrityCoordinator::rename_theme(const std::string& old_name,
                                                       const std::string& new_name,
                                                       const CancellationToken& cancel) {
    auto validation = validate_theme_name(new_name);
    if (validation != NameValidation::Valid) {
        return Result<void, Error>::err(
            Error{ErrorKind::InvalidName, "Invalid theme name: " + new_name, validation});
    }
    if (old_name == default_theme_) {
        return Result<void, Error>::err(protected_theme("renamed"));
    }

    auto result = db_.transaction([&]() -> Result<void, Error> {
        auto renamed = themes_.rename(old_name, new_name);
        if (renamed.is_err()) return renamed;

        auto checkpoint = check_cancel(cancel);
        if (checkpoint.is_err()) return checkpoint;

        auto moved = inspirations_.update_theme_name_for_all(old_name, new_name);
        if (moved.is_err()) {
            return Result<void, Error>::err(moved.unwrap_err());
        }

        return check_cancel(cancel);
    });

    if (result.is_ok()) {
        qCInfo(sparkleIntegrityLog) << "renamed theme" << old_name.c_str()
                                    << "to" << new_name.c_str();
    }
    return result;
}

Result<void, Error> IntegrityCoordinator::delete_theme(const std::string& name,
                                                       const std::optional<std::string>& move_to,
                                                       const CancellationToken& cancel) {
    const std::string target = move_to.value_or(default_theme_);
    if (name == default_theme_) {
        return Result<void, Error>::err(protected_theme("deleted"));
    }
    if (target == name) {
        return Result<void, Error>::err(
            Error{ErrorKind::InvalidName, "Cannot move inspirations into the theme being deleted"});
    }

    int moved_count = 0;
    auto result = db_.transaction([&]() -> Result<void, Error> {
        auto source = require_theme(name);
        if (source.is_err()) return source;
        auto destination = require_theme(target);
        if (destination.is_err()) return destination;

        auto affected = inspirations_.get_by_theme(name);
        if (affected.is_err()) {
            return Result<void, Error>::err(affected.unwrap_err());
        }
        moved_count = static_cast<int>(affected.unwrap().size());

        auto checkpoint = check_cancel(cancel);
        if (checkpoint.is_err()) return checkpoint;

        // Children are moved before the parent row goes, so the physical
        // cascade never fires on this path.
        auto moved = inspirations_.reassign_theme(name, target);
        if (moved.is_err()) {
            return Result<void, Error>::err(moved.unwrap_err());
        }

        checkpoint = check_cancel(cancel);
        if (checkpoint.is_err()) return checkpoint;

        auto refreshed = refresh_aggregates(target);
        if (refreshed.is_err()) return refreshed;

        auto removed = themes_.remove(name);
        if (removed.is_err()) return removed;

        return check_cancel(cancel);
    });

    if (result.is_ok()) {
        qCInfo(sparkleIntegrityLog) << "deleted theme" << name.c_str() << "moved"
                                    << moved_count << "inspirations to" << target.c_str();
    }
    return result;
}

void IntegrityCoordinator::record_usage(const std::string& theme_name) {
    auto guard = db_.lock();
    refresh_aggregates(theme_name).inspect_err([&](const Error& error) {
        qCWarning(sparkleIntegrityLog)
            << to_string(ErrorKind::AggregateRefreshFailure).data()
            << "theme" << theme_name.c_str() << ":" << error.message.c_str();
    });
}

Result<int64_t, Error> IntegrityCoordinator::save_inspiration(const Inspiration& inspiration,
                                                              const CancellationToken& cancel) {
    return db_.transaction([&]() -> Result<int64_t, Error> {
        auto id = inspirations_.insert(inspiration);
        if (id.is_err()) return id;

        auto checkpoint = check_cancel(cancel);
        if (checkpoint.is_err()) {
            return Result<int64_t, Error>::err(checkpoint.unwrap_err());
        }

        record_usage(inspiration.theme_name);
        return id;
    });
}

Result<void, Error> IntegrityCoordinator::update_inspiration(const Inspiration& inspiration,
                                                             const CancellationToken& cancel) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto existing = inspirations_.get_by_id(inspiration.id);
        if (existing.is_err()) {
            return Result<void, Error>::err(existing.unwrap_err());
        }
        if (!existing.unwrap().has_value()) {
            return Result<void, Error>::err(Error{
                ErrorKind::NotFound, "Inspiration not found: " + std::to_string(inspiration.id)});
        }
        const std::string previous_theme = existing.unwrap()->theme_name;

        auto updated = inspirations_.update(inspiration);
        if (updated.is_err()) return updated;

        auto checkpoint = check_cancel(cancel);
        if (checkpoint.is_err()) return checkpoint;

        if (previous_theme != inspiration.theme_name) {
            record_usage(previous_theme);
        }
        record_usage(inspiration.theme_name);
        return Result<void, Error>::ok();
    });
}

Result<void, Error> IntegrityCoordinator::delete_inspiration(int64_t id) {
    return db_.transaction([&]() -> Result<void, Error> {
        auto existing = inspirations_.get_by_id(id);
        if (existing.is_err()) {
            return Result<void, Error>::err(existing.unwrap_err());
        }
        if (!existing.unwrap().has_value()) {
            return Result<void, Error>::err(
                Error{ErrorKind::NotFound, "Inspiration not found: " + std::to_string(id)});
        }

        auto removed = inspirations_.remove(id);
        if (removed.is_err()) {
            return Result<void, Error>::err(removed.unwrap_err());
        }

        record_usage(existing.unwrap()->theme_name);
        return Result<void, Error>::ok();
    });
}

Result<int, Error> IntegrityCoordinator::discard_theme(const std::string& name,
                                                       const CancellationToken& cancel) {
    if (name == default_theme_) {
        return Result<int, Error>::err(protected_theme("deleted"));
    }

    auto result = db_.transaction([&]() -> Result<int, Error> {
        auto present = require_theme(name);
        if (present.is_err()) {
            return Result<int, Error>::err(present.unwrap_err());
        }

        auto removed = inspirations_.remove_by_theme(name);
        if (removed.is_err()) return removed;

        auto checkpoint = check_cancel(cancel);
        if (checkpoint.is_err()) {
            return Result<int, Error>::err(checkpoint.unwrap_err());
        }

        auto deleted = themes_.remove(name);
        if (deleted.is_err()) {
            return Result<int, Error>::err(deleted.unwrap_err());
        }
        return removed;
    });

    if (result.is_ok()) {
        qCInfo(sparkleIntegrityLog) << "discarded theme" << name.c_str() << "with"
                                    << result.unwrap() << "inspirations";
    }
    return result;
}

Result<int, Error> IntegrityCoordinator::repair_orphans(const std::optional<std::string>& target,
                                                        const CancellationToken& cancel) {
    const std::string destination = target.value_or(default_theme_);

    auto result = db_.transaction([&]() -> Result<int, Error> {
        auto present = require_theme(destination);
        if (present.is_err()) {
            return Result<int, Error>::err(present.unwrap_err());
        }

        auto checkpoint = check_cancel(cancel);
        if (checkpoint.is_err()) {
            return Result<int, Error>::err(checkpoint.unwrap_err());
        }

        auto reassigned = inspirations_.reassign_orphans(destination);
        if (reassigned.is_err()) return reassigned;
        const int moved = reassigned.unwrap();

        if (moved > 0) {
            auto refreshed = refresh_aggregates(destination);
            if (refreshed.is_err()) {
                return Result<int, Error>::err(refreshed.unwrap_err());
            }
        }

        auto finished = check_cancel(cancel);
        if (finished.is_err()) {
            return Result<int, Error>::err(finished.unwrap_err());
        }
        return Result<int, Error>::ok(moved);
    });

    if (result.is_ok() && result.unwrap() > 0) {
        qCInfo(sparkleIntegrityLog) << "repaired" << result.unwrap()
                                    << "orphaned inspirations into" << destination.c_str();
    }
    return result;
}

Result<int, Error> IntegrityCoordinator::refresh_all_counts() {
    return db_.transaction([&]() -> Result<int, Error> {
        return themes_.recount_all();
    });
}

} // namespace sparkle::storage
