#pragma once

#include "storage/change_notifier.hpp"
#include "storage/data_validator.hpp"
#include "storage/database.hpp"
#include "storage/inspiration_repository.hpp"
#include "storage/integrity_coordinator.hpp"
#include "storage/live_query.hpp"
#include "storage/store_config.hpp"
#include "storage/theme_repository.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sparkle::storage {

/**
 * Store - An open, migrated database and the components working on it.
 *
 * Created explicitly with open(); callers pass the handle around by
 * reference. The default theme exists once open() returns.
 */
class Store {
public:
    [[nodiscard]] static Result<std::unique_ptr<Store>, Error> open(
        const StoreConfig& config,
        std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

    [[nodiscard]] static Result<std::unique_ptr<Store>, Error> open_memory(
        std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    [[nodiscard]] Database& database() { return db_; }
    [[nodiscard]] ThemeRepository& themes() { return themes_; }
    [[nodiscard]] InspirationRepository& inspirations() { return inspirations_; }
    [[nodiscard]] IntegrityCoordinator& coordinator() { return coordinator_; }
    [[nodiscard]] DataValidator& validator() { return validator_; }
    [[nodiscard]] ChangeNotifier& notifier() { return notifier_; }
    [[nodiscard]] const Clock& clock() const { return *clock_; }
    [[nodiscard]] const StoreConfig& config() const { return config_; }

    // Live views. The returned query is not started.
    [[nodiscard]] std::unique_ptr<LiveQuery<std::vector<Theme>>> observe_themes(
        ThemeOrder order,
        LiveQuery<std::vector<Theme>>::Consumer consumer,
        LiveQuery<std::vector<Theme>>::ErrorConsumer on_error = {});

    [[nodiscard]] std::unique_ptr<LiveQuery<std::vector<Inspiration>>> observe_inspirations(
        LiveQuery<std::vector<Inspiration>>::Consumer consumer,
        LiveQuery<std::vector<Inspiration>>::ErrorConsumer on_error = {});

    [[nodiscard]] std::unique_ptr<LiveQuery<std::vector<Inspiration>>> observe_theme(
        const std::string& theme_name,
        LiveQuery<std::vector<Inspiration>>::Consumer consumer,
        LiveQuery<std::vector<Inspiration>>::ErrorConsumer on_error = {});

    [[nodiscard]] std::unique_ptr<LiveQuery<std::vector<Inspiration>>> observe_search(
        const std::string& keyword,
        LiveQuery<std::vector<Inspiration>>::Consumer consumer,
        LiveQuery<std::vector<Inspiration>>::ErrorConsumer on_error = {});

private:
    Store(Database db, StoreConfig config, std::shared_ptr<const Clock> clock);

    StoreConfig config_;
    std::shared_ptr<const Clock> clock_;
    Database db_;
    ThemeRepository themes_;
    InspirationRepository inspirations_;
    IntegrityCoordinator coordinator_;
    DataValidator validator_;
    ChangeNotifier notifier_;
};

} // namespace sparkle::storage
