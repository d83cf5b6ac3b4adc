#include "storage/store.hpp"
#include "storage/logging.hpp"
#include "storage/migrations.hpp"

namespace sparkle::storage {

Store::Store(Database db, StoreConfig config, std::shared_ptr<const Clock> clock)
    : config_(std::move(config))
    , clock_(std::move(clock))
    , db_(std::move(db))
    , themes_(db_, config_.default_theme_name)
    , inspirations_(db_)
    , coordinator_(db_, themes_, inspirations_, *clock_, config_.default_theme_name)
    , validator_(db_) {
    notifier_.attach(db_);
}

Store::~Store() {
    db_.set_change_hook({});
}

Result<std::unique_ptr<Store>, Error> Store::open(const StoreConfig& config,
                                                 std::shared_ptr<const Clock> clock) {
    using StoreResult = Result<std::unique_ptr<Store>, Error>;

    auto default_check = validate_theme_name(config.default_theme_name);
    if (default_check != NameValidation::Valid) {
        return StoreResult::err(Error{ErrorKind::InvalidName,
                                      "Invalid default theme name: " + config.default_theme_name,
                                      default_check});
    }

    auto db_result = config.is_memory()
        ? Database::open_memory()
        : Database::open(config.path, Database::OpenOptions{
              .busy_timeout_ms = config.busy_timeout_ms,
              .wal = config.wal
          });
    if (db_result.is_err()) {
        qCCritical(sparkleStorageLog) << "cannot open database" << config.path.c_str()
                                      << ":" << db_result.unwrap_err().message.c_str();
        return StoreResult::err(db_result.unwrap_err());
    }
    auto db = std::move(db_result).unwrap();

    // Nothing else may touch the database before the schema is current.
    MigrationRunner runner(db, *clock, config.default_theme_name);
    auto migrated = runner.migrate();
    if (migrated.is_err()) {
        return StoreResult::err(migrated.unwrap_err());
    }

    std::unique_ptr<Store> store(new Store(std::move(db), config, std::move(clock)));

    auto now = store->clock().now();
    auto ensured = store->themes().ensure(
        with_description(create_theme(store->config().default_theme_name, now),
                         "Inspirations without a theme"));
    if (ensured.is_err()) {
        return StoreResult::err(ensured.unwrap_err());
    }

    qCInfo(sparkleStorageLog) << "opened store" << config.path.c_str()
                              << "schema version" << MigrationRunner::latest_version();
    return StoreResult::ok(std::move(store));
}

Result<std::unique_ptr<Store>, Error> Store::open_memory(std::shared_ptr<const Clock> clock) {
    return open(StoreConfig{}, std::move(clock));
}

std::unique_ptr<LiveQuery<std::vector<Theme>>> Store::observe_themes(
    ThemeOrder order,
    LiveQuery<std::vector<Theme>>::Consumer consumer,
    LiveQuery<std::vector<Theme>>::ErrorConsumer on_error) {
    return std::make_unique<LiveQuery<std::vector<Theme>>>(
        notifier_, Table::Themes,
        [this, order]() { return themes_.list(order); },
        std::move(consumer), std::move(on_error));
}

std::unique_ptr<LiveQuery<std::vector<Inspiration>>> Store::observe_inspirations(
    LiveQuery<std::vector<Inspiration>>::Consumer consumer,
    LiveQuery<std::vector<Inspiration>>::ErrorConsumer on_error) {
    return std::make_unique<LiveQuery<std::vector<Inspiration>>>(
        notifier_, Table::Inspirations,
        [this]() { return inspirations_.get_all(); },
        std::move(consumer), std::move(on_error));
}

std::unique_ptr<LiveQuery<std::vector<Inspiration>>> Store::observe_theme(
    const std::string& theme_name,
    LiveQuery<std::vector<Inspiration>>::Consumer consumer,
    LiveQuery<std::vector<Inspiration>>::ErrorConsumer on_error) {
    return std::make_unique<LiveQuery<std::vector<Inspiration>>>(
        notifier_, Table::Inspirations,
        [this, theme_name]() { return inspirations_.get_by_theme(theme_name); },
        std::move(consumer), std::move(on_error));
}

std::unique_ptr<LiveQuery<std::vector<Inspiration>>> Store::observe_search(
    const std::string& keyword,
    LiveQuery<std::vector<Inspiration>>::Consumer consumer,
    LiveQuery<std::vector<Inspiration>>::ErrorConsumer on_error) {
    // Search also matches theme names, which change on rename.
    return std::make_unique<LiveQuery<std::vector<Inspiration>>>(
        notifier_, Table::Inspirations | Table::Themes,
        [this, keyword]() { return inspirations_.search(keyword); },
        std::move(consumer), std::move(on_error));
}

} // namespace sparkle::storage
