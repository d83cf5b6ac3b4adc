#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/theme_repository.hpp"
#include "storage/inspiration_repository.hpp"
#include "core/theme.hpp"

using namespace sparkle;
using namespace sparkle::storage;

namespace {

const std::string kDefault{DEFAULT_THEME_NAME};

Database migrated_db(const Clock& clock) {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db, clock, kDefault);
    REQUIRE(runner.migrate().is_ok());
    return db;
}

} // namespace

TEST_CASE("ThemeRepository CRUD", "[storage][themes]") {
    ManualClock clock;
    auto db = migrated_db(clock);
    ThemeRepository repo(db, kDefault);

    SECTION("Create then get returns the same fields with zero count") {
        auto theme = with_description(with_icon(create_theme("设计", clock.now()), "🎨"), "visual");
        REQUIRE(repo.create(theme).is_ok());

        auto loaded = repo.get("设计").unwrap();
        REQUIRE(loaded.has_value());
        REQUIRE(*loaded == theme);
        REQUIRE(loaded->inspiration_count == 0);
    }

    SECTION("Get missing returns nullopt") {
        REQUIRE_FALSE(repo.get("nothing").unwrap().has_value());
    }

    SECTION("Duplicate names are rejected") {
        REQUIRE(repo.create(create_theme("设计", clock.now())).is_ok());
        auto again = repo.create(create_theme("设计", clock.now()));
        REQUIRE(again.is_err());
        REQUIRE(again.unwrap_err().is(ErrorKind::DuplicateKey));
        REQUIRE(repo.count().unwrap() == 1);
    }

    SECTION("Invalid names report the precise reason") {
        auto blank = repo.create(create_theme("  ", clock.now()));
        REQUIRE(blank.unwrap_err().is(ErrorKind::InvalidName));
        REQUIRE(blank.unwrap_err().validation == NameValidation::Empty);

        auto marker = repo.create(create_theme("__THEME_MARKER__", clock.now()));
        REQUIRE(marker.unwrap_err().validation == NameValidation::Invalid);

        auto longer = repo.create(create_theme(std::string(51, 'x'), clock.now()));
        REQUIRE(longer.unwrap_err().validation == NameValidation::TooLong);

        REQUIRE(repo.count().unwrap() == 0);
    }

    SECTION("Ensure inserts only once") {
        REQUIRE(repo.ensure(create_theme(kDefault, clock.now())).is_ok());
        REQUIRE(repo.ensure(with_icon(create_theme(kDefault, clock.now()), "x")).is_ok());
        REQUIRE(repo.count().unwrap() == 1);
        REQUIRE(repo.get(kDefault).unwrap()->icon == std::string(DEFAULT_THEME_ICON));
    }

    SECTION("Exists") {
        REQUIRE(repo.create(create_theme("a", clock.now())).is_ok());
        REQUIRE(repo.exists("a").unwrap());
        REQUIRE_FALSE(repo.exists("b").unwrap());
    }

    SECTION("Metadata edits keep key and aggregates") {
        REQUIRE(repo.create(create_theme("a", clock.now())).is_ok());
        REQUIRE(repo.set_inspiration_count("a", 3).is_ok());
        REQUIRE(repo.update_metadata("a", "📚", 0xFF000000, "books").is_ok());

        auto loaded = repo.get("a").unwrap();
        REQUIRE(loaded->icon == "📚");
        REQUIRE(loaded->color == 0xFF000000);
        REQUIRE(loaded->description == "books");
        REQUIRE(loaded->inspiration_count == 3);

        REQUIRE(repo.update_metadata("zzz", "", 0, "").unwrap_err().is(ErrorKind::NotFound));
    }
}

TEST_CASE("ThemeRepository ordering", "[storage][themes]") {
    ManualClock clock;
    auto db = migrated_db(clock);
    ThemeRepository repo(db, kDefault);

    auto add = [&](const std::string& name, int64_t last_used, int count) {
        auto theme = create_theme(name, Timestamp(last_used));
        theme.inspiration_count = count;
        REQUIRE(repo.create(theme).is_ok());
    };
    add("b", 300, 1);
    add("a", 100, 5);
    add("c", 300, 5);

    auto names = [&](ThemeOrder order) {
        std::vector<std::string> out;
        for (const auto& t : repo.list(order).unwrap()) out.push_back(t.name);
        return out;
    };

    REQUIRE(names(ThemeOrder::Name) == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(names(ThemeOrder::LastUsed) == std::vector<std::string>{"b", "c", "a"});
    REQUIRE(names(ThemeOrder::InspirationCount) == std::vector<std::string>{"a", "c", "b"});
}

TEST_CASE("ThemeRepository rename and remove primitives", "[storage][themes]") {
    ManualClock clock;
    auto db = migrated_db(clock);
    ThemeRepository repo(db, kDefault);
    REQUIRE(repo.create(create_theme("a", clock.now())).is_ok());
    REQUIRE(repo.create(create_theme("b", clock.now())).is_ok());

    SECTION("Rename changes the key") {
        REQUIRE(repo.rename("a", "c").is_ok());
        REQUIRE_FALSE(repo.exists("a").unwrap());
        REQUIRE(repo.exists("c").unwrap());
    }

    SECTION("Rename onto an existing name fails") {
        auto result = repo.rename("a", "b");
        REQUIRE(result.unwrap_err().is(ErrorKind::DuplicateKey));
        REQUIRE(repo.exists("a").unwrap());
    }

    SECTION("Rename of a missing theme fails") {
        REQUIRE(repo.rename("zzz", "c").unwrap_err().is(ErrorKind::NotFound));
    }

    SECTION("Remove refuses the default theme") {
        REQUIRE(repo.ensure(create_theme(kDefault, clock.now())).is_ok());
        REQUIRE(repo.remove(kDefault).unwrap_err().is(ErrorKind::ProtectedTheme));
        REQUIRE(repo.exists(kDefault).unwrap());
    }

    SECTION("Remove of a missing theme fails") {
        REQUIRE(repo.remove("zzz").unwrap_err().is(ErrorKind::NotFound));
    }

    SECTION("Aggregate primitives") {
        REQUIRE(repo.set_last_used("a", Timestamp(42)).is_ok());
        REQUIRE(repo.set_inspiration_count("a", 7).is_ok());
        auto loaded = repo.get("a").unwrap();
        REQUIRE(loaded->last_used == Timestamp(42));
        REQUIRE(loaded->inspiration_count == 7);

        REQUIRE(repo.set_last_used("zzz", Timestamp(1)).unwrap_err().is(ErrorKind::NotFound));
        REQUIRE(repo.set_inspiration_count("a", -1).is_err());
    }

    SECTION("Recount corrects only stale counts") {
        InspirationRepository notes(db);
        REQUIRE(notes.insert(create_inspiration("x", "a", clock.now())).is_ok());
        REQUIRE(repo.set_inspiration_count("b", 4).is_ok());

        REQUIRE(repo.recount_all().unwrap() == 2);
        REQUIRE(repo.get("a").unwrap()->inspiration_count == 1);
        REQUIRE(repo.get("b").unwrap()->inspiration_count == 0);
        REQUIRE(repo.recount_all().unwrap() == 0);
    }
}
