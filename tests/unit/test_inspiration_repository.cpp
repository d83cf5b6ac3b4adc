#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/theme_repository.hpp"
#include "storage/inspiration_repository.hpp"
#include "../support/fixtures.hpp"

using namespace sparkle;
using namespace sparkle::storage;

namespace {

const std::string kDefault{DEFAULT_THEME_NAME};

std::vector<std::string> contents(const std::vector<Inspiration>& rows) {
    std::vector<std::string> out;
    for (const auto& r : rows) out.push_back(r.content);
    return out;
}

} // namespace

TEST_CASE("InspirationRepository", "[storage][inspirations]") {
    ManualClock clock;
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db, clock, kDefault);
    REQUIRE(runner.migrate().is_ok());

    ThemeRepository themes(db, kDefault);
    InspirationRepository repo(db);
    REQUIRE(themes.create(create_theme("设计", clock.now())).is_ok());
    REQUIRE(themes.create(create_theme("开发", clock.now())).is_ok());

    auto note = [&](const std::string& content, const std::string& theme, int64_t at) {
        return create_inspiration(content, theme, Timestamp(at));
    };

    SECTION("Insert assigns increasing ids and get_by_id returns the row") {
        auto first = repo.insert(note("first", "设计", 10)).unwrap();
        auto second = repo.insert(note("second", "设计", 20)).unwrap();
        REQUIRE(second > first);

        auto loaded = repo.get_by_id(first).unwrap();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->content == "first");
        REQUIRE(loaded->theme_name == "设计");
        REQUIRE(loaded->created_at == Timestamp(10));
        REQUIRE(loaded->word_count == 1);
    }

    SECTION("Word count is stored as supplied") {
        auto row = note("three little words", "设计", 10);
        row.word_count = 99;
        auto id = repo.insert(row).unwrap();
        REQUIRE(repo.get_by_id(id).unwrap()->word_count == 99);
    }

    SECTION("Invalid content is rejected before touching the store") {
        REQUIRE(repo.insert(note("   ", "设计", 1)).unwrap_err().is(ErrorKind::InvalidContent));
        REQUIRE(repo.insert(note(std::string(501, 'x'), "设计", 1))
                    .unwrap_err().is(ErrorKind::InvalidContent));
        REQUIRE(repo.count().unwrap() == 0);
    }

    SECTION("Unknown theme is NotFound") {
        auto result = repo.insert(note("x", "ghost", 1));
        REQUIRE(result.unwrap_err().is(ErrorKind::NotFound));
        REQUIRE(repo.count().unwrap() == 0);
    }

    SECTION("Listing is newest first, ties broken by id") {
        REQUIRE(repo.insert(note("old", "设计", 10)).is_ok());
        REQUIRE(repo.insert(note("tie-1", "开发", 20)).is_ok());
        REQUIRE(repo.insert(note("tie-2", "设计", 20)).is_ok());

        REQUIRE(contents(repo.get_all().unwrap()) ==
                std::vector<std::string>{"tie-2", "tie-1", "old"});
        REQUIRE(contents(repo.get_by_theme("设计").unwrap()) ==
                std::vector<std::string>{"tie-2", "old"});
        REQUIRE(repo.count_by_theme("开发").unwrap() == 1);
        REQUIRE(repo.count_by_theme("nothing").unwrap() == 0);
    }

    SECTION("Search matches content and theme name, case-insensitively") {
        REQUIRE(repo.insert(note("Buy MILK", "开发", 1)).is_ok());
        REQUIRE(repo.insert(note("draw logo", "设计", 2)).is_ok());

        REQUIRE(contents(repo.search("milk").unwrap()) == std::vector<std::string>{"Buy MILK"});
        REQUIRE(contents(repo.search("设").unwrap()) == std::vector<std::string>{"draw logo"});
        REQUIRE(repo.search("nothing").unwrap().empty());
    }

    SECTION("Search treats wildcards literally") {
        REQUIRE(repo.insert(note("100% done", "设计", 1)).is_ok());
        REQUIRE(repo.insert(note("1000 done", "设计", 2)).is_ok());
        REQUIRE(repo.insert(note("snake_case", "设计", 3)).is_ok());
        REQUIRE(repo.insert(note("snakeXcase", "设计", 4)).is_ok());

        REQUIRE(contents(repo.search("0%").unwrap()) == std::vector<std::string>{"100% done"});
        REQUIRE(contents(repo.search("e_c").unwrap()) == std::vector<std::string>{"snake_case"});
    }

    SECTION("Update replaces the row") {
        auto id = repo.insert(note("draft", "设计", 1)).unwrap();
        auto edited = with_theme(with_content(*repo.get_by_id(id).unwrap(), "final text"), "开发");
        REQUIRE(repo.update(edited).is_ok());

        auto loaded = repo.get_by_id(id).unwrap();
        REQUIRE(loaded->content == "final text");
        REQUIRE(loaded->theme_name == "开发");
        REQUIRE(loaded->word_count == 2);
    }

    SECTION("Update of a missing row is NotFound") {
        auto ghost = note("x", "设计", 1);
        ghost.id = 999;
        REQUIRE(repo.update(ghost).unwrap_err().is(ErrorKind::NotFound));
    }

    SECTION("Remove returns the number of rows deleted") {
        auto id = repo.insert(note("x", "设计", 1)).unwrap();
        REQUIRE(repo.insert(note("y", "设计", 2)).is_ok());
        REQUIRE(repo.insert(note("z", "开发", 3)).is_ok());

        REQUIRE(repo.remove(id).unwrap() == 1);
        REQUIRE(repo.remove(id).unwrap() == 0);
        REQUIRE(repo.remove_by_theme("设计").unwrap() == 1);
        REQUIRE(repo.count().unwrap() == 1);
    }

    SECTION("Bulk relabel moves exactly the theme's rows") {
        REQUIRE(repo.insert(note("x", "设计", 1)).is_ok());
        REQUIRE(repo.insert(note("y", "设计", 2)).is_ok());
        REQUIRE(repo.insert(note("z", "开发", 3)).is_ok());

        REQUIRE(repo.reassign_theme("设计", "开发").unwrap() == 2);
        REQUIRE(repo.count_by_theme("设计").unwrap() == 0);
        REQUIRE(repo.count_by_theme("开发").unwrap() == 3);

        REQUIRE(repo.reassign_theme("开发", "ghost").unwrap_err().is(ErrorKind::NotFound));
        REQUIRE(repo.count_by_theme("开发").unwrap() == 3);
    }

    SECTION("Distinct theme names and orphans") {
        REQUIRE(repo.insert(note("x", "设计", 1)).is_ok());
        sparkle::test::plant_orphan(db, "lost", "ghost");

        REQUIRE(repo.distinct_theme_names().unwrap() == std::vector<std::string>{"ghost", "设计"});

        auto orphans = repo.find_orphans().unwrap();
        REQUIRE(orphans.size() == 1);
        REQUIRE(orphans[0].theme_name == "ghost");
    }
}
