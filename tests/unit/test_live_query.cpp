#include <catch2/catch_test_macros.hpp>
#include "storage/store.hpp"
#include "../support/fixtures.hpp"

using namespace sparkle;
using namespace sparkle::storage;
using sparkle::test::TestStore;

TEST_CASE("ChangeNotifier emits once per commit", "[live]") {
    TestStore s;
    int themes = 0;
    int inspirations = 0;
    int commits = 0;
    QObject::connect(&s->notifier(), &ChangeNotifier::themesChanged, [&] { ++themes; });
    QObject::connect(&s->notifier(), &ChangeNotifier::inspirationsChanged, [&] { ++inspirations; });
    QObject::connect(&s->notifier(), &ChangeNotifier::tablesChanged, [&](unsigned) { ++commits; });

    s.add_theme("设计");
    REQUIRE(themes == 1);
    REQUIRE(inspirations == 0);

    s.add_note("a", "设计");
    REQUIRE(commits == 2);
    REQUIRE(inspirations == 1);
    REQUIRE(themes == 2);
}

TEST_CASE("LiveQuery delivers snapshots after commits", "[live]") {
    TestStore s;
    s.add_theme("设计");

    std::vector<std::vector<Inspiration>> snapshots;
    auto query = s->observe_theme("设计", [&](const std::vector<Inspiration>& rows) {
        snapshots.push_back(rows);
    });

    SECTION("Initial snapshot on start") {
        query->start();
        REQUIRE(query->is_active());
        REQUIRE(snapshots.size() == 1);
        REQUIRE(snapshots[0].empty());
    }

    SECTION("Fresh snapshot after each committed write") {
        query->start();
        s.add_note("a", "设计");
        s.add_note("b", "设计");
        REQUIRE(snapshots.size() == 3);
        REQUIRE(snapshots.back().size() == 2);
    }

    SECTION("Nothing is delivered for a rolled-back unit") {
        query->start();
        auto token = CancellationToken::create();
        token.cancel();
        auto result = s->coordinator().save_inspiration(
            create_inspiration("x", "设计", s.clock->now()), token);
        REQUIRE(result.is_err());
        REQUIRE(snapshots.size() == 1);
    }

    SECTION("Stop unsubscribes and start restarts") {
        query->start();
        query->stop();
        REQUIRE_FALSE(query->is_active());
        s.add_note("a", "设计");
        REQUIRE(snapshots.size() == 1);

        query->start();
        REQUIRE(snapshots.size() == 2);
        REQUIRE(snapshots.back().size() == 1);
    }

    SECTION("A rename re-emits the theme list") {
        s.add_note("a", "设计");
        std::vector<std::vector<Theme>> theme_snapshots;
        auto themes = s->observe_themes(ThemeOrder::Name, [&](const std::vector<Theme>& rows) {
            theme_snapshots.push_back(rows);
        });
        themes->start();
        REQUIRE(s->coordinator().rename_theme("设计", "视觉").is_ok());
        REQUIRE(theme_snapshots.size() == 2);
        bool renamed = false;
        for (const auto& t : theme_snapshots.back()) {
            if (t.name == "视觉") renamed = true;
        }
        REQUIRE(renamed);
    }
}

TEST_CASE("LiveQuery reports fetch failures", "[live]") {
    TestStore s;
    int errors = 0;
    int values = 0;
    LiveQuery<int> query(
        s->notifier(), Table::Themes,
        []() { return Result<int, Error>::err(Error{"fetch failed"}); },
        [&](const int&) { ++values; },
        [&](const Error& e) {
            REQUIRE(e.message == "fetch failed");
            ++errors;
        });

    query.start();
    s.add_theme("设计");
    REQUIRE(errors == 2);
    REQUIRE(values == 0);
}

TEST_CASE("LiveQuery over all notes and over a keyword", "[live]") {
    TestStore s;
    s.add_theme("设计");
    s.add_theme("开发");

    std::vector<size_t> all_sizes;
    auto all = s->observe_inspirations([&](const std::vector<Inspiration>& rows) {
        all_sizes.push_back(rows.size());
    });
    std::vector<std::vector<Inspiration>> matches;
    auto search = s->observe_search("设", [&](const std::vector<Inspiration>& rows) {
        matches.push_back(rows);
    });
    all->start();
    search->start();

    s.add_note("plain", "开发");
    REQUIRE(all_sizes == std::vector<size_t>{0, 1});
    REQUIRE(matches.size() == 2);
    REQUIRE(matches.back().empty());

    // The keyword matches the theme label, so a rename changes the result set.
    s.add_note("layout", "设计");
    REQUIRE(matches.back().size() == 1);
    REQUIRE(s->coordinator().rename_theme("设计", "视觉").is_ok());
    REQUIRE(matches.back().empty());
    REQUIRE(all_sizes.back() == 2);
}
