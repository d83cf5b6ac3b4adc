#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "storage/store.hpp"
#include "../support/fixtures.hpp"

#include <QDir>
#include <QTemporaryDir>

using namespace sparkle;
using namespace sparkle::storage;
using Catch::Matchers::ContainsSubstring;
using sparkle::test::TestStore;

TEST_CASE("A consistent store validates cleanly", "[validator]") {
    TestStore s;
    s.add_theme("设计");
    s.add_note("a", "设计");
    s->coordinator().record_usage(s->coordinator().default_theme());

    auto report = s->validator().check().unwrap();
    REQUIRE(report.is_valid());
    REQUIRE(report.total_themes == 2);
    REQUIRE(report.total_inspirations == 1);
    REQUIRE(report.orphaned_inspirations == 0);
    // The empty default theme is informational only.
    REQUIRE(report.warnings.size() == 1);
    REQUIRE_THAT(report.warnings[0], ContainsSubstring("has no inspirations"));
}

TEST_CASE("Orphans are reported with a preview", "[validator]") {
    TestStore s;
    s.add_theme("设计");
    s.add_note("a", "设计");
    const std::string long_content(40, 'x');
    sparkle::test::plant_orphan(s->database(), long_content, "ghost");

    auto report = s->validator().check().unwrap();
    REQUIRE_FALSE(report.is_valid());
    REQUIRE(report.orphaned_inspirations == 1);
    REQUIRE(report.issues.size() == 1);
    REQUIRE_THAT(report.issues[0], ContainsSubstring("1 orphaned"));

    bool found = false;
    for (const auto& w : report.warnings) {
        if (w.find("ghost") != std::string::npos) {
            found = true;
            REQUIRE_THAT(w, ContainsSubstring(std::string(30, 'x') + "..."));
            REQUIRE_THAT(w, !ContainsSubstring(std::string(31, 'x')));
        }
    }
    REQUIRE(found);
}

TEST_CASE("Blank content is an issue", "[validator]") {
    TestStore s;
    auto stmt = s->database().prepare(
        "INSERT INTO inspirations (content, theme_name, created_at, word_count) "
        "VALUES ('   ', ?, 0, 0);").unwrap();
    stmt.bind_text(1, s->coordinator().default_theme());
    REQUIRE(stmt.step().is_ok());

    auto report = s->validator().check().unwrap();
    REQUIRE_FALSE(report.is_valid());
    REQUIRE_THAT(report.issues[0], ContainsSubstring("empty content"));
}

TEST_CASE("Stale cached counts are warnings", "[validator]") {
    TestStore s;
    s.add_theme("设计");
    s.add_note("a", "设计");
    REQUIRE(s->themes().set_inspiration_count("设计", 4).is_ok());

    auto report = s->validator().check().unwrap();
    REQUIRE(report.is_valid());
    bool stale = false;
    for (const auto& w : report.warnings) {
        if (w.find("caches 4 inspirations but has 1") != std::string::npos) stale = true;
    }
    REQUIRE(stale);
}

TEST_CASE("Validation never modifies data", "[validator]") {
    TestStore s;
    sparkle::test::plant_orphan(s->database(), "lost", "ghost");

    REQUIRE(s->validator().check().is_ok());
    REQUIRE(s->inspirations().find_orphans().unwrap().size() == 1);
    REQUIRE(s->themes().count().unwrap() == 1);
}

TEST_CASE("Report formatting", "[validator]") {
    ValidationReport report;
    report.total_themes = 3;
    report.total_inspirations = 10;

    SECTION("A clean report says so") {
        auto text = format_report(report);
        REQUIRE_THAT(text, ContainsSubstring("Themes: 3"));
        REQUIRE_THAT(text, ContainsSubstring("Status: valid"));
        REQUIRE_THAT(text, ContainsSubstring("All checks passed."));
    }

    SECTION("Warnings beyond the limit are summarised") {
        report.issues.push_back("Found 1 orphaned inspirations (theme does not exist)");
        for (int i = 0; i < 7; ++i) {
            report.warnings.push_back("warning " + std::to_string(i));
        }

        auto text = format_report(report);
        REQUIRE_THAT(text, ContainsSubstring("Status: problems found"));
        REQUIRE_THAT(text, ContainsSubstring("warning 4"));
        REQUIRE_THAT(text, !ContainsSubstring("warning 5"));
        REQUIRE_THAT(text, ContainsSubstring("... 2 more warnings"));
        REQUIRE_THAT(text, !ContainsSubstring("All checks passed."));
    }
}

TEST_CASE("The audit only reads", "[validator]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    StoreConfig config;
    config.path = QDir(dir.path()).filePath(QStringLiteral("sparkle.db")).toStdString();
    config.busy_timeout_ms = 200;

    auto store = Store::open(config, std::make_shared<ManualClock>()).unwrap();
    REQUIRE(store->coordinator().create_theme(create_theme("设计", store->clock().now())).is_ok());

    // A second connection holds the database write lock.
    auto writer = Database::open(config.path, Database::OpenOptions{.busy_timeout_ms = 200}).unwrap();
    REQUIRE(writer.execute("BEGIN IMMEDIATE;").is_ok());

    auto report = store->validator().check();
    REQUIRE(report.is_ok());
    REQUIRE(report.unwrap().total_themes == 2);

    REQUIRE(writer.execute("ROLLBACK;").is_ok());
}
