#pragma once

#include <catch2/catch_test_macros.hpp>
#include "storage/store.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sparkle::test {

struct TestStore {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::unique_ptr<storage::Store> store;

    TestStore() {
        auto opened = storage::Store::open_memory(clock);
        REQUIRE(opened.is_ok());
        store = std::move(opened).unwrap();
    }

    storage::Store* operator->() { return store.get(); }

    void add_theme(const std::string& name) {
        REQUIRE(store->coordinator().create_theme(create_theme(name, clock->now())).is_ok());
    }

    int64_t add_note(const std::string& content, const std::string& theme) {
        auto id = store->coordinator().save_inspiration(
            create_inspiration(content, theme, clock->now()));
        REQUIRE(id.is_ok());
        clock->advance(std::chrono::milliseconds(1));
        return id.unwrap();
    }
};

// A row of the flat schema written by the legacy app: (content, theme_name).
using LegacyRow = std::pair<std::string, std::string>;

inline void write_legacy_rows(storage::Database& db, const std::vector<LegacyRow>& rows) {
    REQUIRE(db.execute(R"SQL(
        CREATE TABLE inspirations (
            id INTEGER PRIMARY KEY AUTOINCREMENT NOT NULL,
            content TEXT NOT NULL,
            theme_name TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            word_count INTEGER NOT NULL
        );
        PRAGMA user_version = 1;
    )SQL").is_ok());

    int64_t created = 1'600'000'000'000;
    for (const auto& [content, theme] : rows) {
        auto stmt = db.prepare(
            "INSERT INTO inspirations (content, theme_name, created_at, word_count) "
            "VALUES (?, ?, ?, 1);").unwrap();
        stmt.bind_text(1, content);
        stmt.bind_text(2, theme);
        stmt.bind_int64(3, created++);
        REQUIRE(stmt.step().is_ok());
    }
}

// Bypass the foreign key to plant a note whose theme does not exist.
inline void plant_orphan(storage::Database& db, const std::string& content, const std::string& theme) {
    REQUIRE(db.execute("PRAGMA foreign_keys = OFF;").is_ok());
    auto stmt = db.prepare(
        "INSERT INTO inspirations (content, theme_name, created_at, word_count) "
        "VALUES (?, ?, 0, 1);").unwrap();
    stmt.bind_text(1, content);
    stmt.bind_text(2, theme);
    REQUIRE(stmt.step().is_ok());
    REQUIRE(db.execute("PRAGMA foreign_keys = ON;").is_ok());
}

inline int scalar(storage::Database& db, const std::string& sql) {
    int value = -1;
    REQUIRE(db.query(sql, [&](storage::Statement& stmt) { value = stmt.column_int(0); }).is_ok());
    return value;
}

} // namespace sparkle::test
