#include "storage/theme_repository.hpp"

namespace sparkle::storage {

namespace {

constexpr const char* kSelectColumns = R"SQL(
    SELECT name, icon, color, description, createdAt, lastUsed, inspirationCount
    FROM themes )SQL";

Error not_found(const std::string& name) {
    return Error{ErrorKind::NotFound, "Theme not found: " + name};
}

} // namespace

Theme ThemeRepository::row_to_theme(Statement& stmt) {
    return Theme{
        .name = stmt.column_text(0),
        .icon = stmt.column_text(1),
        .color = static_cast<uint32_t>(stmt.column_int64(2)),
        .description = stmt.column_text(3),
        .created_at = Timestamp(stmt.column_int64(4)),
        .last_used = Timestamp(stmt.column_int64(5)),
        .inspiration_count = stmt.column_int(6)
    };
}

Result<void, Error> ThemeRepository::check_name(const std::string& name) {
    auto validation = validate_theme_name(name);
    switch (validation) {
        case NameValidation::Valid:
            return Result<void, Error>::ok();
        case NameValidation::Empty:
            return Result<void, Error>::err(
                Error{ErrorKind::InvalidName, "Theme name cannot be empty", validation});
        case NameValidation::TooLong:
            return Result<void, Error>::err(
                Error{ErrorKind::InvalidName,
                      "Theme name is longer than " + std::to_string(MAX_THEME_NAME_LENGTH) +
                      " characters", validation});
        case NameValidation::Invalid:
            break;
    }
    return Result<void, Error>::err(
        Error{ErrorKind::InvalidName, "Theme name contains a reserved marker", validation});
}

Result<void, Error> ThemeRepository::create(const Theme& theme) {
    auto valid = check_name(theme.name);
    if (valid.is_err()) return valid;

    auto guard = db_.lock();
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO themes (name, icon, color, description, createdAt, lastUsed, inspirationCount)
        VALUES (?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, theme.name);
    stmt.bind_text(2, theme.icon);
    stmt.bind_int64(3, static_cast<int64_t>(theme.color));
    stmt.bind_text(4, theme.description);
    stmt.bind_int64(5, theme.created_at.millis());
    stmt.bind_int64(6, theme.last_used.millis());
    stmt.bind_int(7, theme.inspiration_count < 0 ? 0 : theme.inspiration_count);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        auto error = step_result.unwrap_err();
        if (error.is(ErrorKind::DuplicateKey)) {
            error.message = "Theme already exists: " + theme.name;
        }
        return Result<void, Error>::err(std::move(error));
    }

    db_.touch(Table::Themes);
    return Result<void, Error>::ok();
}

Result<void, Error> ThemeRepository::ensure(const Theme& theme) {
    auto guard = db_.lock();
    auto present = exists(theme.name);
    if (present.is_err()) {
        return Result<void, Error>::err(present.unwrap_err());
    }
    if (present.unwrap()) {
        return Result<void, Error>::ok();
    }
    return create(theme);
}

Result<std::optional<Theme>, Error> ThemeRepository::get(const std::string& name) {
    auto guard = db_.lock();
    auto stmt_result = db_.prepare(std::string(kSelectColumns) + "WHERE name = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Theme>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, name);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Theme>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Theme>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Theme>, Error>::ok(row_to_theme(stmt));
}

Result<std::vector<Theme>, Error> ThemeRepository::list(ThemeOrder order) {
    std::string sql = kSelectColumns;
    switch (order) {
        case ThemeOrder::Name:
            sql += "ORDER BY name ASC;";
            break;
        case ThemeOrder::LastUsed:
            sql += "ORDER BY lastUsed DESC, name ASC;";
            break;
        case ThemeOrder::InspirationCount:
            sql += "ORDER BY inspirationCount DESC, name ASC;";
            break;
    }

    std::vector<Theme> themes;
    auto result = db_.query(sql, [&](Statement& stmt) {
        themes.push_back(row_to_theme(stmt));
    });
    if (result.is_err()) {
        return Result<std::vector<Theme>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<Theme>, Error>::ok(std::move(themes));
}

Result<void, Error> ThemeRepository::rename(const std::string& old_name,
                                            const std::string& new_name) {
    auto valid = check_name(new_name);
    if (valid.is_err()) return valid;

    auto guard = db_.lock();
    auto stmt_result = db_.prepare("UPDATE themes SET name = ? WHERE name = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, new_name);
    stmt.bind_text(2, old_name);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        auto error = step_result.unwrap_err();
        if (error.is(ErrorKind::DuplicateKey)) {
            error.message = "Theme already exists: " + new_name;
        }
        return Result<void, Error>::err(std::move(error));
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(not_found(old_name));
    }

    // ON UPDATE CASCADE relabels the notes in the same statement.
    db_.touch(Table::Themes | Table::Inspirations);
    return Result<void, Error>::ok();
}

Result<void, Error> ThemeRepository::remove(const std::string& name) {
    if (name == default_theme_) {
        return Result<void, Error>::err(
            Error{ErrorKind::ProtectedTheme, "The default theme cannot be deleted"});
    }

    auto guard = db_.lock();
    auto stmt_result = db_.prepare("DELETE FROM themes WHERE name = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, name);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(not_found(name));
    }

    // The physical cascade may have removed notes as well.
    db_.touch(Table::Themes | Table::Inspirations);
    return Result<void, Error>::ok();
}

Result<void, Error> ThemeRepository::update_metadata(const std::string& name,
                                                     const std::string& icon,
                                                     uint32_t color,
                                                     const std::string& description) {
    auto guard = db_.lock();
    auto stmt_result = db_.prepare(
        "UPDATE themes SET icon = ?, color = ?, description = ? WHERE name = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, icon);
    stmt.bind_int64(2, static_cast<int64_t>(color));
    stmt.bind_text(3, description);
    stmt.bind_text(4, name);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(not_found(name));
    }

    db_.touch(Table::Themes);
    return Result<void, Error>::ok();
}

Result<void, Error> ThemeRepository::update_one(const std::string& sql,
                                                const std::string& name,
                                                int64_t value) {
    auto guard = db_.lock();
    auto stmt_result = db_.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, value);
    stmt.bind_text(2, name);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(not_found(name));
    }

    db_.touch(Table::Themes);
    return Result<void, Error>::ok();
}

Result<void, Error> ThemeRepository::set_last_used(const std::string& name, Timestamp ts) {
    return update_one("UPDATE themes SET lastUsed = ? WHERE name = ?;", name, ts.millis());
}

Result<void, Error> ThemeRepository::set_inspiration_count(const std::string& name, int count) {
    if (count < 0) {
        return Result<void, Error>::err(Error{"Inspiration count cannot be negative"});
    }
    return update_one("UPDATE themes SET inspirationCount = ? WHERE name = ?;", name, count);
}

Result<int, Error> ThemeRepository::recount_all() {
    auto guard = db_.lock();
    auto result = db_.execute(R"SQL(
        UPDATE themes SET inspirationCount = (
            SELECT COUNT(*) FROM inspirations WHERE inspirations.theme_name = themes.name
        )
        WHERE inspirationCount != (
            SELECT COUNT(*) FROM inspirations WHERE inspirations.theme_name = themes.name
        );
    )SQL");
    if (result.is_err()) {
        return Result<int, Error>::err(result.unwrap_err());
    }

    int corrected = db_.changes();
    if (corrected > 0) {
        db_.touch(Table::Themes);
    }
    return Result<int, Error>::ok(corrected);
}

Result<bool, Error> ThemeRepository::exists(const std::string& name) {
    auto guard = db_.lock();
    auto stmt_result = db_.prepare("SELECT EXISTS(SELECT 1 FROM themes WHERE name = ?);");
    if (stmt_result.is_err()) {
        return Result<bool, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, name);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<bool, Error>::err(step_result.unwrap_err());
    }
    return Result<bool, Error>::ok(stmt.column_int(0) != 0);
}

Result<int64_t, Error> ThemeRepository::count() {
    int64_t total = 0;
    auto result = db_.query("SELECT COUNT(*) FROM themes;", [&](Statement& stmt) {
        total = stmt.column_int64(0);
    });
    if (result.is_err()) {
        return Result<int64_t, Error>::err(result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(total);
}

} // namespace sparkle::storage
