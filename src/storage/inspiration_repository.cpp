#include "storage/inspiration_repository.hpp"

namespace sparkle::storage {

namespace {

constexpr const char* kSelectColumns = R"SQL(
    SELECT id, content, theme_name, created_at, word_count
    FROM inspirations )SQL";

Result<void, Error> check_content(const std::string& content) {
    switch (validate_content(content)) {
        case NameValidation::Valid:
        case NameValidation::Invalid:
            return Result<void, Error>::ok();
        case NameValidation::Empty:
            return Result<void, Error>::err(
                Error{ErrorKind::InvalidContent, "Inspiration content cannot be empty"});
        case NameValidation::TooLong:
            break;
    }
    return Result<void, Error>::err(
        Error{ErrorKind::InvalidContent,
              "Inspiration content is longer than " + std::to_string(MAX_CONTENT_LENGTH) +
              " characters"});
}

// Escape LIKE wildcards so the keyword matches literally.
std::string like_pattern(const std::string& keyword) {
    std::string pattern = "%";
    for (char c : keyword) {
        if (c == '%' || c == '_' || c == '\\') {
            pattern += '\\';
        }
        pattern += c;
    }
    pattern += '%';
    return pattern;
}

} // namespace

Inspiration InspirationRepository::row_to_inspiration(Statement& stmt) {
    return Inspiration{
        .id = stmt.column_int64(0),
        .content = stmt.column_text(1),
        .theme_name = stmt.column_text(2),
        .created_at = Timestamp(stmt.column_int64(3)),
        .word_count = stmt.column_int(4)
    };
}

Result<std::vector<Inspiration>, Error> InspirationRepository::select_many(
    const std::string& where_and_order,
    const std::vector<std::string>& params) {
    auto guard = db_.lock();
    auto stmt_result = db_.prepare(std::string(kSelectColumns) + where_and_order);
    if (stmt_result.is_err()) {
        return Result<std::vector<Inspiration>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    for (size_t i = 0; i < params.size(); ++i) {
        stmt.bind_text(static_cast<int>(i) + 1, params[i]);
    }

    std::vector<Inspiration> rows;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<Inspiration>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        rows.push_back(row_to_inspiration(stmt));
    }
    return Result<std::vector<Inspiration>, Error>::ok(std::move(rows));
}

Result<int64_t, Error> InspirationRepository::insert(const Inspiration& inspiration) {
    auto valid = check_content(inspiration.content);
    if (valid.is_err()) {
        return Result<int64_t, Error>::err(valid.unwrap_err());
    }

    auto guard = db_.lock();
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO inspirations (content, theme_name, created_at, word_count)
        VALUES (?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<int64_t, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, inspiration.content);
    stmt.bind_text(2, inspiration.theme_name);
    stmt.bind_int64(3, inspiration.created_at.millis());
    stmt.bind_int(4, inspiration.word_count);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        auto error = step_result.unwrap_err();
        if (error.is(ErrorKind::NotFound)) {
            error.message = "Theme not found: " + inspiration.theme_name;
        }
        return Result<int64_t, Error>::err(std::move(error));
    }

    db_.touch(Table::Inspirations);
    return Result<int64_t, Error>::ok(db_.last_insert_rowid());
}

Result<std::optional<Inspiration>, Error> InspirationRepository::get_by_id(int64_t id) {
    auto guard = db_.lock();
    auto stmt_result = db_.prepare(std::string(kSelectColumns) + "WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Inspiration>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Inspiration>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Inspiration>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Inspiration>, Error>::ok(row_to_inspiration(stmt));
}

Result<std::vector<Inspiration>, Error> InspirationRepository::get_all() {
    return select_many("ORDER BY created_at DESC, id DESC;", {});
}

Result<std::vector<Inspiration>, Error> InspirationRepository::get_by_theme(
    const std::string& theme_name) {
    return select_many("WHERE theme_name = ? ORDER BY created_at DESC, id DESC;", {theme_name});
}

Result<std::vector<Inspiration>, Error> InspirationRepository::search(const std::string& keyword) {
    auto pattern = like_pattern(keyword);
    return select_many(R"SQL(
        WHERE content LIKE ? ESCAPE '\' OR theme_name LIKE ? ESCAPE '\'
        ORDER BY created_at DESC, id DESC;
    )SQL", {pattern, pattern});
}

Result<int64_t, Error> InspirationRepository::count() {
    int64_t total = 0;
    auto result = db_.query("SELECT COUNT(*) FROM inspirations;", [&](Statement& stmt) {
        total = stmt.column_int64(0);
    });
    if (result.is_err()) {
        return Result<int64_t, Error>::err(result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(total);
}

Result<int, Error> InspirationRepository::count_by_theme(const std::string& theme_name) {
    auto guard = db_.lock();
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM inspirations WHERE theme_name = ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, theme_name);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(stmt.column_int(0));
}

Result<void, Error> InspirationRepository::update(const Inspiration& inspiration) {
    auto valid = check_content(inspiration.content);
    if (valid.is_err()) return valid;

    auto guard = db_.lock();
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE inspirations
        SET content = ?, theme_name = ?, created_at = ?, word_count = ?
        WHERE id = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, inspiration.content);
    stmt.bind_text(2, inspiration.theme_name);
    stmt.bind_int64(3, inspiration.created_at.millis());
    stmt.bind_int(4, inspiration.word_count);
    stmt.bind_int64(5, inspiration.id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        auto error = step_result.unwrap_err();
        if (error.is(ErrorKind::NotFound)) {
            error.message = "Theme not found: " + inspiration.theme_name;
        }
        return Result<void, Error>::err(std::move(error));
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(
            Error{ErrorKind::NotFound, "Inspiration not found: " + std::to_string(inspiration.id)});
    }

    db_.touch(Table::Inspirations);
    return Result<void, Error>::ok();
}

Result<int, Error> InspirationRepository::remove(int64_t id) {
    auto guard = db_.lock();
    auto stmt_result = db_.prepare("DELETE FROM inspirations WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_int64(1, id);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }

    int removed = db_.changes();
    if (removed > 0) {
        db_.touch(Table::Inspirations);
    }
    return Result<int, Error>::ok(removed);
}

Result<int, Error> InspirationRepository::remove_by_theme(const std::string& theme_name) {
    auto guard = db_.lock();
    auto stmt_result = db_.prepare("DELETE FROM inspirations WHERE theme_name = ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, theme_name);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }

    int removed = db_.changes();
    if (removed > 0) {
        db_.touch(Table::Inspirations);
    }
    return Result<int, Error>::ok(removed);
}

Result<int, Error> InspirationRepository::relabel(const std::string& from, const std::string& to) {
    auto guard = db_.lock();
    auto stmt_result = db_.prepare("UPDATE inspirations SET theme_name = ? WHERE theme_name = ?;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, to);
    stmt.bind_text(2, from);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        auto error = step_result.unwrap_err();
        if (error.is(ErrorKind::NotFound)) {
            error.message = "Theme not found: " + to;
        }
        return Result<int, Error>::err(std::move(error));
    }

    int moved = db_.changes();
    if (moved > 0) {
        db_.touch(Table::Inspirations);
    }
    return Result<int, Error>::ok(moved);
}

Result<int, Error> InspirationRepository::update_theme_name_for_all(const std::string& old_name,
                                                                    const std::string& new_name) {
    // After the catalog rename the FK cascade has usually relabelled the rows
    // already; this catches any the cascade did not reach.
    return relabel(old_name, new_name);
}

Result<int, Error> InspirationRepository::reassign_theme(const std::string& from,
                                                         const std::string& to) {
    return relabel(from, to);
}

Result<std::vector<std::string>, Error> InspirationRepository::distinct_theme_names() {
    std::vector<std::string> names;
    auto result = db_.query(
        "SELECT DISTINCT theme_name FROM inspirations ORDER BY theme_name ASC;",
        [&](Statement& stmt) { names.push_back(stmt.column_text(0)); });
    if (result.is_err()) {
        return Result<std::vector<std::string>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<std::string>, Error>::ok(std::move(names));
}

Result<std::vector<Inspiration>, Error> InspirationRepository::find_orphans() {
    return select_many(R"SQL(
        WHERE theme_name NOT IN (SELECT name FROM themes)
        ORDER BY id ASC;
    )SQL", {});
}

Result<int, Error> InspirationRepository::reassign_orphans(const std::string& to) {
    auto guard = db_.lock();
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE inspirations SET theme_name = ?
        WHERE theme_name NOT IN (SELECT name FROM themes);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    stmt.bind_text(1, to);

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        auto error = step_result.unwrap_err();
        if (error.is(ErrorKind::NotFound)) {
            error.message = "Theme not found: " + to;
        }
        return Result<int, Error>::err(std::move(error));
    }

    int moved = db_.changes();
    if (moved > 0) {
        db_.touch(Table::Inspirations);
    }
    return Result<int, Error>::ok(moved);
}

} // namespace sparkle::storage
