#include "cli/commands.hpp"

#include "cli/format.hpp"
#include "storage/store.hpp"

namespace sparkle::cli {

namespace {

[[nodiscard]] std::string to_std(const QString& s) {
    return s.trimmed().toStdString();
}

[[nodiscard]] std::optional<std::string> optional_arg(const QString& s) {
    const auto trimmed = s.trimmed();
    if (trimmed.isEmpty()) return std::nullopt;
    return trimmed.toStdString();
}

[[nodiscard]] Result<CommandOutput> output(QString text, int exit_code = EXIT_OK) {
    return Result<CommandOutput>::ok(CommandOutput{std::move(text), exit_code});
}

} // namespace

Result<CommandOutput> run_themes(storage::Store& store, const ThemesOptions& options) {
    auto themes = store.themes().list(options.order);
    if (themes.is_err()) {
        return Result<CommandOutput>::err(themes.unwrap_err());
    }
    return output(options.json ? format_themes_json(themes.unwrap())
                               : format_themes(themes.unwrap()));
}

Result<CommandOutput> run_add(storage::Store& store, const AddOptions& options) {
    const auto theme = options.theme.trimmed().isEmpty()
        ? store.config().default_theme_name
        : to_std(options.theme);

    auto note = create_inspiration(options.text.toStdString(), theme, store.clock().now());
    auto id = store.coordinator().save_inspiration(note);
    if (id.is_err()) {
        return Result<CommandOutput>::err(id.unwrap_err());
    }
    return output(QStringLiteral("Added #%1 to %2\n")
                      .arg(id.unwrap())
                      .arg(QString::fromStdString(theme)));
}

Result<CommandOutput> run_create_theme(storage::Store& store, const CreateThemeOptions& options) {
    auto theme = create_theme(to_std(options.name), store.clock().now());
    if (!options.icon.trimmed().isEmpty()) {
        theme = with_icon(std::move(theme), to_std(options.icon));
    }
    if (!options.color.trimmed().isEmpty()) {
        const auto color = parse_color(options.color);
        if (!color) {
            return Result<CommandOutput>::err(
                Error{("Invalid color: " + options.color).toStdString()});
        }
        theme = with_color(std::move(theme), *color);
    }
    if (!options.description.isEmpty()) {
        theme = with_description(std::move(theme), options.description.toStdString());
    }

    auto created = store.coordinator().create_theme(theme);
    if (created.is_err()) {
        return Result<CommandOutput>::err(created.unwrap_err());
    }
    return output(QStringLiteral("Created theme %1\n").arg(QString::fromStdString(theme.name)));
}

Result<CommandOutput> run_rename_theme(storage::Store& store, const RenameThemeOptions& options) {
    const auto old_name = to_std(options.oldName);
    const auto new_name = to_std(options.newName);

    auto renamed = store.coordinator().rename_theme(old_name, new_name);
    if (renamed.is_err()) {
        return Result<CommandOutput>::err(renamed.unwrap_err());
    }
    return output(QStringLiteral("Renamed %1 to %2\n")
                      .arg(QString::fromStdString(old_name), QString::fromStdString(new_name)));
}

Result<CommandOutput> run_delete_theme(storage::Store& store, const DeleteThemeOptions& options) {
    const auto name = to_std(options.name);
    const auto move_to = optional_arg(options.moveTo);

    auto deleted = store.coordinator().delete_theme(name, move_to);
    if (deleted.is_err()) {
        return Result<CommandOutput>::err(deleted.unwrap_err());
    }
    return output(QStringLiteral("Deleted %1, inspirations moved to %2\n")
                      .arg(QString::fromStdString(name),
                           QString::fromStdString(
                               move_to.value_or(store.config().default_theme_name))));
}

Result<CommandOutput> run_list(storage::Store& store, const ListOptions& options) {
    const auto theme = optional_arg(options.theme);
    const auto keyword = optional_arg(options.search);

    auto rows = theme ? store.inspirations().get_by_theme(*theme)
              : keyword ? store.inspirations().search(*keyword)
              : store.inspirations().get_all();
    if (rows.is_err()) {
        return Result<CommandOutput>::err(rows.unwrap_err());
    }

    auto notes = std::move(rows).unwrap();
    // --theme and --search together narrow the theme's notes by keyword.
    if (theme && keyword) {
        auto matches = store.inspirations().search(*keyword);
        if (matches.is_err()) {
            return Result<CommandOutput>::err(matches.unwrap_err());
        }
        std::vector<Inspiration> narrowed;
        for (const auto& note : matches.unwrap()) {
            if (note.theme_name == *theme) narrowed.push_back(note);
        }
        notes = std::move(narrowed);
    }

    return output(options.json ? format_inspirations_json(notes) : format_inspirations(notes));
}

Result<CommandOutput> run_check(storage::Store& store, const CheckOptions& options) {
    auto report = store.validator().check();
    if (report.is_err()) {
        return Result<CommandOutput>::err(report.unwrap_err());
    }

    const auto& r = report.unwrap();
    auto text = options.json ? format_report_json(r)
                             : QString::fromStdString(storage::format_report(r));
    return output(std::move(text), r.is_valid() ? EXIT_OK : EXIT_INVALID_DATA);
}

Result<CommandOutput> run_repair(storage::Store& store, const RepairOptions& options) {
    auto moved = store.coordinator().repair_orphans(optional_arg(options.moveTo));
    if (moved.is_err()) {
        return Result<CommandOutput>::err(moved.unwrap_err());
    }
    auto corrected = store.coordinator().refresh_all_counts();
    if (corrected.is_err()) {
        return Result<CommandOutput>::err(corrected.unwrap_err());
    }
    return output(QStringLiteral("Reassigned %1 orphaned inspirations, corrected %2 theme counts\n")
                      .arg(moved.unwrap())
                      .arg(corrected.unwrap()));
}

} // namespace sparkle::cli
