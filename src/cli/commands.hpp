#pragma once

#include <QString>
#include <QStringList>

#include "core/result.hpp"
#include "core/theme.hpp"

namespace sparkle::storage {
class Store;
}

namespace sparkle::cli {

// Exit status of a command that ran to completion.
inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_FAILURE_STATUS = 1;
inline constexpr int EXIT_INVALID_DATA = 2;

struct CommandOutput {
    QString text;
    int exit_code = EXIT_OK;
};

struct ThemesOptions {
    ThemeOrder order = ThemeOrder::Name;
    bool json = false;
};

struct AddOptions {
    QString theme;
    QString text;
};

struct CreateThemeOptions {
    QString name;
    QString icon;          // optional
    QString color;         // optional, "0xAARRGGBB"
    QString description;   // optional
};

struct RenameThemeOptions {
    QString oldName;
    QString newName;
};

struct DeleteThemeOptions {
    QString name;
    QString moveTo;        // optional; default theme when empty
};

struct ListOptions {
    QString theme;         // optional
    QString search;        // optional
    bool json = false;
};

struct CheckOptions {
    bool json = false;
};

struct RepairOptions {
    QString moveTo;        // optional; default theme when empty
};

[[nodiscard]] Result<CommandOutput> run_themes(storage::Store& store, const ThemesOptions& options);
[[nodiscard]] Result<CommandOutput> run_add(storage::Store& store, const AddOptions& options);
[[nodiscard]] Result<CommandOutput> run_create_theme(storage::Store& store,
                                                     const CreateThemeOptions& options);
[[nodiscard]] Result<CommandOutput> run_rename_theme(storage::Store& store,
                                                     const RenameThemeOptions& options);
[[nodiscard]] Result<CommandOutput> run_delete_theme(storage::Store& store,
                                                     const DeleteThemeOptions& options);
[[nodiscard]] Result<CommandOutput> run_list(storage::Store& store, const ListOptions& options);

// Exit code EXIT_INVALID_DATA when the audit found issues.
[[nodiscard]] Result<CommandOutput> run_check(storage::Store& store, const CheckOptions& options);

// Reassigns orphans, then recomputes every cached count.
[[nodiscard]] Result<CommandOutput> run_repair(storage::Store& store, const RepairOptions& options);

} // namespace sparkle::cli
