#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>

#include "cli/commands.hpp"
#include "cli/format.hpp"
#include "storage/logging.hpp"
#include "storage/store.hpp"

namespace {

int fail(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return sparkle::cli::EXIT_FAILURE_STATUS;
}

int finish(const sparkle::Result<sparkle::cli::CommandOutput>& result) {
    if (result.is_err()) {
        const auto& error = result.unwrap_err();
        return fail(QStringLiteral("%1: %2").arg(
            QString::fromLatin1(sparkle::to_string(error.kind).data()),
            QString::fromStdString(error.message)));
    }
    QTextStream(stdout) << result.unwrap().text;
    return result.unwrap().exit_code;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("Sparkle");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Sparkle");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Sparkle note store"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets SPARKLE_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption orderOption(
        QStringList{QStringLiteral("order")},
        QStringLiteral("Theme order for 'themes': name, recent or count."),
        QStringLiteral("order"),
        QStringLiteral("name"));
    parser.addOption(orderOption);

    const QCommandLineOption themeOption(
        QStringList{QStringLiteral("theme")},
        QStringLiteral("Theme for 'add' and 'list'."),
        QStringLiteral("name"));
    parser.addOption(themeOption);

    const QCommandLineOption searchOption(
        QStringList{QStringLiteral("search")},
        QStringLiteral("Keyword for 'list'."),
        QStringLiteral("keyword"));
    parser.addOption(searchOption);

    const QCommandLineOption moveToOption(
        QStringList{QStringLiteral("move-to")},
        QStringLiteral("Target theme for 'delete-theme' and 'repair' (default theme if omitted)."),
        QStringLiteral("name"));
    parser.addOption(moveToOption);

    const QCommandLineOption iconOption(
        QStringList{QStringLiteral("icon")},
        QStringLiteral("Icon for 'create-theme'."),
        QStringLiteral("icon"));
    parser.addOption(iconOption);

    const QCommandLineOption colorOption(
        QStringList{QStringLiteral("color")},
        QStringLiteral("ARGB color for 'create-theme', e.g. 0xFF4A90E2."),
        QStringLiteral("color"));
    parser.addOption(colorOption);

    const QCommandLineOption descriptionOption(
        QStringList{QStringLiteral("description")},
        QStringLiteral("Description for 'create-theme'."),
        QStringLiteral("text"));
    parser.addOption(descriptionOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Append log output to this file (sets SPARKLE_LOG_FILE for this run)."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("themes, add, create-theme, rename-theme, delete-theme, list, check or repair."));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("SPARKLE_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(logFileOption)) {
        qputenv("SPARKLE_LOG_FILE", parser.value(logFileOption).toUtf8());
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(sparkle::cli::EXIT_FAILURE_STATUS);
    }
    const auto command = positional.first();
    const auto args = positional.mid(1);
    const bool json = parser.isSet(jsonOption);

    sparkle::install_file_logging();

    auto opened = sparkle::storage::Store::open(sparkle::storage::StoreConfig::from_environment());
    if (opened.is_err()) {
        return fail(QStringLiteral("Cannot open store: %1")
                        .arg(QString::fromStdString(opened.unwrap_err().message)));
    }
    auto& store = *opened.unwrap();

    if (command == QStringLiteral("themes")) {
        const auto order = sparkle::cli::parse_theme_order(parser.value(orderOption));
        if (!order) {
            return fail(QStringLiteral("Unknown order: ") + parser.value(orderOption));
        }
        return finish(sparkle::cli::run_themes(store, {.order = *order, .json = json}));
    }

    if (command == QStringLiteral("add")) {
        if (args.isEmpty()) {
            return fail(QStringLiteral("Usage: sparkle add [--theme NAME] TEXT..."));
        }
        return finish(sparkle::cli::run_add(store, {
            .theme = parser.value(themeOption),
            .text = args.join(QLatin1Char(' '))
        }));
    }

    if (command == QStringLiteral("create-theme")) {
        if (args.size() != 1) {
            return fail(QStringLiteral("Usage: sparkle create-theme NAME [--icon I] [--color C] [--description D]"));
        }
        return finish(sparkle::cli::run_create_theme(store, {
            .name = args.first(),
            .icon = parser.value(iconOption),
            .color = parser.value(colorOption),
            .description = parser.value(descriptionOption)
        }));
    }

    if (command == QStringLiteral("rename-theme")) {
        if (args.size() != 2) {
            return fail(QStringLiteral("Usage: sparkle rename-theme OLD NEW"));
        }
        return finish(sparkle::cli::run_rename_theme(store, {
            .oldName = args.at(0),
            .newName = args.at(1)
        }));
    }

    if (command == QStringLiteral("delete-theme")) {
        if (args.size() != 1) {
            return fail(QStringLiteral("Usage: sparkle delete-theme NAME [--move-to TARGET]"));
        }
        return finish(sparkle::cli::run_delete_theme(store, {
            .name = args.first(),
            .moveTo = parser.value(moveToOption)
        }));
    }

    if (command == QStringLiteral("list")) {
        return finish(sparkle::cli::run_list(store, {
            .theme = parser.value(themeOption),
            .search = parser.value(searchOption),
            .json = json
        }));
    }

    if (command == QStringLiteral("check")) {
        return finish(sparkle::cli::run_check(store, {.json = json}));
    }

    if (command == QStringLiteral("repair")) {
        return finish(sparkle::cli::run_repair(store, {.moveTo = parser.value(moveToOption)}));
    }

    return fail(QStringLiteral("Unknown command: ") + command);
}
