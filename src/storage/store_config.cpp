#include "storage/store_config.hpp"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QtGlobal>

namespace sparkle::storage {

namespace {

QString resolve_database_path() {
    const auto override_path = qEnvironmentVariable("SPARKLE_DB_PATH");
    if (override_path == QLatin1String(MEMORY_DATABASE)) {
        return override_path;
    }
    if (!override_path.isEmpty()) {
        QFileInfo info(override_path);
        QDir dir(info.absolutePath());
        if (!dir.exists()) {
            dir.mkpath(".");
        }
        return info.absoluteFilePath();
    }

    QString data_path = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (data_path.isEmpty()) {
        return QStringLiteral("sparkle.db");
    }
    QDir dir(data_path);
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    return data_path + "/sparkle.db";
}

} // namespace

StoreConfig StoreConfig::from_environment() {
    StoreConfig config;
    config.path = resolve_database_path().toStdString();

    const auto theme = qEnvironmentVariable("SPARKLE_DEFAULT_THEME");
    if (!theme.isEmpty()) {
        config.default_theme_name = theme.toStdString();
    }
    return config;
}

} // namespace sparkle::storage
