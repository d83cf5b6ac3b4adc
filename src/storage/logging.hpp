#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(sparkleStorageLog)
Q_DECLARE_LOGGING_CATEGORY(sparkleMigrationLog)
Q_DECLARE_LOGGING_CATEGORY(sparkleIntegrityLog)
Q_DECLARE_LOGGING_CATEGORY(sparkleValidatorLog)

namespace sparkle {

// Installs a Qt message handler that appends every message to a log file as
// "<utc timestamp> <level> <category> <message>". An empty path selects
// default_log_file_path().
void install_file_logging(const QString& path = QString{});

// SPARKLE_LOG_FILE if set, otherwise logs/sparkle.log under the app-local
// data location. May be empty if neither is available.
QString default_log_file_path();

} // namespace sparkle
