#include "storage/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

Q_LOGGING_CATEGORY(sparkleStorageLog, "sparkle.storage")
Q_LOGGING_CATEGORY(sparkleMigrationLog, "sparkle.migration")
Q_LOGGING_CATEGORY(sparkleIntegrityLog, "sparkle.integrity")
Q_LOGGING_CATEGORY(sparkleValidatorLog, "sparkle.validator")

namespace sparkle {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QtMessageHandler previous = nullptr;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
            const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString{};
            const auto line = QStringLiteral("%1 %2 %3 %4\n")
                                  .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);
            s.file.write(line.toUtf8());
            s.file.flush();
        }
    }

    // Keep stderr output for interactive use.
    if (s.previous) {
        s.previous(type, ctx, msg);
    }
}

} // namespace

void install_file_logging(const QString& path) {
    auto& s = state();
    const auto target = path.isEmpty() ? default_log_file_path() : path;
    if (target.isEmpty()) {
        return;
    }

    {
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }
        QDir dir(QFileInfo(target).absolutePath());
        dir.mkpath(QStringLiteral("."));
        s.file.setFileName(target);
        if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return;
        }
    }

    QtMessageHandler previous = qInstallMessageHandler(message_handler);
    if (previous != message_handler) {
        s.previous = previous;
    }
}

QString default_log_file_path() {
    const auto env = qEnvironmentVariable("SPARKLE_LOG_FILE");
    if (!env.isEmpty()) {
        return env;
    }
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/sparkle.log"));
}

} // namespace sparkle
