#include "cli/format.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace sparkle::cli {

namespace {

[[nodiscard]] QString qstr(const std::string& s) {
    return QString::fromStdString(s);
}

[[nodiscard]] QString join_lines(const QStringList& lines) {
    if (lines.isEmpty()) return QString{};
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

[[nodiscard]] QString single_line(const std::string& content) {
    auto text = qstr(content);
    text.replace(QLatin1Char('\r'), QLatin1Char(' '));
    text.replace(QLatin1Char('\n'), QLatin1Char(' '));
    return text;
}

[[nodiscard]] QJsonArray to_json_array(const std::vector<std::string>& items) {
    QJsonArray out;
    for (const auto& item : items) {
        out.append(qstr(item));
    }
    return out;
}

} // namespace

QString format_themes(const std::vector<Theme>& themes) {
    QStringList out;
    for (const auto& theme : themes) {
        out.append(QStringLiteral("%1 %2 (%3)")
                       .arg(qstr(theme.icon), qstr(theme.name))
                       .arg(theme.inspiration_count));
    }
    return join_lines(out);
}

QString format_themes_json(const std::vector<Theme>& themes) {
    QJsonArray array;
    for (const auto& theme : themes) {
        QJsonObject obj;
        obj.insert(QStringLiteral("name"), qstr(theme.name));
        obj.insert(QStringLiteral("icon"), qstr(theme.icon));
        obj.insert(QStringLiteral("color"), format_color(theme.color));
        obj.insert(QStringLiteral("description"), qstr(theme.description));
        obj.insert(QStringLiteral("createdAt"), static_cast<qint64>(theme.created_at.millis()));
        obj.insert(QStringLiteral("lastUsed"), static_cast<qint64>(theme.last_used.millis()));
        obj.insert(QStringLiteral("inspirationCount"), theme.inspiration_count);
        array.append(obj);
    }
    QJsonObject root;
    root.insert(QStringLiteral("themes"), array);
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QString format_inspirations(const std::vector<Inspiration>& inspirations) {
    QStringList out;
    for (const auto& inspiration : inspirations) {
        out.append(QStringLiteral("#%1 [%2] %3")
                       .arg(inspiration.id)
                       .arg(qstr(inspiration.theme_name), single_line(inspiration.content)));
    }
    return join_lines(out);
}

QString format_inspirations_json(const std::vector<Inspiration>& inspirations) {
    QJsonArray array;
    for (const auto& inspiration : inspirations) {
        QJsonObject obj;
        obj.insert(QStringLiteral("id"), static_cast<qint64>(inspiration.id));
        obj.insert(QStringLiteral("content"), qstr(inspiration.content));
        obj.insert(QStringLiteral("theme"), qstr(inspiration.theme_name));
        obj.insert(QStringLiteral("createdAt"),
                   static_cast<qint64>(inspiration.created_at.millis()));
        obj.insert(QStringLiteral("wordCount"), inspiration.word_count);
        array.append(obj);
    }
    QJsonObject root;
    root.insert(QStringLiteral("inspirations"), array);
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QString format_report_json(const storage::ValidationReport& report) {
    QJsonObject root;
    root.insert(QStringLiteral("valid"), report.is_valid());
    root.insert(QStringLiteral("totalThemes"), report.total_themes);
    root.insert(QStringLiteral("totalInspirations"), report.total_inspirations);
    root.insert(QStringLiteral("orphanedInspirations"), report.orphaned_inspirations);
    root.insert(QStringLiteral("issues"), to_json_array(report.issues));
    root.insert(QStringLiteral("warnings"), to_json_array(report.warnings));
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

QString format_color(uint32_t color) {
    return QStringLiteral("0x") +
           QString::number(color, 16).rightJustified(8, QLatin1Char('0')).toUpper();
}

std::optional<uint32_t> parse_color(const QString& text) {
    QString digits = text.trimmed();
    if (digits.startsWith(QStringLiteral("0x"), Qt::CaseInsensitive)) {
        digits = digits.mid(2);
    } else if (digits.startsWith(QLatin1Char('#'))) {
        digits = digits.mid(1);
    } else {
        return std::nullopt;
    }
    if (digits.size() != 6 && digits.size() != 8) {
        return std::nullopt;
    }

    bool ok = false;
    const uint value = digits.toUInt(&ok, 16);
    if (!ok) {
        return std::nullopt;
    }
    if (digits.size() == 6) {
        return 0xFF000000u | value;
    }
    return static_cast<uint32_t>(value);
}

std::optional<ThemeOrder> parse_theme_order(const QString& text) {
    if (text == QStringLiteral("name")) return ThemeOrder::Name;
    if (text == QStringLiteral("recent")) return ThemeOrder::LastUsed;
    if (text == QStringLiteral("count")) return ThemeOrder::InspirationCount;
    return std::nullopt;
}

} // namespace sparkle::cli
